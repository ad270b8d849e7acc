/* @file LineChannel.cpp
 * @brief console line I/O - poll-driven reads, retrying writes, RAII over the fds
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// RollStart headers
#include "io/LineChannel.hpp"

using namespace rollstart::io;

LineChannel::LineChannel(int readFd, int writeFd, bool ownsFds)
    : readFd_{ readFd }, writeFd_{ writeFd }, ownsFds_{ ownsFds } {}

LineChannel::~LineChannel() { close(); }

LineChannel::LineChannel(LineChannel&& other) noexcept
    : readFd_{ std::exchange(other.readFd_, -1) }, writeFd_{ std::exchange(other.writeFd_, -1) },
      ownsFds_{ other.ownsFds_ }, eof_{ other.eof_ }, rx_buffer_{ std::move(other.rx_buffer_) } {}

LineChannel& LineChannel::operator=(LineChannel&& other) noexcept {
  if (this != &other) {
    close();
    readFd_ = std::exchange(other.readFd_, -1);
    writeFd_ = std::exchange(other.writeFd_, -1);
    ownsFds_ = other.ownsFds_;
    eof_ = other.eof_;
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool LineChannel::writeLine(const std::string& line) {

  if (writeFd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\n")) {
    out += "\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(writeFd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
      continue; // try again
    } else {
      std::cerr << "[LineChannel] Error " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

std::optional<std::string> LineChannel::takeLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

// -------------------------------------------------------------------
// LineChannel::readLine
// Returns the next complete line, std::nullopt on timeout or EOF.
// A final unterminated line is returned once the peer closes.
// -------------------------------------------------------------------
std::optional<std::string> LineChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeLine())
    return line;
  if (readFd_ < 0 || eof_)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ readFd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  do {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0 ? static_cast<int>(ms_left.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "[LineChannel] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(readFd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / peer closed
        eof_ = true;
        if (auto line = takeLine())
          return line;
        if (rx_buffer_.empty())
          return std::nullopt;
        std::string rest;
        rest.swap(rx_buffer_);
        return rest;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "[LineChannel] read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      eof_ = true;
      return std::nullopt;
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return std::nullopt; // timeout/partial
}

void LineChannel::close() {
  if (ownsFds_) {
    if (readFd_ >= 0)
      ::close(readFd_);
    if (writeFd_ >= 0 && writeFd_ != readFd_)
      ::close(writeFd_);
  }
  readFd_ = -1;
  writeFd_ = -1;
}
