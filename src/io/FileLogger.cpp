/* @file FileLogger.cpp
 * @brief buffered stdio writer
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// RollStart headers
#include "io/FileLogger.hpp"

using namespace rollstart::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_{ std::exchange(other.fp_, nullptr) }, buffer_{ std::move(other.buffer_) } {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr) {
    std::cerr << "[FileLogger] Error " << errno << " opening " << path << ": " << strerror(errno)
              << "\n";
    return false;
  }
  buffer_.reserve(kChunkSize);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return false;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunkSize)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkSize, buffer_.size() - total);
    const std::size_t written = std::fwrite(buffer_.data() + total, 1, chunk, fp_);
    if (written != chunk) {
      std::cerr << "[FileLogger] Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total + written));
      return false;
    }
    total += written;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  if (!flush())
    std::cerr << "[FileLogger] unflushed data dropped on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
}
