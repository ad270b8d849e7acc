#pragma once
/** @file  LineChannel.hpp
 *  @brief Line-framed I/O over a pair of POSIX file descriptors (console stdin/stdout).
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace rollstart {
  namespace io {

    /**
 * @class LineChannel
 * @brief Reads '\n'-terminated commands with a poll() timeout and writes replies.
 *
 *  * A trailing '\r' is stripped so CRLF peers work too.
 *  * Owns the descriptors only when constructed with `ownsFds = true`.
 *  * *Non-copyable*, but move-constructible.
 */
    class LineChannel {

    public:
      //---ctr / dtr--------------------------------------------
      LineChannel(int readFd, int writeFd, bool ownsFds = false);
      virtual ~LineChannel();

      //---public API-------------------------------------------
      virtual bool writeLine(const std::string& line); // returns false on EIO / closed peer
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      bool eof() const { return eof_; }
      void close();

      //---non-copyable-----------------------------------------
      LineChannel(const LineChannel&) = delete;
      LineChannel& operator=(const LineChannel&) = delete;

      //---mv and mv assign-------------------------------------
      LineChannel(LineChannel&& other) noexcept;
      LineChannel& operator=(LineChannel&& other) noexcept;

    private:
      std::optional<std::string> takeLine();

      int readFd_{ -1 };
      int writeFd_{ -1 };
      bool ownsFds_{ false };
      bool eof_{ false };
      std::string rx_buffer_{}; ///< bytes read but not yet returned as a line
    };
  } // namespace io
} // namespace rollstart
