#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for the committee log file.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace rollstart {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers writes, and flushes on demand.
 *
 *  * Buffer is pushed with `std::fwrite` once it reaches 4 kB.
 *  * Single writer: the committee-log worker thread.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** Queues one line (caller includes trailing '\n'). Returns false once a flush failed. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace rollstart
