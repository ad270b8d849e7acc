#pragma once
/** @file  CommitteeLog.hpp
 *  @brief Asynchronous CSV committee-boat log (runs its own worker thread).
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "core/ScheduleEvent.hpp"
#include "io/FileLogger.hpp"

namespace rollstart {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class CommitteeLog
 * @brief EventSink writing one CSV row per committed event.
 *
 *  * `log()` never blocks the scheduler: rows are queued and written by the worker.
 *  * A full queue drops the row and bumps `droppedEvents()`.
 */
    class CommitteeLog : public EventSink {

    public:
      explicit CommitteeLog(std::size_t capacity = 256);
      ~CommitteeLog() override; ///< finishRun() if still running

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const ScheduleEvent& event);         ///< enqueue event (non-blocking)
      void finishRun();                             ///< flush + join worker thread

      void publish(const ScheduleEvent& event) override { log(event); }

      bool running() const { return running_; }
      std::size_t droppedEvents() const { return dropped_; }

      static const char* csvHeader();
      static std::string formatRow(const ScheduleEvent& event);

    private:
      void drain();

      std::size_t capacity_;
      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<ScheduleEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace rollstart
