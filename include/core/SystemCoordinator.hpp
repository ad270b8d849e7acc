#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for rollstart::core::SystemCoordinator.
 *
 *  © 2025 RollStart contributors — licensed under MIT.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "core/AppConfig.hpp"

namespace rollstart {
  namespace io {
    class LineChannel;
  } // namespace io

  namespace core {

    class CommandRouter;
    class CommitteeLog;
    class ErrorMonitor;
    class Scheduler;

    enum class SystemState : std::uint8_t { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

    const char* toString(SystemState s);

    /**
 * @class SystemCoordinator
 * @brief Wires registry, store, scheduler, committee log and console router, then
 *        serves one command line at a time.
 *
 *  * BOOT -> INIT (initialize) -> IDLE -> RUNNING (run) -> FINISHED on quit/EOF.
 *  * Any ErrorMonitor escalation moves to ERROR; commands are still answered and
 *    `run()` reports the failure when the console closes.
 */
    class SystemCoordinator {

    public:
      explicit SystemCoordinator(AppConfig config);
      ~SystemCoordinator();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

      void initialize(); ///< build subsystems, open store and committee log
      /// Serve \p console until `quit` or EOF. Returns false when ERROR was reached.
      bool run(io::LineChannel& console,
               std::chrono::milliseconds pollTimeout = std::chrono::milliseconds{ 200 });
      void handleError(const std::string& reason);

      SystemState state() const { return currentState_; }
      std::shared_ptr<Scheduler> scheduler() const { return scheduler_; }
      std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }

    private:
      void transitionTo(SystemState next);
      void shutdown();

      AppConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Scheduler> scheduler_;
      std::shared_ptr<CommitteeLog> committeeLog_;
      std::unique_ptr<CommandRouter> router_;

      std::atomic<SystemState> currentState_{ SystemState::BOOT };
      std::atomic<bool> faulted_{ false };
    };

  } // namespace core
} // namespace rollstart
