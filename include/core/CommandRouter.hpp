#pragma once
/** @file  CommandRouter.hpp
 *  @brief Maps console verbs onto Scheduler commands and queries.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

// RollStart headers
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace rollstart {
  namespace core {

    class Scheduler;

    /**
 * @class CommandRouter
 * @brief One `protocols::Command` in, one `protocols::Response` out.
 *
 *  * `ScheduleError` becomes `{ok:false, error:<code>, message, retryable}`.
 *  * Store I/O faults are answered as `InternalError`; they already reached ErrorMonitor.
 *  * `quit` answers and flips `quitRequested()`; the coordinator stops reading.
 */
    class CommandRouter {
    public:
      explicit CommandRouter(std::shared_ptr<Scheduler> scheduler);

      protocols::Response handle(const protocols::Command& cmd);
      bool quitRequested() const { return quit_; }

    private:
      using Handler = std::function<protocols::Response(const protocols::Command&)>;

      struct Route {
        std::size_t minArgs;
        std::string usage;
        Handler handler;
      };

      void addRoute(const std::string& verb, std::size_t minArgs, std::string usage,
                    Handler handler);
      protocols::Response help() const;

      std::shared_ptr<Scheduler> scheduler_;
      std::map<std::string, Route> routes_;
      bool quit_{ false };
    };

  } // namespace core
} // namespace rollstart
