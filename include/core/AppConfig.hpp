#pragma once
/** @file  AppConfig.hpp
 *  @brief Validated run-time configuration of the rollstart console.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Scheduler.hpp"
#include "protocols/SequenceProfile.hpp"

namespace rollstart::core {

  struct AppConfig {
    SchedulerOptions scheduler;
    std::string storePath;                     ///< empty = in-memory store
    std::string committeeLogPath{ "committee_log.csv" }; ///< empty = no committee log
    std::size_t committeeLogCapacity{ 256 };
    std::vector<protocols::SequenceProfile> sequences; ///< registered next to the built-ins

    /// Every key is optional. Throws `ScheduleError(InvalidArgument)` on a bad value.
    static AppConfig fromJson(const nlohmann::json& j);
  };

} // namespace rollstart::core
