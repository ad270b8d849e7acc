#pragma once
/** @file  SequenceRegistry.hpp
 *  @brief Runtime registry that maps sequence-type names to profile creators.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "protocols/SequenceProfile.hpp"

namespace rollstart::core {

  /**
 * @class SequenceRegistry
 * @brief Register & resolve start sequences by string key.
 *
 *  * Built-ins: "5-4-1-go", "3-2-1-go", "5-1-go".
 *  * "custom" is never registered; it resolves from offsets carried by the schedule.
 *  * Filled at boot, read-only afterwards.
 */
  class SequenceRegistry {
  public:
    using Creator = std::function<protocols::SequenceProfile()>;

    static constexpr const char* kCustom = "custom";

    SequenceRegistry();

    /// Register a creator under \p name.  Returns false on duplicate or "custom".
    bool registerSequence(const std::string& name, Creator maker);

    /// Validates \p profile and registers it under its own name.
    bool registerSequence(const protocols::SequenceProfile& profile);

    bool contains(const std::string& name) const;

    /// Create a validated profile or throw `ScheduleError(InvalidSequenceType)`.
    protocols::SequenceProfile create(const std::string& name) const;

    /// Like `create()`, but "custom" is answered from \p customOffsets.
    protocols::SequenceProfile
    resolve(const std::string& name,
            const std::optional<protocols::SequenceProfile>& customOffsets) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace rollstart::core
