/* @file SequenceRegistry.cpp
 * @brief built-in start sequences and lookup
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

#include "core/SequenceRegistry.hpp"
#include "core/ScheduleError.hpp"

using namespace rollstart::core;
using rollstart::protocols::SequenceProfile;

namespace {

  SequenceProfile makeProfile(const char* name, int warning, std::optional<int> prep,
                              std::optional<int> oneMinute) {
    SequenceProfile p;
    p.name = name;
    p.warningOffset = Minutes{ warning };
    if (prep)
      p.prepOffset = Minutes{ *prep };
    if (oneMinute)
      p.oneMinuteOffset = Minutes{ *oneMinute };
    return p;
  }

} // namespace

SequenceRegistry::SequenceRegistry() {
  registerSequence("5-4-1-go", [] { return makeProfile("5-4-1-go", 5, 4, 1); });
  registerSequence("3-2-1-go", [] { return makeProfile("3-2-1-go", 3, 2, 1); });
  registerSequence("5-1-go", [] { return makeProfile("5-1-go", 5, std::nullopt, 1); });
}

bool SequenceRegistry::registerSequence(const std::string& name, Creator maker) {
  if (name.empty() || name == kCustom || !maker)
    return false;
  return creators_.emplace(name, std::move(maker)).second;
}

bool SequenceRegistry::registerSequence(const SequenceProfile& profile) {
  profile.validate();
  return registerSequence(profile.name, [profile] { return profile; });
}

bool SequenceRegistry::contains(const std::string& name) const {
  return name == kCustom || creators_.count(name) != 0;
}

SequenceProfile SequenceRegistry::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw ScheduleError(ErrorCode::InvalidSequenceType,
                        "[SequenceRegistry] unknown sequence type: " + name);
  SequenceProfile profile = it->second();
  profile.validate();
  return profile;
}

SequenceProfile SequenceRegistry::resolve(const std::string& name,
                                          const std::optional<SequenceProfile>& customOffsets) const {
  if (name != kCustom)
    return create(name);

  if (!customOffsets)
    throw ScheduleError(ErrorCode::InvalidSequenceType,
                        "[SequenceRegistry] custom sequence requires explicit offsets");
  SequenceProfile profile = *customOffsets;
  profile.name = kCustom;
  profile.validate();
  return profile;
}
