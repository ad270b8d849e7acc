// STL headers
#include <functional>

// RollStart headers
#include "core/ScheduleError.hpp"
#include "core/SequenceRegistry.hpp"
#include "protocols/SequenceProfile.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace rollstart::test {

  using core::ErrorCode;
  using core::Minutes;
  using core::ScheduleError;
  using core::SequenceRegistry;
  using protocols::SequenceProfile;
  using protocols::Stage;

  namespace {
    ErrorCode codeOf(const std::function<void()>& fn) {
      try {
        fn();
      } catch (const ScheduleError& e) {
        return e.code();
      }
      return ErrorCode::Count;
    }
  } // namespace

  TEST(sequence_registry, builtins_have_strictly_decreasing_offsets) {
    SequenceRegistry registry;
    for (const char* name : { "5-4-1-go", "3-2-1-go", "5-1-go" }) {
      const SequenceProfile p = registry.create(name);
      EXPECT_EQ(p.name, name);
      EXPECT_NO_THROW(p.validate());

      Minutes previous = p.warningOffset + Minutes{ 1 };
      for (Stage s : p.stages()) {
        EXPECT_LT(p.offsetOf(s), previous) << name << " " << protocols::toString(s);
        previous = p.offsetOf(s);
      }
    }
  }

  TEST(sequence_registry, five_one_go_has_no_preparatory) {
    SequenceRegistry registry;
    const SequenceProfile p = registry.create("5-1-go");
    EXPECT_FALSE(p.hasStage(Stage::Preparatory));
    EXPECT_EQ(p.stages(), (std::vector<Stage>{ Stage::Warning, Stage::OneMinute, Stage::Start }));
    EXPECT_EQ(p.offsetOf(Stage::Warning), Minutes{ 5 });
    EXPECT_EQ(p.offsetOf(Stage::OneMinute), Minutes{ 1 });
  }

  TEST(sequence_registry, three_two_one_offsets) {
    SequenceRegistry registry;
    const SequenceProfile p = registry.create("3-2-1-go");
    EXPECT_EQ(p.warningOffset, Minutes{ 3 });
    EXPECT_EQ(p.prepOffset, Minutes{ 2 });
    EXPECT_EQ(p.oneMinuteOffset, Minutes{ 1 });
    EXPECT_EQ(p.stages().size(), 4u);
  }

  TEST(sequence_registry, unknown_name_is_invalid_sequence_type) {
    SequenceRegistry registry;
    EXPECT_FALSE(registry.contains("7-go"));
    EXPECT_EQ(codeOf([&] { registry.create("7-go"); }), ErrorCode::InvalidSequenceType);
  }

  TEST(sequence_registry, custom_requires_offsets) {
    SequenceRegistry registry;
    EXPECT_TRUE(registry.contains(SequenceRegistry::kCustom));
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", std::nullopt); }),
              ErrorCode::InvalidSequenceType);

    SequenceProfile offsets;
    offsets.warningOffset = Minutes{ 6 };
    offsets.prepOffset = Minutes{ 4 };
    offsets.oneMinuteOffset = Minutes{ 1 };
    const SequenceProfile p = registry.resolve("custom", offsets);
    EXPECT_EQ(p.name, "custom");
    EXPECT_EQ(p.warningOffset, Minutes{ 6 });
  }

  TEST(sequence_registry, custom_rejects_non_decreasing_offsets) {
    SequenceRegistry registry;
    SequenceProfile offsets;
    offsets.warningOffset = Minutes{ 4 };
    offsets.prepOffset = Minutes{ 4 };
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", offsets); }),
              ErrorCode::InvalidSequenceType);

    offsets.prepOffset = Minutes{ 2 };
    offsets.oneMinuteOffset = Minutes{ 3 };
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", offsets); }),
              ErrorCode::InvalidSequenceType);

    offsets.prepOffset.reset();
    offsets.oneMinuteOffset = Minutes{ 0 };
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", offsets); }),
              ErrorCode::InvalidSequenceType);
  }

  TEST(sequence_registry, zero_offset_is_rejected_for_every_signal) {
    SequenceRegistry registry;
    SequenceProfile offsets;
    offsets.warningOffset = Minutes{ 3 };
    offsets.prepOffset = Minutes{ 0 };
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", offsets); }),
              ErrorCode::InvalidSequenceType);

    offsets.prepOffset = Minutes{ 2 };
    offsets.oneMinuteOffset = Minutes{ 0 };
    EXPECT_EQ(codeOf([&] { registry.resolve("custom", offsets); }),
              ErrorCode::InvalidSequenceType);

    offsets.oneMinuteOffset = Minutes{ 1 };
    EXPECT_NO_THROW(registry.resolve("custom", offsets));
  }

  TEST(sequence_registry, register_rejects_duplicates_and_custom) {
    SequenceRegistry registry;
    SequenceProfile club;
    club.name = "club-4-1";
    club.warningOffset = Minutes{ 4 };
    club.oneMinuteOffset = Minutes{ 1 };

    EXPECT_TRUE(registry.registerSequence(club));
    EXPECT_FALSE(registry.registerSequence(club));
    EXPECT_TRUE(registry.contains("club-4-1"));
    EXPECT_EQ(registry.create("club-4-1"), club);

    club.name = "custom";
    EXPECT_FALSE(registry.registerSequence(club));
    EXPECT_FALSE(registry.registerSequence("5-4-1-go", [] { return SequenceProfile{}; }));
  }

  TEST(sequence_registry, register_validates_profile) {
    SequenceRegistry registry;
    SequenceProfile broken;
    broken.name = "broken";
    broken.warningOffset = Minutes{ 0 };
    EXPECT_EQ(codeOf([&] { registry.registerSequence(broken); }), ErrorCode::InvalidSequenceType);
    EXPECT_FALSE(registry.contains("broken"));
  }

} // namespace rollstart::test
