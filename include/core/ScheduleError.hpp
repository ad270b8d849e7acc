#pragma once
/** @file  ScheduleError.hpp
 *  @brief Typed failure raised by every scheduler command.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rollstart {
  namespace core {

    enum class ErrorCode : std::uint8_t {
      InvalidSequenceType,
      InvalidTransition,
      DuplicateStartOrder,
      ScheduleNotReady,
      ScheduleBusy,
      EntryNotFound,
      ScheduleNotFound,
      PersistenceConflict,
      InvalidArgument,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorCode::Count) == 9,
                  "ErrorCode count changed please update toString()");

    inline const char* toString(ErrorCode code) {
      switch (code) {
      case ErrorCode::InvalidSequenceType:
        return "InvalidSequenceType";
      case ErrorCode::InvalidTransition:
        return "InvalidTransition";
      case ErrorCode::DuplicateStartOrder:
        return "DuplicateStartOrder";
      case ErrorCode::ScheduleNotReady:
        return "ScheduleNotReady";
      case ErrorCode::ScheduleBusy:
        return "ScheduleBusy";
      case ErrorCode::EntryNotFound:
        return "EntryNotFound";
      case ErrorCode::ScheduleNotFound:
        return "ScheduleNotFound";
      case ErrorCode::PersistenceConflict:
        return "PersistenceConflict";
      case ErrorCode::InvalidArgument:
        return "InvalidArgument";
      default:
        return "Unknown";
      }
    }

    /**
 * @class ScheduleError
 * @brief Domain or persistence failure with a machine-readable code.
 *
 *  * Commands throw before committing, so the stored aggregate is untouched.
 *  * Only `PersistenceConflict` is retryable (reload the aggregate, reapply).
 */
    class ScheduleError : public std::runtime_error {
    public:
      ScheduleError(ErrorCode code, const std::string& message)
          : std::runtime_error(message), code_{ code } {}

      ErrorCode code() const noexcept { return code_; }
      bool retryable() const noexcept { return code_ == ErrorCode::PersistenceConflict; }

    private:
      ErrorCode code_;
    };

  } // namespace core
} // namespace rollstart
