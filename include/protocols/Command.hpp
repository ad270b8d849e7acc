#pragma once
/** @file  Command.hpp
 *  @brief One console command line: a verb plus positional arguments.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rollstart {
  namespace protocols {

    /**
 * @struct Command
 * @brief `verb arg1 "arg with spaces" ...`
 *
 *  * Arguments are split on whitespace; double quotes group, `\"` escapes.
 *  * `toWire()` quotes arguments that need it, so `fromWire(toWire())` is lossless.
 */
    struct Command {
      std::string verb;
      std::vector<std::string> args;

      /// nullopt for blank lines, `#` comments and unterminated quotes.
      static std::optional<Command> fromWire(const std::string& line);
      std::string toWire() const;

      /// Arguments from index \p first on (empty when out of range).
      std::vector<std::string> tail(std::size_t first) const;
    };

  } // namespace protocols
} // namespace rollstart
