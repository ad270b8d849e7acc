#pragma once
/** @file  Response.hpp
 *  @brief Console reply: one JSON object per line.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace rollstart {
  namespace protocols {

    /// `{"ok":true,"result":...}` or `{"ok":false,"error":...,"message":...,"retryable":...}`
    struct Response {
      bool ok{ true };
      nlohmann::json result;
      std::string error;
      std::string message;
      bool retryable{ false };

      static Response success(nlohmann::json result = nullptr);
      static Response failure(std::string error, std::string message, bool retryable = false);

      std::string toWire() const;
      /// nullopt when \p line is not a response object.
      static std::optional<Response> fromWire(const std::string& line);
    };

  } // namespace protocols
} // namespace rollstart
