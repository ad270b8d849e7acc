/* @file Response.cpp
 * @brief console reply encoding
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// RollStart headers
#include "protocols/Response.hpp"

using namespace rollstart::protocols;
using nlohmann::json;

Response Response::success(json result) {
  Response r;
  r.ok = true;
  r.result = std::move(result);
  return r;
}

Response Response::failure(std::string error, std::string message, bool retryable) {
  Response r;
  r.ok = false;
  r.error = std::move(error);
  r.message = std::move(message);
  r.retryable = retryable;
  return r;
}

std::string Response::toWire() const {
  json j;
  j["ok"] = ok;
  if (ok) {
    j["result"] = result;
  } else {
    j["error"] = error;
    j["message"] = message;
    j["retryable"] = retryable;
  }
  // invalid UTF-8 in free text becomes U+FFFD instead of a type_error
  return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::optional<Response> Response::fromWire(const std::string& line) {
  const json j = json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("ok") || !j["ok"].is_boolean())
    return std::nullopt;

  Response r;
  r.ok = j["ok"].get<bool>();
  if (r.ok) {
    r.result = j.value("result", json());
  } else {
    r.error = j.value("error", std::string{});
    r.message = j.value("message", std::string{});
    r.retryable = j.value("retryable", false);
  }
  return r;
}
