/* @file JsonFileScheduleStore.cpp
 * @brief JSON snapshot persistence with write-then-rename
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdio> // std::rename
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// RollStart headers
#include "core/ScheduleJson.hpp"
#include "io/JsonFileScheduleStore.hpp"

using namespace rollstart::io;
using nlohmann::json;

JsonFileScheduleStore::JsonFileScheduleStore(std::string path) : path_(std::move(path)) {
  if (!std::filesystem::exists(path_))
    return;

  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[JsonFileScheduleStore] cannot read " + path_);

  ScheduleMap loaded;
  try {
    const json doc = json::parse(in);
    for (const auto& item : doc.at("schedules")) {
      auto schedule = item.get<core::StartSchedule>();
      const std::string id = schedule.id;
      loaded.emplace(id, std::move(schedule));
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("[JsonFileScheduleStore] malformed store " + path_ + ": " + e.what());
  }
  seed(std::move(loaded));
}

void JsonFileScheduleStore::persist(const ScheduleMap& schedules) {
  json doc;
  doc["schedules"] = json::array();
  for (const auto& [id, schedule] : schedules)
    doc["schedules"].push_back(schedule);

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw std::runtime_error("[JsonFileScheduleStore] cannot open " + tmp);
    out << doc.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out)
      throw std::runtime_error("[JsonFileScheduleStore] write failed for " + tmp);
  }

  if (std::rename(tmp.c_str(), path_.c_str()) != 0)
    throw std::runtime_error("[JsonFileScheduleStore] rename to " + path_ +
                             " failed: " + std::strerror(errno));
}
