/* @file CommitteeLog.cpp
 * @brief committee-boat CSV rows: signal flags, sound counts, worker thread
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

// RollStart headers
#include "core/CommitteeLog.hpp"
#include "core/RingBuffer.hpp"

using namespace rollstart::core;

namespace {

  struct SignalInfo {
    std::string category;
    std::string title;
    std::vector<std::string> flags;
    int soundSignals{ 0 };
  };

  std::string detailString(const nlohmann::json& details, const char* key) {
    if (details.contains(key) && details.at(key).is_string())
      return details.at(key).get<std::string>();
    return {};
  }

  SignalInfo describe(const ScheduleEvent& e) {
    const std::string fleet = detailString(e.details, "fleetName");
    std::string classFlag = detailString(e.details, "classFlag");
    if (classFlag.empty())
      classFlag = "Class";

    switch (e.type) {
    case EventType::WarningSignaled:
      return { "signal", "Warning Signal: " + fleet, { classFlag }, 1 };
    case EventType::PreparatorySignaled:
      return { "signal", "Preparatory Signal: " + fleet, { "P" }, 1 };
    case EventType::OneMinuteSignaled:
      return { "signal", "One Minute: " + fleet, {}, 1 };
    case EventType::StartSignaled:
      return { "timing", "Race Start: " + fleet, {}, 1 };
    case EventType::GeneralRecall:
      return { "signal", "General Recall: " + fleet, { "First Substitute" }, 2 };
    case EventType::IndividualRecall:
      return { "signal", "Individual Recall: " + fleet, { "X" }, 1 };
    case EventType::Postponed:
      return { "signal", "Postponed: " + fleet, { "AP" }, 2 };
    case EventType::Abandoned:
      return { "signal", "Abandoned: " + fleet, { "N" }, 3 };
    case EventType::Resumed:
      return { "signal", "Resumed: " + fleet, {}, 0 };
    case EventType::FleetsAdded:
    case EventType::FleetUpdated:
    case EventType::FleetRemoved:
      return { "schedule", std::string(toString(e.type)) + ": " + fleet, {}, 0 };
    default:
      return { "schedule",
               std::string(toString(e.type)) + ": " + detailString(e.details, "scheduleName"),
               {},
               0 };
    }
  }

  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\n\r") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  std::string joined(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i)
        out += sep;
      out += items[i];
    }
    return out;
  }

} // namespace

CommitteeLog::CommitteeLog(std::size_t capacity) : capacity_{ capacity } {
  if (capacity_ == 0)
    throw std::invalid_argument("[CommitteeLog] capacity must be positive");
}

CommitteeLog::~CommitteeLog() { finishRun(); }

const char* CommitteeLog::csvHeader() {
  return "timestamp,scheduleId,entryId,regattaId,raceNumber,category,eventType,title,flags,"
         "soundSignals,description";
}

std::string CommitteeLog::formatRow(const ScheduleEvent& event) {
  const SignalInfo info = describe(event);

  std::string raceNumber;
  if (event.details.contains("raceNumber") && event.details.at("raceNumber").is_number_integer())
    raceNumber = std::to_string(event.details.at("raceNumber").get<int>());

  std::string description = detailString(event.details, "reason");
  if (event.type == EventType::IndividualRecall && event.details.contains("boatIds"))
    description = "Individual recall for boats: " +
                  joined(event.details.at("boatIds").get<std::vector<std::string>>(), ", ");
  if (description.empty() && !raceNumber.empty())
    description = "Race " + raceNumber + " - " + detailString(event.details, "fleetName");

  std::ostringstream row;
  row << toIso(event.timestamp) << ',' << csvField(event.scheduleId) << ','
      << csvField(event.entryId) << ',' << csvField(detailString(event.details, "regattaId"))
      << ',' << raceNumber << ',' << info.category << ',' << toString(event.type) << ','
      << csvField(info.title) << ',' << csvField(joined(info.flags, ";")) << ','
      << info.soundSignals << ',' << csvField(description);
  return row.str();
}

void CommitteeLog::startNewRun(const std::string& csvPath) {
  if (running_)
    return;

  std::error_code ec;
  const bool fresh = !std::filesystem::exists(csvPath, ec) ||
                     std::filesystem::file_size(csvPath, ec) == 0;

  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[CommitteeLog] cannot open " + csvPath);
  if (fresh && !csvFile_.write(std::string(csvHeader()) + "\n"))
    throw std::runtime_error("[CommitteeLog] cannot write header to " + csvPath);

  buffer_ = std::make_unique<RingBuffer<ScheduleEvent>>(capacity_);
  running_ = true;
  worker_ = std::thread([this] { drain(); });
}

void CommitteeLog::log(const ScheduleEvent& event) {
  if (!running_ || !buffer_->tryPush(event))
    ++dropped_;
}

void CommitteeLog::finishRun() {
  if (!running_.exchange(false))
    return;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  csvFile_.close();
}

void CommitteeLog::drain() {
  while (auto event = buffer_->pop()) {
    if (!csvFile_.write(formatRow(*event) + "\n"))
      std::cerr << "[CommitteeLog] row lost: " << toString(event->type) << '\n';
    // keep the file current between bursts of signals
    if (buffer_->size() == 0 && !csvFile_.flush())
      std::cerr << "[CommitteeLog] flush failed\n";
  }
}
