/* @file CommandRouter.cpp
 * @brief console verb table for the scheduler
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

// RollStart headers
#include "core/CommandRouter.hpp"
#include "core/ScheduleError.hpp"
#include "core/ScheduleJson.hpp"
#include "core/Scheduler.hpp"
#include "core/SequenceRegistry.hpp"

using namespace rollstart::core;
using rollstart::protocols::Command;
using rollstart::protocols::Response;
using rollstart::protocols::SequenceProfile;
using nlohmann::json;

namespace {

  int parseInt(const std::string& text, const std::string& what) {
    std::size_t used = 0;
    int value = 0;
    try {
      value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
      used = 0;
    }
    if (used == 0 || used != text.size())
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[CommandRouter] " + what + " must be an integer, got '" + text + "'");
    return value;
  }

  std::string joined(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words)
      out += (out.empty() ? "" : " ") + w;
    return out;
  }

  /// "custom:W/P/O" where '-' drops a stage, e.g. "custom:6/-/1".
  SequenceProfile parseCustom(const std::string& text) {
    const std::string offsets = text.substr(text.find(':') + 1);
    std::vector<std::string> parts;
    std::size_t from = 0;
    for (;;) {
      const auto slash = offsets.find('/', from);
      parts.push_back(offsets.substr(from, slash - from));
      if (slash == std::string::npos)
        break;
      from = slash + 1;
    }
    if (parts.size() != 3)
      throw ScheduleError(ErrorCode::InvalidSequenceType,
                          "[CommandRouter] custom sequence needs warning/prep/one-minute, got '" +
                              offsets + "'");

    auto offset = [](const std::string& p) -> std::optional<Minutes> {
      if (p == "-")
        return std::nullopt;
      return Minutes{ parseInt(p, "sequence offset") };
    };

    SequenceProfile profile;
    profile.name = SequenceRegistry::kCustom;
    profile.warningOffset = Minutes{ parseInt(parts[0], "warning offset") };
    profile.prepOffset = offset(parts[1]);
    profile.oneMinuteOffset = offset(parts[2]);
    return profile;
  }

  /// "key=value" -> {key, value}
  std::pair<std::string, std::string> splitField(const std::string& kv) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos)
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[CommandRouter] expected key=value, got '" + kv + "'");
    return { kv.substr(0, eq), kv.substr(eq + 1) };
  }

  IntervalPolicy parsePolicy(const std::string& text) {
    const auto policy = intervalPolicyFromString(text);
    if (!policy)
      throw ScheduleError(ErrorCode::InvalidArgument,
                          "[CommandRouter] unknown interval policy " + text);
    return *policy;
  }

  json entryJson(const FleetStartEntry& e) { return json(e); }

} // namespace

CommandRouter::CommandRouter(std::shared_ptr<Scheduler> scheduler)
    : scheduler_(std::move(scheduler)) {
  if (!scheduler_)
    throw std::invalid_argument("[CommandRouter] scheduler is nullptr");

  //---schedule configuration---------------------------------------------
  addRoute("create-schedule", 4,
           "<regattaId> <name> <YYYY-MM-DD> <HH:MM> [sequence|custom:W/P/O] [intervalMin] "
           "[replace|add]",
           [this](const Command& c) {
             ScheduleConfig cfg;
             cfg.regattaId = c.args[0];
             cfg.name = c.args[1];
             cfg.scheduledDate = c.args[2];
             cfg.firstWarningTime = atTimeOfDay(c.args[2], c.args[3]);
             if (c.args.size() > 4) {
               if (c.args[4].rfind("custom:", 0) == 0) {
                 cfg.sequenceType = SequenceRegistry::kCustom;
                 cfg.customProfile = parseCustom(c.args[4]);
               } else {
                 cfg.sequenceType = c.args[4];
               }
             }
             if (c.args.size() > 5)
               cfg.startIntervalMinutes = parseInt(c.args[5], "start interval");
             if (c.args.size() > 6)
               cfg.intervalPolicy = parsePolicy(c.args[6]);
             return Response::success(json(scheduler_->createSchedule(cfg)));
           });

  addRoute("update-schedule", 2,
           "<scheduleId> name=<..>|date=<YYYY-MM-DD>|time=<HH:MM>|sequence=<name|custom:W/P/O>|"
           "interval=<n>|policy=<replace|add>|notes=<..> ...",
           [this](const Command& c) {
             ScheduleUpdate update;
             std::optional<std::string> time;
             for (const auto& kv : c.tail(1)) {
               const auto [key, value] = splitField(kv);
               if (key == "name")
                 update.name = value;
               else if (key == "date")
                 update.scheduledDate = value;
               else if (key == "time")
                 time = value;
               else if (key == "sequence" && value.rfind("custom:", 0) == 0)
                 update.customProfile = parseCustom(value);
               else if (key == "sequence")
                 update.sequenceType = value;
               else if (key == "interval")
                 update.startIntervalMinutes = parseInt(value, "start interval");
               else if (key == "policy")
                 update.intervalPolicy = parsePolicy(value);
               else if (key == "notes")
                 update.notes = value;
               else
                 throw ScheduleError(ErrorCode::InvalidArgument,
                                     "[CommandRouter] unknown schedule field '" + key + "'");
             }
             if (time) {
               const std::string date = update.scheduledDate
                                            ? *update.scheduledDate
                                            : scheduler_->getSchedule(c.args[0]).scheduledDate;
               update.firstWarningTime = atTimeOfDay(date, *time);
             }
             return Response::success(json(scheduler_->updateSchedule(c.args[0], update)));
           });

  addRoute("add-fleet", 2, "<scheduleId> <fleetName> [classFlag] [raceNumber] [customIntervalMin]",
           [this](const Command& c) {
             FleetSpec spec;
             spec.fleetName = c.args[1];
             if (c.args.size() > 2)
               spec.classFlag = c.args[2];
             if (c.args.size() > 3)
               spec.raceNumber = parseInt(c.args[3], "race number");
             if (c.args.size() > 4)
               spec.customIntervalMinutes = parseInt(c.args[4], "custom interval");
             const auto added = scheduler_->addFleets(c.args[0], { spec });
             return Response::success(entryJson(added.front()));
           });

  addRoute("update-fleet", 2, "<entryId> name=<..>|flag=<..>|race=<n>|interval=<n|none> ...",
           [this](const Command& c) {
             FleetUpdate update;
             for (const auto& kv : c.tail(1)) {
               const auto [key, value] = splitField(kv);
               if (key == "name")
                 update.fleetName = value;
               else if (key == "flag")
                 update.classFlag = value;
               else if (key == "race")
                 update.raceNumber = parseInt(value, "race number");
               else if (key == "interval" && value == "none")
                 update.clearCustomInterval = true;
               else if (key == "interval")
                 update.customIntervalMinutes = parseInt(value, "custom interval");
               else
                 throw ScheduleError(ErrorCode::InvalidArgument,
                                     "[CommandRouter] unknown fleet field '" + key + "'");
             }
             return Response::success(entryJson(scheduler_->updateFleet(c.args[0], update)));
           });

  addRoute("remove-fleet", 1, "<entryId>", [this](const Command& c) {
    scheduler_->removeFleet(c.args[0]);
    return Response::success(json{ { "removed", c.args[0] } });
  });

  addRoute("reorder", 2, "<scheduleId> <entryId> [entryId ...]", [this](const Command& c) {
    return Response::success(json(scheduler_->reorderFleets(c.args[0], c.tail(1))));
  });

  addRoute("ready", 1, "<scheduleId>", [this](const Command& c) {
    return Response::success(json(scheduler_->markReady(c.args[0])));
  });

  addRoute("start-sequence", 1, "<scheduleId>", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->startSequence(c.args[0])));
  });

  addRoute("delete-schedule", 1, "<scheduleId>", [this](const Command& c) {
    scheduler_->deleteSchedule(c.args[0]);
    return Response::success(json{ { "deleted", c.args[0] } });
  });

  //---signals------------------------------------------------------------
  addRoute("warning", 1, "<entryId>", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->signalWarning(c.args[0])));
  });
  addRoute("preparatory", 1, "<entryId>", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->signalPreparatory(c.args[0])));
  });
  addRoute("one-minute", 1, "<entryId>", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->signalOneMinute(c.args[0])));
  });
  addRoute("start", 1, "<entryId>", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->signalStart(c.args[0])));
  });

  //---recovery-----------------------------------------------------------
  addRoute("general-recall", 1, "<entryId> [reason ...]", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->generalRecall(c.args[0], joined(c.tail(1)))));
  });
  addRoute("individual-recall", 2, "<entryId> <boatId> [boatId ...]", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->individualRecall(c.args[0], c.tail(1))));
  });
  addRoute("postpone", 1, "<entryId> [reason ...]", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->postpone(c.args[0], joined(c.tail(1)))));
  });
  addRoute("resume", 2, "<entryId> <HH:MM|YYYY-MM-DDTHH:MM[:SS]> [reason ...]",
           [this](const Command& c) {
             const std::string& when = c.args[1];
             TimePoint newWarning{};
             if (when.find('T') != std::string::npos) {
               newWarning = parseIso(when);
             } else {
               const auto entry = scheduler_->getEntry(c.args[0]);
               newWarning =
                   atTimeOfDay(scheduler_->getSchedule(entry.scheduleId).scheduledDate, when);
             }
             return Response::success(
                 entryJson(scheduler_->resume(c.args[0], newWarning, joined(c.tail(2)))));
           });
  addRoute("abandon", 1, "<entryId> [reason ...]", [this](const Command& c) {
    return Response::success(entryJson(scheduler_->abandon(c.args[0], joined(c.tail(1)))));
  });

  //---queries------------------------------------------------------------
  addRoute("status", 1, "<scheduleId>", [this](const Command& c) {
    return Response::success(json(scheduler_->getStatusSummary(c.args[0])));
  });
  addRoute("timeline", 1, "<scheduleId>", [this](const Command& c) {
    return Response::success(json(scheduler_->getTimeline(c.args[0])));
  });
  addRoute("countdown", 1, "<entryId>", [this](const Command& c) {
    const auto cd = scheduler_->countdown(c.args[0]);
    return Response::success(cd ? json(*cd) : json(nullptr));
  });
  addRoute("show", 1, "<scheduleId>", [this](const Command& c) {
    return Response::success(json(scheduler_->getSchedule(c.args[0])));
  });
  addRoute("list", 1, "<regattaId>", [this](const Command& c) {
    return Response::success(json(scheduler_->listSchedules(c.args[0])));
  });

  addRoute("help", 0, "", [this](const Command&) { return help(); });
  addRoute("quit", 0, "", [this](const Command&) {
    quit_ = true;
    return Response::success("bye");
  });
}

void CommandRouter::addRoute(const std::string& verb, std::size_t minArgs, std::string usage,
                             Handler handler) {
  routes_[verb] = Route{ minArgs, std::move(usage), std::move(handler) };
}

Response CommandRouter::help() const {
  json verbs = json::object();
  for (const auto& [verb, route] : routes_)
    verbs[verb] = route.usage;
  return Response::success(std::move(verbs));
}

Response CommandRouter::handle(const Command& cmd) {
  auto it = routes_.find(cmd.verb);
  if (it == routes_.end())
    return Response::failure(toString(ErrorCode::InvalidArgument),
                             "[CommandRouter] unknown command '" + cmd.verb + "'");

  const Route& route = it->second;
  if (cmd.args.size() < route.minArgs)
    return Response::failure(toString(ErrorCode::InvalidArgument),
                             "[CommandRouter] usage: " + cmd.verb + " " + route.usage);

  try {
    return route.handler(cmd);
  } catch (const ScheduleError& e) {
    return Response::failure(toString(e.code()), e.what(), e.retryable());
  } catch (const json::exception& e) {
    std::cerr << "[CommandRouter] " << cmd.verb << " failed: " << e.what() << '\n';
    return Response::failure("InternalError", e.what());
  } catch (const std::runtime_error& e) {
    std::cerr << "[CommandRouter] " << cmd.verb << " failed: " << e.what() << '\n';
    return Response::failure("InternalError", e.what());
  }
}
