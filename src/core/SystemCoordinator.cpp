/* @file SystemCoordinator.cpp
 * @brief application lifecycle: wiring, console loop, escalation
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// RollStart headers
#include "core/Clock.hpp"
#include "core/CommandRouter.hpp"
#include "core/CommitteeLog.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Scheduler.hpp"
#include "core/SequenceRegistry.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/JsonFileScheduleStore.hpp"
#include "io/LineChannel.hpp"
#include "io/MemoryScheduleStore.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace rollstart::core;

const char* rollstart::core::toString(SystemState s) {
  switch (s) {
  case SystemState::BOOT:
    return "BOOT";
  case SystemState::INIT:
    return "INIT";
  case SystemState::IDLE:
    return "IDLE";
  case SystemState::RUNNING:
    return "RUNNING";
  case SystemState::FINISHED:
    return "FINISHED";
  case SystemState::ERROR:
    return "ERROR";
  default:
    return "Unknown";
  }
}

SystemCoordinator::SystemCoordinator(AppConfig config)
    : config_(std::move(config)), errorMonitor_(std::make_shared<ErrorMonitor>()) {}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::initialize() {
  if (currentState_ != SystemState::BOOT)
    throw std::runtime_error(std::string("[SystemCoordinator] initialize() called in state ") +
                             toString(currentState_));
  transitionTo(SystemState::INIT);

  errorMonitor_->registerEscalation([this](const std::string& reason) { handleError(reason); });

  auto registry = std::make_shared<SequenceRegistry>();
  for (const auto& profile : config_.sequences) {
    if (!registry->registerSequence(profile))
      throw std::runtime_error("[SystemCoordinator] sequence " + profile.name +
                               " clashes with a registered sequence");
  }

  std::shared_ptr<io::ScheduleStore> store;
  if (config_.storePath.empty())
    store = std::make_shared<io::MemoryScheduleStore>();
  else
    store = std::make_shared<io::JsonFileScheduleStore>(config_.storePath);

  scheduler_ = std::make_shared<Scheduler>(std::move(store), std::move(registry),
                                           std::make_shared<SystemClock>(), errorMonitor_,
                                           config_.scheduler);

  if (!config_.committeeLogPath.empty()) {
    committeeLog_ = std::make_shared<CommitteeLog>(config_.committeeLogCapacity);
    committeeLog_->startNewRun(config_.committeeLogPath);
    scheduler_->addSink(committeeLog_);
  }

  router_ = std::make_unique<CommandRouter>(scheduler_);
  transitionTo(SystemState::IDLE);
}

bool SystemCoordinator::run(io::LineChannel& console, std::chrono::milliseconds pollTimeout) {
  if (currentState_ != SystemState::IDLE)
    throw std::runtime_error(std::string("[SystemCoordinator] run() called in state ") +
                             toString(currentState_));
  transitionTo(SystemState::RUNNING);

  while (!router_->quitRequested()) {
    auto line = console.readLine(pollTimeout);
    if (!line) {
      if (console.eof())
        break;
      continue;
    }

    protocols::Response reply;
    if (auto cmd = protocols::Command::fromWire(*line)) {
      reply = router_->handle(*cmd);
    } else {
      const bool blank = line->find_first_not_of(" \t") == std::string::npos;
      if (blank || line->front() == '#')
        continue;
      reply = protocols::Response::failure("InvalidArgument",
                                           "[SystemCoordinator] unterminated quote in: " + *line);
    }

    if (!console.writeLine(reply.toWire())) {
      errorMonitor_->notifyFailure("[SystemCoordinator] console write failed");
      break;
    }
  }

  shutdown();
  if (faulted_)
    return false;
  transitionTo(SystemState::FINISHED);
  return true;
}

void SystemCoordinator::handleError(const std::string& reason) {
  std::cerr << "[SystemCoordinator] escalation: " << reason << '\n';
  faulted_ = true;
  transitionTo(SystemState::ERROR);
}

void SystemCoordinator::transitionTo(SystemState next) {
  const SystemState prev = currentState_.exchange(next);
  if (prev != next)
    std::cerr << "[SystemCoordinator] " << toString(prev) << " -> " << toString(next) << '\n';
}

void SystemCoordinator::shutdown() {
  if (committeeLog_ && committeeLog_->running())
    committeeLog_->finishRun();
}
