#include "debugger/debugger.hpp"

#include <ctype.h>

#include "glog/logging.h"
#include "util/misc.hpp"

namespace debugger {

namespace {

void CapEvent(proto::DebugEvent* event) {
  if (event->message().size() > kMaxMessageLength)
    event->set_message(util::Truncate(event->message(), kMaxMessageLength));
  if (event->data().size() > kMaxReprLength)
    event->set_data(util::Truncate(event->data(), kMaxReprLength));
  if (!proto::DebugLevel_IsValid(event->level()))
    event->set_level(proto::LEVEL_INFO);
  if (event->has_frame()) {
    for (auto& local : *event->mutable_frame()->mutable_locals()) {
      if (local.second.size() > kMaxReprLength)
        local.second = util::Truncate(local.second, kMaxReprLength);
    }
  }
}

void Mirror(const proto::DebugEvent& event) {
  std::string where;
  if (event.has_frame())
    where = " (" + event.frame().function() + ":" +
            std::to_string(event.frame().line()) + ")";
  switch (event.level()) {
    case proto::LEVEL_DEBUG:
      VLOG(1) << "[sandbox] " << event.message() << where;
      break;
    case proto::LEVEL_WARNING:
      LOG(WARNING) << "[sandbox] " << event.message() << where;
      break;
    case proto::LEVEL_ERROR:
    case proto::LEVEL_CRITICAL:
      LOG(ERROR) << "[sandbox] " << LevelName(event.level()) << " "
                 << event.message() << where;
      break;
    default:
      LOG(INFO) << "[sandbox] " << event.message() << where;
      break;
  }
}

}  // namespace

proto::DebugLevel ParseLevel(const std::string& name) {
  std::string upper;
  for (char c : name) upper += toupper(static_cast<unsigned char>(c));
  if (upper == "DEBUG") return proto::LEVEL_DEBUG;
  if (upper == "WARNING" || upper == "WARN") return proto::LEVEL_WARNING;
  if (upper == "ERROR") return proto::LEVEL_ERROR;
  if (upper == "CRITICAL") return proto::LEVEL_CRITICAL;
  return proto::LEVEL_INFO;
}

const char* LevelName(proto::DebugLevel level) {
  switch (level) {
    case proto::LEVEL_DEBUG:
      return "DEBUG";
    case proto::LEVEL_WARNING:
      return "WARNING";
    case proto::LEVEL_ERROR:
      return "ERROR";
    case proto::LEVEL_CRITICAL:
      return "CRITICAL";
    default:
      return "INFO";
  }
}

void Debugger::Log(const std::string& message, proto::DebugLevel level,
                   const std::string& data, const proto::FrameInfo* frame) {
  proto::DebugEvent event;
  event.set_timestamp_millis(util::NowMillis());
  event.set_level(level);
  event.set_message(message);
  event.set_data(data);
  if (frame) *event.mutable_frame() = *frame;
  Append(std::move(event));
}

void Debugger::InspectVar(const std::string& name, const std::string& repr,
                          const std::string& type_name,
                          int64_t size_estimate) {
  proto::VariableSnapshot snapshot;
  snapshot.set_name(name);
  snapshot.set_repr(repr);
  snapshot.set_type_name(type_name);
  snapshot.set_size_estimate(size_estimate);
  snapshot.set_timestamp_millis(util::NowMillis());
  AppendSnapshot(std::move(snapshot));
}

void Debugger::Append(proto::DebugEvent event) {
  CapEvent(&event);
  if (event_sink_) {
    event_sink_(event);
  } else {
    Mirror(event);
  }
  absl::MutexLock lock(&mutex_);
  total_events_++;
  level_counts_[event.level()]++;
  if (events_.size() >= kMaxEvents) {
    events_.pop_front();
    dropped_events_++;
  }
  events_.push_back(std::move(event));
}

void Debugger::AppendSnapshot(proto::VariableSnapshot snapshot) {
  if (snapshot.repr().size() > kMaxReprLength)
    snapshot.set_repr(util::Truncate(snapshot.repr(), kMaxReprLength));
  if (snapshot_sink_) snapshot_sink_(snapshot);
  absl::MutexLock lock(&mutex_);
  if (snapshot_order_.size() >= kMaxSnapshots) {
    auto oldest = variables_.find(snapshot_order_.front());
    oldest->second.pop_front();
    if (oldest->second.empty()) variables_.erase(oldest);
    snapshot_order_.pop_front();
    dropped_snapshots_++;
  }
  snapshot_order_.push_back(snapshot.name());
  variables_[snapshot.name()].push_back(std::move(snapshot));
}

proto::DebugSummary Debugger::Summary(size_t recent) const {
  proto::DebugSummary summary;
  absl::MutexLock lock(&mutex_);
  summary.set_total_events(total_events_);
  summary.set_dropped_events(dropped_events_);
  summary.set_dropped_snapshots(dropped_snapshots_);
  for (int level = proto::DebugLevel_MIN; level <= proto::DebugLevel_MAX;
       level++) {
    auto* count = summary.add_level_count();
    count->set_level(static_cast<proto::DebugLevel>(level));
    auto it = level_counts_.find(static_cast<proto::DebugLevel>(level));
    count->set_count(it == level_counts_.end() ? 0 : it->second);
  }
  for (const auto& variable : variables_)
    summary.add_variable_name(variable.first);
  size_t first = events_.size() > recent ? events_.size() - recent : 0;
  for (size_t i = first; i < events_.size(); i++)
    *summary.add_recent_event() = events_[i];
  return summary;
}

std::vector<proto::VariableSnapshot> Debugger::History(
    const std::string& name) const {
  absl::MutexLock lock(&mutex_);
  auto it = variables_.find(name);
  if (it == variables_.end()) return {};
  return std::vector<proto::VariableSnapshot>(it->second.begin(),
                                              it->second.end());
}

std::map<std::string, proto::VariableHistory> Debugger::Variables() const {
  std::map<std::string, proto::VariableHistory> out;
  absl::MutexLock lock(&mutex_);
  for (const auto& variable : variables_) {
    proto::VariableHistory& history = out[variable.first];
    for (const auto& snapshot : variable.second)
      *history.add_snapshot() = snapshot;
  }
  return out;
}

}  // namespace debugger
