#ifndef DEBUGGER_DEBUGGER_HPP
#define DEBUGGER_DEBUGGER_HPP

#include <stdint.h>

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/sandbox.pb.h"

namespace debugger {

static const constexpr size_t kMaxMessageLength = 1000;
static const constexpr size_t kMaxReprLength = 1000;
// Events and snapshots kept; older ones are dropped first.
static const constexpr size_t kMaxEvents = 10000;
static const constexpr size_t kMaxSnapshots = 10000;

// Unknown names map to LEVEL_INFO. Matching is case-insensitive.
proto::DebugLevel ParseLevel(const std::string& name);
const char* LevelName(proto::DebugLevel level);

// Collects the debug events and variable snapshots of one sandbox instance.
// The copy living in the supervisor mirrors every event to the log; the copy
// inside the sandboxed process forwards events to sinks instead, which ship
// them to the supervisor.
class Debugger {
 public:
  using EventSink = std::function<void(const proto::DebugEvent&)>;
  using SnapshotSink = std::function<void(const proto::VariableSnapshot&)>;

  Debugger() = default;
  Debugger(EventSink event_sink, SnapshotSink snapshot_sink)
      : event_sink_(std::move(event_sink)),
        snapshot_sink_(std::move(snapshot_sink)) {}
  Debugger(const Debugger&) = delete;
  Debugger& operator=(const Debugger&) = delete;

  void Log(const std::string& message, proto::DebugLevel level,
           const std::string& data = "",
           const proto::FrameInfo* frame = nullptr);
  void InspectVar(const std::string& name, const std::string& repr,
                  const std::string& type_name, int64_t size_estimate);

  // Merge events produced elsewhere. They are capped like local ones.
  void Append(proto::DebugEvent event);
  void AppendSnapshot(proto::VariableSnapshot snapshot);

  proto::DebugSummary Summary(size_t recent = 10) const;
  std::vector<proto::VariableSnapshot> History(const std::string& name) const;
  std::map<std::string, proto::VariableHistory> Variables() const;

 private:
  EventSink event_sink_;
  SnapshotSink snapshot_sink_;

  mutable absl::Mutex mutex_;
  std::deque<proto::DebugEvent> events_ GUARDED_BY(mutex_);
  std::map<proto::DebugLevel, int64_t> level_counts_ GUARDED_BY(mutex_);
  int64_t total_events_ GUARDED_BY(mutex_) = 0;
  int64_t dropped_events_ GUARDED_BY(mutex_) = 0;
  std::map<std::string, std::deque<proto::VariableSnapshot>> variables_
      GUARDED_BY(mutex_);
  // Variable names of the kept snapshots, oldest first.
  std::deque<std::string> snapshot_order_ GUARDED_BY(mutex_);
  int64_t dropped_snapshots_ GUARDED_BY(mutex_) = 0;
};

}  // namespace debugger

#endif
