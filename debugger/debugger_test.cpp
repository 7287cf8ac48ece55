#include "debugger/debugger.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using debugger::Debugger;

int64_t CountOf(const proto::DebugSummary& summary, proto::DebugLevel level) {
  for (const auto& count : summary.level_count()) {
    if (count.level() == level) return count.count();
  }
  return -1;
}

TEST(DebuggerTest, ParseLevel) {
  EXPECT_EQ(debugger::ParseLevel("warning"), proto::LEVEL_WARNING);
  EXPECT_EQ(debugger::ParseLevel("CRITICAL"), proto::LEVEL_CRITICAL);
  EXPECT_EQ(debugger::ParseLevel("Debug"), proto::LEVEL_DEBUG);
  EXPECT_EQ(debugger::ParseLevel("verbose"), proto::LEVEL_INFO);
  EXPECT_STREQ(debugger::LevelName(proto::LEVEL_ERROR), "ERROR");
}

TEST(DebuggerTest, SummaryCountsLevels) {
  Debugger debugger;
  debugger.Log("one", proto::LEVEL_INFO);
  debugger.Log("two", proto::LEVEL_INFO);
  debugger.Log("three", proto::LEVEL_ERROR, "{'x': 1}");
  proto::DebugSummary summary = debugger.Summary(2);
  EXPECT_EQ(summary.total_events(), 3);
  EXPECT_EQ(CountOf(summary, proto::LEVEL_INFO), 2);
  EXPECT_EQ(CountOf(summary, proto::LEVEL_ERROR), 1);
  EXPECT_EQ(CountOf(summary, proto::LEVEL_CRITICAL), 0);
  ASSERT_EQ(summary.recent_event_size(), 2);
  EXPECT_EQ(summary.recent_event(0).message(), "two");
  EXPECT_EQ(summary.recent_event(1).data(), "{'x': 1}");
}

TEST(DebuggerTest, CapsMessagesAndEvents) {
  Debugger debugger;
  debugger.Log(std::string(5000, 'm'), proto::LEVEL_INFO,
               std::string(5000, 'd'));
  proto::DebugSummary summary = debugger.Summary();
  ASSERT_EQ(summary.recent_event_size(), 1);
  EXPECT_LE(summary.recent_event(0).message().size(),
            debugger::kMaxMessageLength);
  EXPECT_LE(summary.recent_event(0).data().size(), debugger::kMaxReprLength);

  for (size_t i = 0; i < debugger::kMaxEvents + 5; i++)
    debugger.Log("x", proto::LEVEL_DEBUG);
  summary = debugger.Summary();
  EXPECT_EQ(summary.total_events(), debugger::kMaxEvents + 6);
  EXPECT_EQ(summary.dropped_events(), 6);
}

TEST(DebuggerTest, KeepsTheMostRecentEvents) {
  Debugger debugger;
  for (size_t i = 0; i < debugger::kMaxEvents + 5; i++)
    debugger.Log("event " + std::to_string(i), proto::LEVEL_INFO);
  proto::DebugSummary summary = debugger.Summary(3);
  EXPECT_EQ(summary.total_events(), debugger::kMaxEvents + 5);
  EXPECT_EQ(summary.dropped_events(), 5);
  ASSERT_EQ(summary.recent_event_size(), 3);
  EXPECT_EQ(summary.recent_event(0).message(), "event 10002");
  EXPECT_EQ(summary.recent_event(2).message(), "event 10004");
}

TEST(DebuggerTest, KeepsTheMostRecentSnapshots) {
  Debugger debugger;
  debugger.InspectVar("first", "0", "int", 28);
  for (size_t i = 0; i < debugger::kMaxSnapshots; i++)
    debugger.InspectVar("x", std::to_string(i), "int", 28);
  EXPECT_TRUE(debugger.History("first").empty());
  auto history = debugger.History("x");
  ASSERT_EQ(history.size(), debugger::kMaxSnapshots);
  EXPECT_EQ(history.front().repr(), "0");
  debugger.InspectVar("x", "last", "str", 53);
  history = debugger.History("x");
  ASSERT_EQ(history.size(), debugger::kMaxSnapshots);
  EXPECT_EQ(history.front().repr(), "1");
  EXPECT_EQ(history.back().repr(), "last");
  proto::DebugSummary summary = debugger.Summary();
  EXPECT_EQ(summary.dropped_snapshots(), 2);
  EXPECT_THAT(summary.variable_name(), ElementsAre("x"));
}

TEST(DebuggerTest, UnknownLevelDegradesToInfo) {
  Debugger debugger;
  proto::DebugEvent event;
  event.set_level(static_cast<proto::DebugLevel>(42));
  event.set_message("odd");
  debugger.Append(event);
  EXPECT_EQ(debugger.Summary().recent_event(0).level(), proto::LEVEL_INFO);
}

TEST(DebuggerTest, VariableHistory) {
  Debugger debugger;
  debugger.InspectVar("x", "1", "int", 28);
  debugger.InspectVar("x", "[1, 2]", "list", 72);
  debugger.InspectVar("y", std::string(3000, 'a'), "str", 3049);
  auto history = debugger.History("x");
  ASSERT_EQ(history.size(), 2);
  EXPECT_EQ(history[0].repr(), "1");
  EXPECT_EQ(history[1].type_name(), "list");
  EXPECT_LE(debugger.History("y")[0].repr().size(), debugger::kMaxReprLength);
  EXPECT_TRUE(debugger.History("z").empty());
  EXPECT_THAT(debugger.Summary().variable_name(), ElementsAre("x", "y"));
  EXPECT_EQ(debugger.Variables()["x"].snapshot_size(), 2);
}

TEST(DebuggerTest, SinksReceiveEvents) {
  std::vector<std::string> messages;
  std::vector<std::string> names;
  Debugger debugger(
      [&messages](const proto::DebugEvent& event) {
        messages.push_back(event.message());
      },
      [&names](const proto::VariableSnapshot& snapshot) {
        names.push_back(snapshot.name());
      });
  proto::FrameInfo frame;
  frame.set_function("f");
  frame.set_line(3);
  debugger.Log("hello", proto::LEVEL_WARNING, "", &frame);
  debugger.InspectVar("v", "2", "int", 28);
  EXPECT_THAT(messages, ElementsAre("hello"));
  EXPECT_THAT(names, ElementsAre("v"));
  EXPECT_EQ(debugger.Summary().recent_event(0).frame().line(), 3);
}

}  // namespace
