#include "policy/config.hpp"

#include <stdexcept>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using policy::ResourceCeilings;
using policy::SandboxConfig;

TEST(ConfigTest, DefaultsFollowFlags) {
  SandboxConfig config = SandboxConfig::Default();
  EXPECT_DOUBLE_EQ(config.max_execution_time, 30.0);
  EXPECT_EQ(config.max_memory_mb, 256);
  EXPECT_EQ(config.max_source_length, 10000);
  EXPECT_TRUE(config.enable_debugging);
  EXPECT_THAT(config.allowed_modules, Contains("math"));
  EXPECT_THAT(config.blocked_modules, Contains("subprocess"));
  EXPECT_THAT(config.blocked_callables, Contains("eval"));
}

TEST(ConfigTest, FromProtoKeepsDefaultsForUnsetFields) {
  proto::SandboxConfig wire;
  wire.set_max_execution_time(5);
  wire.set_max_memory_mb(64);
  SandboxConfig config = SandboxConfig::FromProto(wire);
  EXPECT_DOUBLE_EQ(config.max_execution_time, 5.0);
  EXPECT_EQ(config.max_memory_mb, 64);
  EXPECT_EQ(config.max_output_bytes, 1024 * 1024);
  EXPECT_TRUE(config.enable_debugging);
}

TEST(ConfigTest, FromProtoMergesBlockedLists) {
  proto::SandboxConfig wire;
  wire.add_blocked_modules("random");
  wire.add_blocked_callables("print");
  wire.set_enable_debugging(false);
  SandboxConfig config = SandboxConfig::FromProto(wire);
  EXPECT_THAT(config.blocked_modules, Contains("random"));
  EXPECT_THAT(config.blocked_modules, Contains("os"));
  EXPECT_THAT(config.blocked_callables, Contains("print"));
  EXPECT_THAT(config.blocked_callables, Contains("exec"));
  EXPECT_FALSE(config.enable_debugging);
}

TEST(ConfigTest, ClientAllowListReplacesDefault) {
  proto::SandboxConfig wire;
  wire.add_allowed_modules("math");
  SandboxConfig config = SandboxConfig::FromProto(wire);
  EXPECT_TRUE(config.IsModuleAllowed("math"));
  EXPECT_FALSE(config.IsModuleAllowed("json"));
}

TEST(ConfigTest, ProtoRoundTrip) {
  SandboxConfig config = SandboxConfig::Default();
  config.max_memory_mb = 77;
  config.enable_network_access = true;
  SandboxConfig copy = SandboxConfig::FromProto(config.ToProto());
  EXPECT_EQ(copy.max_memory_mb, 77);
  EXPECT_TRUE(copy.enable_network_access);
  EXPECT_EQ(copy.allowed_modules, config.allowed_modules);
  EXPECT_EQ(copy.blocked_modules, config.blocked_modules);
}

TEST(ConfigTest, ClampToCeilings) {
  SandboxConfig config = SandboxConfig::Default();
  config.max_execution_time = 1000;
  config.max_memory_mb = 100;
  ResourceCeilings ceilings;
  ceilings.max_execution_time = 60;
  ceilings.max_memory_mb = 512;
  SandboxConfig clamped = config.ClampedTo(ceilings);
  EXPECT_DOUBLE_EQ(clamped.max_execution_time, 60);
  EXPECT_EQ(clamped.max_memory_mb, 100);
}

TEST(ConfigTest, CheckValidRejectsNonPositiveLimits) {
  SandboxConfig config = SandboxConfig::Default();
  EXPECT_NO_THROW(config.CheckValid());
  config.max_memory_mb = 0;
  EXPECT_THROW(config.CheckValid(), std::invalid_argument);
  config = SandboxConfig::Default();
  config.max_execution_time = -1;
  EXPECT_THROW(config.CheckValid(), std::invalid_argument);
  config = SandboxConfig::Default();
  config.max_recursion_depth = 5000;
  EXPECT_THROW(config.CheckValid(), std::invalid_argument);
}

TEST(ConfigTest, ModuleBlocking) {
  SandboxConfig config = SandboxConfig::Default();
  EXPECT_TRUE(config.IsModuleBlocked("os"));
  EXPECT_TRUE(config.IsModuleBlocked("os.path"));
  EXPECT_TRUE(config.IsModuleBlocked("urllib.request"));
  EXPECT_FALSE(config.IsModuleBlocked("urllib.parse"));
  EXPECT_FALSE(config.IsModuleBlocked("math"));
  EXPECT_TRUE(config.IsModuleBlocked("pathlib"));
}

TEST(ConfigTest, AccessFlagsRelaxImpliedBlocks) {
  SandboxConfig config = SandboxConfig::Default();
  EXPECT_TRUE(config.IsModuleBlocked("tempfile"));
  EXPECT_TRUE(config.IsModuleBlocked("ssl"));
  config.enable_file_access = true;
  config.enable_network_access = true;
  EXPECT_FALSE(config.IsModuleBlocked("tempfile"));
  EXPECT_FALSE(config.IsModuleBlocked("ssl"));
  // Explicitly blocked modules stay blocked.
  EXPECT_TRUE(config.IsModuleBlocked("os"));
  EXPECT_TRUE(config.IsModuleBlocked("socket"));
}

TEST(ConfigTest, AllowListCannotUnblockModule) {
  SandboxConfig config = SandboxConfig::Default();
  config.allowed_modules.insert("os");
  EXPECT_TRUE(config.IsModuleBlocked("os"));
}

}  // namespace
