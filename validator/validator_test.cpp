#include "validator/validator.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using validator::ErrorKind;
using validator::Validate;
using validator::ValidationError;

class ValidatorTest : public ::testing::Test {
 protected:
  ValidatorTest() : config_(policy::SandboxConfig::Default()) {}

  // Returns the kind of the violation, failing the test if source is valid.
  ErrorKind Rejected(const std::string& source) {
    ValidationError error;
    EXPECT_FALSE(Validate(source, config_, &error)) << source;
    last_message_ = error.message;
    return error.kind;
  }

  bool Accepted(const std::string& source) {
    ValidationError error;
    bool ok = Validate(source, config_, &error);
    EXPECT_TRUE(ok) << source << ": " << error.message;
    return ok;
  }

  policy::SandboxConfig config_;
  std::string last_message_;
};

TEST_F(ValidatorTest, AcceptsPlainCode) {
  Accepted("import math\nimport json as j\nfrom random import choice\n"
           "def f(x):\n    return [math.sqrt(i) for i in range(x)]\n"
           "__result__ = f(3)\n");
}

TEST_F(ValidatorTest, ReturnsParsedProgram) {
  ValidationError error;
  std::shared_ptr<const script::ast::Module> program;
  ASSERT_TRUE(Validate("x = 1\ny = 2\n", config_, &error, &program));
  ASSERT_TRUE(program);
  EXPECT_EQ(program->body.size(), 2);
}

TEST_F(ValidatorTest, SourceTooLong) {
  config_.max_source_length = 10;
  EXPECT_EQ(Rejected("x = 1234567890\n"), ErrorKind::kSourceTooLong);
  // Length is measured in characters, not bytes.
  Accepted("s = 'ééé'");
}

TEST_F(ValidatorTest, SyntaxError) {
  ValidationError error;
  EXPECT_FALSE(Validate("x = 1\nif x\n", config_, &error));
  EXPECT_EQ(error.kind, ErrorKind::kSyntaxInvalid);
  EXPECT_EQ(error.line, 2);
  EXPECT_THAT(error.message, HasSubstr("line 2"));
}

TEST_F(ValidatorTest, BlockedModules) {
  EXPECT_EQ(Rejected("import os\n"), ErrorKind::kBlockedModule);
  EXPECT_THAT(last_message_, HasSubstr("'os'"));
  EXPECT_EQ(Rejected("import os.path\n"), ErrorKind::kBlockedModule);
  EXPECT_EQ(Rejected("from subprocess import run\n"),
            ErrorKind::kBlockedModule);
  EXPECT_EQ(Rejected("def f():\n    import socket\n"),
            ErrorKind::kBlockedModule);
  // An explicitly allowed submodule overrides its blocked parent.
  Accepted("import urllib.parse\n");
  EXPECT_EQ(Rejected("import urllib.request\n"), ErrorKind::kBlockedModule);
}

TEST_F(ValidatorTest, FileAndNetworkModules) {
  config_.allowed_modules.clear();
  EXPECT_EQ(Rejected("import pathlib\n"), ErrorKind::kBlockedModule);
  config_.enable_file_access = true;
  Accepted("import pathlib\n");
}

TEST_F(ValidatorTest, AllowList) {
  EXPECT_EQ(Rejected("import turtle\n"), ErrorKind::kModuleNotAllowed);
  Accepted("import collections.abc\n");
  config_.allowed_modules.clear();
  Accepted("import turtle\n");
}

TEST_F(ValidatorTest, BlockedCallables) {
  EXPECT_EQ(Rejected("eval('1')\n"), ErrorKind::kBlockedCallable);
  EXPECT_EQ(Rejected("f = exec\n"), ErrorKind::kBlockedCallable);
  EXPECT_EQ(Rejected("x = [open][0]\n"), ErrorKind::kBlockedCallable);
  EXPECT_EQ(Rejected("g = lambda: getattr(1, 'x')\n"),
            ErrorKind::kBlockedCallable);
  EXPECT_EQ(Rejected("def eval(x):\n    return x\n"),
            ErrorKind::kBlockedCallable);
  // Methods of the same name are not the blocked builtins.
  Accepted("d = {}\nv = d.get('x')\n");
}

TEST_F(ValidatorTest, DunderAttributes) {
  EXPECT_EQ(Rejected("x = ().__class__\n"), ErrorKind::kBlockedAttribute);
  EXPECT_EQ(Rejected("f = [c for c in x.__subclasses__()]\n"),
            ErrorKind::kBlockedAttribute);
  Accepted("x = a._private\n");
}

TEST_F(ValidatorTest, ReportsFirstViolation) {
  ValidationError error;
  EXPECT_FALSE(Validate("x = 1\nimport os\neval('2')\n", config_, &error));
  EXPECT_EQ(error.kind, ErrorKind::kBlockedModule);
  EXPECT_EQ(error.line, 2);
}

TEST(ValidatorKindTest, Names) {
  EXPECT_STREQ(validator::ErrorKindName(ErrorKind::kBlockedCallable),
               "BLOCKED_CALLABLE");
  EXPECT_STREQ(validator::ErrorKindName(ErrorKind::kSourceTooLong),
               "SOURCE_TOO_LONG");
}

}  // namespace
