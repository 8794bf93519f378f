#include <gtest/gtest.h>
#include <runbox/paths.h>

#include "rlimit.h"
#include "process_exec.h"
#include "utils.h"

class RlimitWrapperTest : public testing::Test {
 protected:
  ScopedEnvironment tmp;
  RlimitWrapperTest() : tmp(MakeConfig(Language::PYTHON)) {}

  ExecutionResult RunWrapper(const EnvMap& env) {
    PreparedCommand cmd{ExplicitCommand{RlimitHelperPath().string(), {}}, env, tmp->Workspace()};
    ProcessOptions opt;
    opt.timeout_ms = 10000;
    return ProcessExec(cmd, opt);
  }
};

TEST_F(RlimitWrapperTest, MissingArgs) {
  auto res = RunWrapper({});
  EXPECT_EQ(*res.exit_code, kRlimitNoArgs);
}

TEST_F(RlimitWrapperTest, MalformedArgs) {
  for (const char* raw : {"not json", "[]", "[1, 2]", "{\"a\": 1}", "[\"sh\", 3]"}) {
    auto res = RunWrapper({{kRlimitArgsEnv, raw}});
    EXPECT_EQ(*res.exit_code, kRlimitBadArgs) << raw;
  }
}

TEST_F(RlimitWrapperTest, CommandNotFound) {
  auto res = RunWrapper({{kRlimitArgsEnv, "[\"/nonexistent/python3\", \"main.py\"]"}});
  EXPECT_EQ(*res.exit_code, kRlimitNotFound);
  EXPECT_NE(res.stderr_text.find("/nonexistent/python3"), std::string::npos);
}

TEST_F(RlimitWrapperTest, ExecsWithContractRemoved) {
  auto res = RunWrapper({
    {kRlimitArgsEnv, R"(["/bin/sh", "-c", "printf '%s|%s|%s' \"${RUNBOX_EXEC_ARGS-unset}\" \"${RUNBOX_MEMORY_LIMIT_MB-unset}\" \"$1\"; exit 7", "sh", "a b"])"},
    {kRlimitMemoryEnv, "512"},
    {"KEEP", "kept"},
  });
  EXPECT_EQ(res.stdout_text, "unset|unset|a b");
  EXPECT_EQ(*res.exit_code, 7);
}

TEST_F(RlimitWrapperTest, AppliesLimits) {
  if (!fs::exists("/proc/self/limits")) GTEST_SKIP() << "no /proc/self/limits";
  auto res = RunWrapper({
    {kRlimitArgsEnv, R"(["/bin/sh", "-c", "grep -E 'Max (processes|address space)' /proc/self/limits"])"},
    {kRlimitMemoryEnv, "256"},
    {kRlimitProcessEnv, "4096"},
  });
  ASSERT_EQ(*res.exit_code, 0) << res.stderr_text;
  EXPECT_NE(res.stdout_text.find("268435456"), std::string::npos) << res.stdout_text;
  EXPECT_NE(res.stdout_text.find("4096"), std::string::npos) << res.stdout_text;
}
