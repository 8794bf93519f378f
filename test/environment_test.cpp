#include <cstdlib>
#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include <runbox/paths.h>
#include <runbox/errors.h>

#include "utils.h"

namespace {

struct PathParam {
  std::string name;
  std::string path;
  std::string normalized; // empty: must be rejected
};

std::string ParamName(const ::testing::TestParamInfo<PathParam>& info) {
  return info.param.name;
}

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

bool IsEmptyDir(const fs::path& path) {
  return fs::directory_iterator(path) == fs::directory_iterator();
}

} // namespace

class EnvironmentTest : public testing::Test {
 protected:
  ScopedEnvironment tmp;
  EnvironmentTest() : tmp(MakeConfig(Language::JAVASCRIPT)) {}
};

class StagePath : public EnvironmentTest, public testing::WithParamInterface<PathParam> {};
TEST_P(StagePath, Validate) {
  auto& param = GetParam();
  if (param.normalized.empty()) {
    EXPECT_THROW(tmp->AddFile(param.path, "content"), ConfigurationError);
    EXPECT_TRUE(IsEmptyDir(tmp->Workspace()));
    EXPECT_TRUE(tmp->Files().empty());
    return;
  }
  tmp->AddFile(param.path, "content of " + param.name);
  fs::path staged = tmp->Workspace() / param.normalized;
  EXPECT_EQ(ReadAll(staged), "content of " + param.name);
  EXPECT_EQ(tmp->Files().count(param.normalized), 1u);
  auto perms = fs::status(staged).permissions();
  EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
  EXPECT_NE(perms & fs::perms::others_exec, fs::perms::none);
}
INSTANTIATE_TEST_SUITE_P(Paths, StagePath,
    testing::Values(
      (PathParam){"plain", "main.js", "main.js"},
      (PathParam){"nested", "lib/deep/util.js", "lib/deep/util.js"},
      (PathParam){"dot_prefix", "./main.py", "main.py"},
      (PathParam){"inner_parent", "a/../b.txt", "b.txt"},
      (PathParam){"absolute", "/etc/passwd", ""},
      (PathParam){"parent", "../escape.js", ""},
      (PathParam){"deep_parent", "a/../../escape.js", ""},
      (PathParam){"empty", "", ""},
      (PathParam){"dot", ".", ""},
      (PathParam){"directory", "dir/", ""}
    ),
    ParamName);

TEST_F(EnvironmentTest, WorkspaceUnderResolvedTempRoot) {
  EXPECT_TRUE(fs::is_directory(tmp->Workspace()));
  EXPECT_EQ(tmp->Workspace().parent_path().string(), TempRoot().string());
  EXPECT_EQ(tmp->Workspace().filename().string().rfind(kWorkspacePrefix, 0), 0u);
  EXPECT_EQ(fs::canonical(tmp->Workspace()).string(), tmp->Workspace().string());
}

TEST_F(EnvironmentTest, WorkspaceInsideProcessTempRoot) {
  ASSERT_FALSE(test_tmp_root.empty());
  fs::path root = fs::canonical(test_tmp_root);
  EXPECT_EQ(TempRoot().string(), root.string());
  EXPECT_EQ(tmp->Workspace().parent_path().string(), root.string());
  EXPECT_EQ(root.filename().string().rfind("runbox-test-", 0), 0u);
}

TEST_F(EnvironmentTest, DistinctWorkspaces) {
  ScopedEnvironment other(MakeConfig(Language::JAVASCRIPT));
  EXPECT_NE(tmp->Workspace(), other->Workspace());
}

TEST_F(EnvironmentTest, AddFilesStopsAtFirstInvalid) {
  EXPECT_THROW(tmp->AddFiles({{"a.js", "1"}, {"../b.js", "2"}, {"c.js", "3"}}), ConfigurationError);
  EXPECT_TRUE(fs::exists(tmp->Workspace() / "a.js"));
  EXPECT_FALSE(fs::exists(tmp->Workspace() / "c.js"));
}

TEST_F(EnvironmentTest, OverwriteFile) {
  tmp->AddFile("main.js", "old");
  tmp->AddFile("main.js", "new");
  EXPECT_EQ(ReadAll(tmp->Workspace() / "main.js"), "new");
  EXPECT_EQ(tmp->Files().size(), 1u);
}

TEST_F(EnvironmentTest, DeleteTwice) {
  tmp->AddFile("main.js", "x");
  fs::path workspace = tmp->Workspace();
  EXPECT_NO_THROW(tmp->Delete());
  EXPECT_NO_THROW(tmp->Delete());
  EXPECT_TRUE(tmp->Deleted());
  EXPECT_FALSE(fs::exists(workspace));
}

TEST_F(EnvironmentTest, DeleteAfterExternalRemoval) {
  fs::remove_all(tmp->Workspace());
  EXPECT_NO_THROW(tmp->Delete());
}

TEST_F(EnvironmentTest, UseAfterDelete) {
  tmp->Delete();
  EXPECT_THROW(tmp->AddFile("main.js", "x"), ConfigurationError);
  EXPECT_THROW(tmp->Execute("/bin/sh", {"-c", "true"}), ConfigurationError);
}

TEST_F(EnvironmentTest, MovedFromOwnsNothing) {
  fs::path workspace = tmp->Workspace();
  Environment moved = std::move(tmp.env);
  EXPECT_EQ(moved.Workspace(), workspace);
  EXPECT_THROW(tmp->AddFile("main.js", "x"), ConfigurationError);
  tmp->Delete();
  EXPECT_TRUE(fs::exists(workspace));
  moved.Delete();
  EXPECT_FALSE(fs::exists(workspace));
}

TEST(EnvironmentCreate, RejectsBadConfig) {
  auto config = MakeConfig(Language::PYTHON);
  config.timeout_ms = 0;
  EXPECT_THROW(Environment::Create(config), ConfigurationError);

  config = MakeConfig(Language::PYTHON);
  config.memory_limit_mb = -1;
  EXPECT_THROW(Environment::Create(config), ConfigurationError);

  config = MakeConfig(Language::PYTHON);
  config.language_options.process_limit = 0;
  EXPECT_THROW(Environment::Create(config), ConfigurationError);

  config = MakeConfig(Language::PYTHON, Backend::CONTAINER);
  EXPECT_THROW(Environment::Create(config), ConfigurationError);

  config.security_policy.image = "python:3.12-slim";
  config.security_policy.pids_limit = -5;
  EXPECT_THROW(Environment::Create(config), ConfigurationError);
}

TEST(EnvironmentCreate, ContainerWithImage) {
  auto config = MakeConfig(Language::PYTHON, Backend::CONTAINER);
  config.security_policy.image = "python:3.12-slim";
  ScopedEnvironment env(config);
  EXPECT_EQ(env->Config().backend, Backend::CONTAINER);
}

TEST(EnvironmentCreate, Defaults) {
  EnvironmentConfig config;
  EXPECT_EQ(config.timeout_ms, 10000);
  EXPECT_EQ(config.backend, Backend::PROCESS);
  EXPECT_EQ(config.security_policy.pull_policy, PullPolicy::IF_NOT_PRESENT);
  EXPECT_EQ(config.security_policy.workspace_mount_mode, MountMode::RW);
  EXPECT_FALSE(config.memory_limit_mb);
  EXPECT_FALSE(config.docker_socket.empty());
}

// The JavaScript process engine runs an explicit command as the interpreter,
// which lets /bin/sh observe what reaches the child.
class EnvironmentExecute : public testing::Test {
 protected:
  EnvironmentConfig config;
  EnvironmentExecute() : config(MakeConfig(Language::JAVASCRIPT)) {}
};

TEST_F(EnvironmentExecute, CallEnvReplacesDefault) {
  config.env = {{"FOO", "default"}, {"BAR", "only-default"}};
  ScopedEnvironment env(config);
  const std::vector<std::string> args = {"-c", "printf '%s,%s' \"$FOO\" \"${BAR-unset}\""};
  EXPECT_EQ(env->Execute("/bin/sh", args).stdout_text, "default,only-default");
  ExecuteOptions opts;
  opts.env = EnvMap{{"FOO", "call"}};
  EXPECT_EQ(env->Execute("/bin/sh", args, opts).stdout_text, "call,unset");
}

TEST_F(EnvironmentExecute, HostEnvNotForwarded) {
  setenv("RUNBOX_TEST_SECRET", "leaked", 1);
  ScopedEnvironment env(config);
  auto res = env->Execute("/bin/sh", {"-c", "printf '%s' \"${RUNBOX_TEST_SECRET-unset}\"; test -n \"$PATH\""});
  unsetenv("RUNBOX_TEST_SECRET");
  EXPECT_EQ(res.stdout_text, "unset");
  EXPECT_EQ(*res.exit_code, 0);
}

TEST_F(EnvironmentExecute, StdinDefaultAndOverride) {
  config.stdin_data = "from config";
  ScopedEnvironment env(config);
  EXPECT_EQ(env->Execute("/bin/sh", {"-c", "cat"}).stdout_text, "from config");
  ExecuteOptions opts;
  opts.stdin_data = "from call";
  EXPECT_EQ(env->Execute("/bin/sh", {"-c", "cat"}, opts).stdout_text, "from call");
}

TEST_F(EnvironmentExecute, TimeoutOverride) {
  ScopedEnvironment env(config);
  ExecuteOptions opts;
  opts.timeout_ms = 200;
  try {
    env->Execute("/bin/sh", {"-c", "sleep 5"}, opts);
    FAIL() << "expected TimeoutError";
  } catch (const TimeoutError& e) {
    EXPECT_EQ(e.configured_timeout_ms, 200);
  }
}

TEST_F(EnvironmentExecute, RejectsNonPositiveOverrides) {
  ScopedEnvironment env(config);
  ExecuteOptions opts;
  opts.timeout_ms = 0;
  EXPECT_THROW(env->Execute("/bin/sh", {"-c", "true"}, opts), ConfigurationError);
  opts = ExecuteOptions();
  opts.memory_limit_mb = -3;
  EXPECT_THROW(env->Execute("/bin/sh", {"-c", "true"}, opts), ConfigurationError);
}

TEST_F(EnvironmentExecute, RunsInWorkspace) {
  ScopedEnvironment env(config);
  env->AddFile("data/input.txt", "staged");
  auto res = env->Execute("/bin/sh", {"-c", "cat data/input.txt"});
  EXPECT_EQ(res.stdout_text, "staged");
}

TEST_F(EnvironmentExecute, Async) {
  ScopedEnvironment env(config);
  auto first = env->ExecuteAsync("/bin/sh", {"-c", "sleep 0.2; echo first"});
  auto second = env->ExecuteAsync("/bin/sh", {"-c", "echo second"});
  EXPECT_EQ(second.get().stdout_text, "second\n");
  EXPECT_EQ(first.get().stdout_text, "first\n");
}

TEST_F(EnvironmentExecute, MoveAfterAsyncCompletes) {
  ScopedEnvironment env(config);
  env->AddFile("data.txt", "kept");
  auto fut = env->ExecuteAsync("/bin/sh", {"-c", "cat data.txt"});
  EXPECT_EQ(fut.get().stdout_text, "kept");
  Environment moved = std::move(env.env);
  EXPECT_EQ(moved.Execute("/bin/sh", {"-c", "cat data.txt"}).stdout_text, "kept");
  EXPECT_THROW(env->ExecuteAsync("/bin/sh", {"-c", "true"}).get(), ConfigurationError);
  moved.Delete();
}

TEST_F(EnvironmentExecute, AsyncPropagatesErrors) {
  ScopedEnvironment env(config);
  ExecuteOptions opts;
  opts.timeout_ms = 100;
  auto fut = env->ExecuteAsync("/bin/sh", {"-c", "sleep 5"}, opts);
  EXPECT_THROW(fut.get(), TimeoutError);
}
