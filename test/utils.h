#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <runbox/environment.h>

#include "command.h"

// temp root owned by this test process (set up in main)
extern std::filesystem::path test_tmp_root;

// Environment that deletes its workspace when the test ends
class ScopedEnvironment {
 public:
  Environment env;

  explicit ScopedEnvironment(const EnvironmentConfig& config) : env(Environment::Create(config)) {}
  ~ScopedEnvironment() { env.Delete(); }
  Environment* operator->() { return &env; }
};

EnvironmentConfig MakeConfig(Language lang, Backend backend = Backend::PROCESS);

// host toolchain / daemon availability, for skipping
bool HasTool(const std::string& name);
bool DockerAvailable();

// /bin/sh -c script, with the sanitized environment plus extra
PreparedCommand ShellCommand(const std::string& script, const std::filesystem::path& workdir,
                             const EnvMap& extra = {});

std::string Trim(const std::string& str);
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

#endif // TEST_UTILS_H_
