#include "utils.h"

#include <cctype>
#include <cstdlib>
#include <algorithm>

#include "engines.h"
#include "toolchain.h"
#include "docker_client.h"

EnvironmentConfig MakeConfig(Language lang, Backend backend) {
  EnvironmentConfig config;
  config.language = lang;
  config.backend = backend;
  return config;
}

bool HasTool(const std::string& name) {
  const char* path = getenv("PATH");
  ToolchainResolver resolver;
  return resolver.Resolve(name, path ? path : "").has_value();
}

bool DockerAvailable() {
  return DockerClient(EnvironmentConfig().docker_socket).Ping();
}

PreparedCommand ShellCommand(const std::string& script, const std::filesystem::path& workdir,
                             const EnvMap& extra) {
  return PreparedCommand{ExplicitCommand{"/bin/sh", {"-c", script}}, SanitizedEnv(extra), workdir};
}

std::string Trim(const std::string& str) {
  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
      [](char a, char b) { return std::tolower((unsigned char)a) == std::tolower((unsigned char)b); });
  return it != haystack.end();
}
