#ifndef COMMAND_H_
#define COMMAND_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>

#include <runbox/errors.h>
#include <runbox/environment.h>

struct ExplicitCommand {
  std::string executable;
  std::vector<std::string> args;
};

// container only: run the image's built-in command with these arguments
struct ImageDefaultCommand {
  std::vector<std::string> args;
};

using CommandLine = std::variant<ExplicitCommand, ImageDefaultCommand>;

// Produced once per execute call by one engine, consumed once by one executor
struct PreparedCommand {
  CommandLine command;
  EnvMap env;
  std::filesystem::path workdir;
};

// Environment defaults merged with call-level overrides
struct RunOptions {
  long timeout_ms;
  std::optional<long> memory_limit_mb;
  EnvMap env;
  std::optional<std::string> stdin_data;
};

using PrepareResult = std::variant<PreparedCommand, CompilationError>;

std::string FormatCommandLine(const CommandLine&);

#endif  // COMMAND_H_
