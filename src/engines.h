#ifndef ENGINES_H_
#define ENGINES_H_

#include <string>
#include <vector>
#include <variant>
#include <filesystem>

#include "command.h"

extern const char* const kEnvAllowlist[];
// allowlisted host variables, then the caller's overrides on top
EnvMap SanitizedEnv(const EnvMap& overrides);

// Each engine turns (command, args, options) into a PreparedCommand, or a
// CompilationError when a host-side compile stage fails. An empty command
// means the engine's default interpreter.
struct JavaScriptProcessEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};
struct JavaScriptContainerEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};
struct TypeScriptProcessEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};
struct TypeScriptContainerEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};
struct PythonProcessEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};
struct PythonContainerEngine {
  PrepareResult Prepare(Environment&, const std::string& command,
                        const std::vector<std::string>& args, const RunOptions&) const;
};

using LanguageEngine = std::variant<
    JavaScriptProcessEngine, JavaScriptContainerEngine,
    TypeScriptProcessEngine, TypeScriptContainerEngine,
    PythonProcessEngine, PythonContainerEngine>;

LanguageEngine SelectEngine(Language, Backend);
const char* EngineName(const LanguageEngine&);
PrepareResult PrepareCommand(const LanguageEngine&, Environment&, const std::string& command,
                             const std::vector<std::string>& args, const RunOptions&);

/// helpers shared by the engines
// memory ceiling flag (if any) followed by the user arguments
std::vector<std::string> NodeArgs(const RunOptions&, const std::vector<std::string>& args);

// Index of the TypeScript source among args; throws ConfigurationError if none
size_t TsEntrypointIndex(const std::vector<std::string>& args);
// "src/main.ts" -> out_dir/"src/main.js", relative to the workspace
std::filesystem::path EmittedScriptPath(const std::filesystem::path& workspace,
                                        const std::filesystem::path& out_dir,
                                        const std::filesystem::path& source);
// Host-side compile stage; returns the output directory relative to the workspace
std::variant<std::filesystem::path, CompilationError> CompileTypeScript(Environment&, const RunOptions&);

#endif  // ENGINES_H_
