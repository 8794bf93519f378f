#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>
#include <optional>

#include "environment.h"

const char* LanguageName(Language);
std::optional<Language> GetLanguage(const std::string&);

const char* BackendName(Backend);
// "docker" is accepted as an alias of "container"
std::optional<Backend> GetBackend(const std::string&);

const char* PullPolicyName(PullPolicy);
std::optional<PullPolicy> GetPullPolicy(const std::string&);

const char* MountModeName(MountMode);
std::optional<MountMode> GetMountMode(const std::string&);

// "SIGKILL" etc.; "SIG<n>" for signals without a name
std::string SignalName(int signo);

#endif  // INCLUDE_RUNBOX_UTILS_H_
