#ifndef UTILS_H_
#define UTILS_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// staged files are executable so scripts can be invoked directly
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
bool ReadFile(const fs::path&, std::string& content);
bool SetPerms(const fs::path&, fs::perms);

// logging & error messages
std::string FormatCommandLine(const std::string& executable, const std::vector<std::string>& args);

inline long ElapsedMs(std::chrono::steady_clock::time_point start) {
  auto dur = std::chrono::steady_clock::now() - start;
  return std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();
}

#endif  // UTILS_H_
