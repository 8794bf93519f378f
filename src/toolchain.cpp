#include "toolchain.h"

#include <unistd.h>
#include <sstream>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

bool IsExecutable(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<fs::path> ToolchainResolver::Resolve(const std::string& name, const std::string& search_path) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (IsExecutable(name)) return fs::path(name);
    return std::nullopt;
  }
  std::lock_guard lck(mtx_);
  if (auto it = cache_.find(name); it != cache_.end()) {
    if (it->second.search_path == search_path && IsExecutable(it->second.resolved)) {
      return it->second.resolved;
    }
    spdlog::debug("Toolchain cache entry for {} invalidated", name);
    cache_.erase(it);
  }
  std::istringstream dirs(search_path);
  for (std::string dir; std::getline(dirs, dir, ':');) {
    if (dir.empty()) continue;
    fs::path candidate = fs::path(dir) / name;
    if (!candidate.is_absolute() || !IsExecutable(candidate)) continue;
    spdlog::debug("Resolved {} -> {}", name, candidate.c_str());
    cache_[name] = {search_path, candidate};
    return candidate;
  }
  spdlog::debug("Could not resolve {} on {}", name, search_path);
  return std::nullopt;
}

std::string ToolchainResolver::ResolveOrName(const std::string& name, const std::string& search_path) {
  if (auto path = Resolve(name, search_path)) return *path;
  return name;
}

void ToolchainResolver::Invalidate() {
  std::lock_guard lck(mtx_);
  cache_.clear();
}

size_t ToolchainResolver::CacheSize() {
  std::lock_guard lck(mtx_);
  return cache_.size();
}
