#ifndef TOOLCHAIN_H_
#define TOOLCHAIN_H_

#include <mutex>
#include <string>
#include <optional>
#include <filesystem>
#include <unordered_map>

// Resolves executable names against a PATH-style search string and caches
// the answers. A cached entry is used only while it was resolved against the
// same search string and still names an executable regular file; otherwise
// it is dropped and looked up again.
class ToolchainResolver {
  struct Entry {
    std::string search_path;
    std::filesystem::path resolved;
  };
  std::mutex mtx_;
  std::unordered_map<std::string, Entry> cache_;
 public:
  std::optional<std::filesystem::path> Resolve(const std::string& name, const std::string& search_path);
  // Resolved absolute path, or the name itself so the spawn reports the failure
  std::string ResolveOrName(const std::string& name, const std::string& search_path);
  void Invalidate();
  size_t CacheSize();
};

#endif  // TOOLCHAIN_H_
