#include "paths.h"

#include <spdlog/spdlog.h>

namespace internal {
fs::path kDataDir = fs::path(RUNBOX_DATA_DIR);
} // internal

const char kWorkspacePrefix[] = "runbox-env-";
const char kContainerWorkspace[] = "/runbox_workspace";
const char kTsConfigName[] = "tsconfig.json";
const char kTsDefaultOutDir[] = "compiled_ts";

fs::path TempRoot() {
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  fs::path resolved = fs::canonical(tmp, ec);
  if (ec) {
    spdlog::warn("Failed resolving temp root {}: {}", tmp.c_str(), ec.message());
    return tmp;
  }
  return resolved;
}

fs::path RlimitHelperPath() {
  return internal::kDataDir / "runbox-rlimit";
}

fs::path TsConfigPath(const fs::path& workspace) {
  return workspace / kTsConfigName;
}

fs::path InsideContainer(const fs::path& workspace, const fs::path& path) {
  if (!path.is_absolute()) return path;
  fs::path rel = path.lexically_relative(workspace);
  if (rel.empty() || *rel.begin() == "..") return path;
  if (rel == ".") return kContainerWorkspace;
  return kContainerWorkspace / rel;
}
