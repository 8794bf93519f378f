#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// where runbox-rlimit is installed; tests point it at the build directory
extern fs::path kDataDir;

} // internal

extern const char kWorkspacePrefix[];

// Symlink-free temp root, so bind mounts see the same path as the host
fs::path TempRoot();
fs::path RlimitHelperPath();

#endif  // INCLUDE_RUNBOX_PATHS_H_
