#ifndef PATHS_H_
#define PATHS_H_

#include <runbox/paths.h>

// fixed mount point of the workspace inside containers
extern const char kContainerWorkspace[];

extern const char kTsConfigName[];
extern const char kTsDefaultOutDir[];

fs::path TsConfigPath(const fs::path& workspace);

// Maps a host path under the workspace to the in-container path; other paths
// are returned unchanged
fs::path InsideContainer(const fs::path& workspace, const fs::path& path);

#endif  // PATHS_H_
