#ifndef INCLUDE_GYMJUDGE_PATHS_H_
#define INCLUDE_GYMJUDGE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

#endif  // INCLUDE_GYMJUDGE_PATHS_H_
