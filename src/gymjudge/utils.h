#ifndef GYMJUDGE_UTILS_H_
#define GYMJUDGE_UTILS_H_

#include <filesystem>

#include <gymjudge/utils.h>

namespace fs = std::filesystem;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// Reads at most max_bytes; sets truncated if the file is longer
bool ReadFileHead(const fs::path&, size_t max_bytes, std::string& content, bool& truncated);

#endif  // GYMJUDGE_UTILS_H_
