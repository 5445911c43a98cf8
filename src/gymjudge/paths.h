#ifndef GYMJUDGE_PATHS_H_
#define GYMJUDGE_PATHS_H_

#include <string>
#include <gymjudge/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// The box is the jail root; the log lives beside it, outside the jail.
// If inside_box = true, id is not used and the path is relative to the jail root.
fs::path SandboxRunPath(long id);
fs::path SandboxBoxPath(long id);
fs::path SandboxProgram(long id, const std::string& filename, bool inside_box = false);
fs::path SandboxLog(long id);

fs::path SandboxExecPath();

#endif  // GYMJUDGE_PATHS_H_
