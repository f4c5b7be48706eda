#ifndef INCLUDE_SQLJUDGE_PATHS_H_
#define INCLUDE_SQLJUDGE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kProblemRoot;
extern fs::path kDatabasePath;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path ProblemPath(int id);
fs::path ProblemMetaPath(int id);
fs::path SandboxHelperPath();
fs::path LockFilePath();

#endif  // INCLUDE_SQLJUDGE_PATHS_H_
