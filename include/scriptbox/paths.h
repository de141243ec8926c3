#ifndef INCLUDE_SCRIPTBOX_PATHS_H_
#define INCLUDE_SCRIPTBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// full outputs are written here; retention is left to the caller
extern fs::path kOutputRoot;

namespace internal {

// location of scriptbox-worker; tests point this to the test binary directory
extern fs::path kDataDir;

} // internal

fs::path WorkerProgram();
fs::path ExecutionOutputDir(long id);
fs::path ExecutionOutputPath(long id);

#endif  // INCLUDE_SCRIPTBOX_PATHS_H_
