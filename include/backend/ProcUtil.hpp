#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace procutil {

struct ProcResult {
    bool launched = false;   // false: fork/exec failed
    int exit_code = -1;
    std::string output;      // stdout+stderr (merged)
};

// Runs argv[0] (searched on PATH) with the given arguments and waits for it.
// A non-empty `cwd` becomes the child's working directory.
ProcResult run_capture(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

// Full path of an executable found on PATH, or empty.
std::filesystem::path find_executable(const std::string& name);

// Unique directory under the system temp dir, removed when the object dies.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace procutil
