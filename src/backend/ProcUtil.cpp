#include "backend/ProcUtil.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace procutil {

ProcResult run_capture(const std::vector<std::string>& argv, const fs::path& cwd) {
    ProcResult res;
    if (argv.empty()) return res;

    int fds[2];
    if (pipe(fds) != 0) return res;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return res;
    }

    if (pid == 0) {
        // child: stdout and stderr into the pipe, stdin from /dev/null
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(127);
        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent no longer needs write end
    close(fds[1]);

    res.output.reserve(8192);
    char buf[4096];
    while (true) {
        const ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            res.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return res;
    }

    res.launched = true;
    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    return res;
}

fs::path find_executable(const std::string& name) {
    if (name.empty()) return {};

    // explicit paths skip the PATH search
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();
    }

    const char* env = std::getenv("PATH");
    if (!env) return {};

    const std::string path_var = env;
    size_t start = 0;
    while (start <= path_var.size()) {
        size_t end = path_var.find(':', start);
        if (end == std::string::npos) end = path_var.size();
        const std::string dir = path_var.substr(start, end - start);
        start = end + 1;

        const fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return {};
}

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (!mkdtemp(buf.data())) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp failed for " + tmpl);
    }
    path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace procutil
