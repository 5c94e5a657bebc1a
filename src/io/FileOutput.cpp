#include "io/FileOutput.hpp"

#include "cvpress/Errors.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

static fs::path temp_sibling(const fs::path& target) {
    static std::atomic<unsigned> counter{0};
    const std::string name = "." + target.filename().string() + "." + std::to_string(getpid()) + "." +
                             std::to_string(counter.fetch_add(1)) + ".tmp";
    return target.parent_path() / name;
}

static void discard(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
}

void write_file_atomic(const std::string& path, const std::string& bytes) {
    const fs::path target(path);
    if (target.filename().empty()) {
        throw cvpress::DestinationWriteError("output path names a directory: " + path);
    }

    const fs::path tmp = temp_sibling(target);
    {
        std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            throw cvpress::DestinationWriteError("cannot open output file for writing: " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            discard(tmp);
            throw cvpress::DestinationWriteError("failed to write output file: " + tmp.string());
        }
        out.close();
        if (out.fail()) {
            discard(tmp);
            throw cvpress::DestinationWriteError("failed to close output file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        discard(tmp);
        throw cvpress::DestinationWriteError("cannot move output into place (" + path + "): " + ec.message());
    }
}
