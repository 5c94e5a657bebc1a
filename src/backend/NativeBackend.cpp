#include "backend/NativeBackend.hpp"

#include "backend/ProcUtil.hpp"
#include "cvpress/TextUtil.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace backend {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string converter_page_name(const std::string& page_size) {
    const std::string p = textutil::to_lower_copy(page_size);
    if (p == "a4") return "A4";
    return "Letter";
}

static std::string substitute(std::string arg, const std::string& key, const std::string& value) {
    size_t pos = 0;
    while ((pos = arg.find(key, pos)) != std::string::npos) {
        arg.replace(pos, key.size(), value);
        pos += value.size();
    }
    return arg;
}

// last few hundred bytes of converter output, enough for an error message
static std::string tail(const std::string& s, size_t n = 400) {
    std::string t = s.size() > n ? s.substr(s.size() - n) : s;
    return textutil::trim_copy(t);
}

std::vector<ConverterSpec> default_converters() {
    return {
        ConverterSpec{"weasyprint", {"{in}", "{out}"}},
        ConverterSpec{"wkhtmltopdf", {"--quiet", "--page-size", "{page}", "{in}", "{out}"}},
    };
}

CommandNativeBackend::CommandNativeBackend(std::vector<ConverterSpec> converters)
    : converters_(std::move(converters)) {}

std::string CommandNativeBackend::name() const {
    std::string out;
    for (const auto& c : converters_) {
        if (!out.empty()) out += "|";
        out += c.program;
    }
    return out;
}

BackendResult CommandNativeBackend::try_render(const std::string& markup, const cvpress::RenderingConfig& config) const {
    const ConverterSpec* spec = nullptr;
    fs::path exe;
    for (const auto& c : converters_) {
        exe = procutil::find_executable(c.program);
        if (!exe.empty()) {
            spec = &c;
            break;
        }
    }
    if (!spec) return BackendResult::unavailable();

    try {
        procutil::ScopedTempDir tmp("cvpress-native");
        const fs::path in_path = tmp.path() / "resume.html";
        const fs::path out_path = tmp.path() / "resume.pdf";

        {
            std::ofstream out(in_path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out) return BackendResult::failure("cannot write converter input: " + in_path.string());
            out << markup;
            out.flush();
            if (!out) return BackendResult::failure("cannot write converter input: " + in_path.string());
        }

        std::vector<std::string> argv{exe.string()};
        for (const auto& a : spec->args) {
            std::string v = substitute(a, "{in}", in_path.string());
            v = substitute(v, "{out}", out_path.string());
            v = substitute(v, "{page}", converter_page_name(config.page_size));
            argv.push_back(v);
        }

        const procutil::ProcResult res = procutil::run_capture(argv);
        if (!res.launched) {
            return BackendResult::failure(spec->program + ": failed to launch " + exe.string());
        }
        if (res.exit_code != 0) {
            return BackendResult::failure(spec->program + " exited with code " + std::to_string(res.exit_code) +
                                          (res.output.empty() ? "" : ": " + tail(res.output)));
        }

        std::string pdf = read_all(out_path);
        if (pdf.empty()) {
            return BackendResult::failure(spec->program + " produced no output");
        }
        return BackendResult::success(std::move(pdf));
    } catch (const std::exception& e) {
        return BackendResult::failure(spec->program + ": " + e.what());
    }
}

} // namespace backend
