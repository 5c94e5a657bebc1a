#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cvpress/RenderingConfig.hpp"

namespace backend {

enum class BackendStatus {
    Unavailable,   // no converter installed: caller falls back
    Success,
    Failure        // converter ran and failed: caller must surface it
};

struct BackendResult {
    BackendStatus status = BackendStatus::Unavailable;
    std::string bytes;       // Success only
    std::string message;     // Failure only

    static BackendResult unavailable() { return BackendResult{}; }
    static BackendResult success(std::string bytes) { return BackendResult{BackendStatus::Success, std::move(bytes), {}}; }
    static BackendResult failure(std::string message) { return BackendResult{BackendStatus::Failure, {}, std::move(message)}; }
};

// Optional high-fidelity HTML -> PDF converter.
class NativeBackend {
public:
    virtual ~NativeBackend() = default;

    virtual std::string name() const = 0;

    // Probes availability on every call; never throws.
    virtual BackendResult try_render(const std::string& markup, const cvpress::RenderingConfig& config) const = 0;
};

class NullNativeBackend final : public NativeBackend {
public:
    std::string name() const override { return "none"; }
    BackendResult try_render(const std::string&, const cvpress::RenderingConfig&) const override {
        return BackendResult::unavailable();
    }
};

// One external converter. Arguments may use {in}, {out} and {page}
// (page size name as the converter spells it, e.g. "Letter").
struct ConverterSpec {
    std::string program;
    std::vector<std::string> args;
};

// WeasyPrint, then wkhtmltopdf.
std::vector<ConverterSpec> default_converters();

// Runs the first converter found on PATH.
class CommandNativeBackend final : public NativeBackend {
    std::vector<ConverterSpec> converters_;

public:
    explicit CommandNativeBackend(std::vector<ConverterSpec> converters = default_converters());

    std::string name() const override;
    BackendResult try_render(const std::string& markup, const cvpress::RenderingConfig& config) const override;
};

} // namespace backend
