#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "cvpress/Renderer.hpp"

namespace cvpress {

// RenderCV input built from a resume, plus what had to be filled in or dropped.
struct RenderCvDocument {
    nlohmann::ordered_json document;     // { "cv": {...}, "design": {...} }
    std::vector<std::string> warnings;
};

// RenderCV design themes; anything else maps to "classic".
const std::vector<std::string>& rendercv_themes();

RenderCvDocument to_rendercv(const ResumeContent& content, const RenderingConfig& config);

// The external-toolchain format. There is no fallback: a missing toolchain
// raises BackendUnavailableError, a failed run BackendFailureError.
class ExternalToolchainRenderer final : public Renderer {
public:
    // `program` is looked up on PATH unless it contains a '/'.
    explicit ExternalToolchainRenderer(std::string program = "rendercv");

    std::string render(const ResumeContent& content, const RenderingConfig& config) const override;

    const std::string& program() const { return program_; }

private:
    std::string program_;
};

}  // namespace cvpress
