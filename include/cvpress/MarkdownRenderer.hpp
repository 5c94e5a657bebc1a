#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "cvpress/Renderer.hpp"

namespace cvpress {

// Markdown straight from the context; themes do not apply.
class MarkdownRenderer final : public Renderer {
public:
    std::string render(const ResumeContent& content, const RenderingConfig& config) const override;
};

std::string render_markdown(const nlohmann::ordered_json& context);

}  // namespace cvpress
