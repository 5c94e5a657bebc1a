#pragma once

#include <memory>
#include <string>

#include "cvpress/Renderer.hpp"
#include "cvpress/TemplateEngine.hpp"
#include "cvpress/ThemeRegistry.hpp"

namespace cvpress {

// The markup format: context -> theme template -> HTML.
class HtmlRenderer final : public Renderer {
public:
    HtmlRenderer(std::shared_ptr<const ThemeRegistry> themes,
                 std::shared_ptr<const TemplateEngine> engine);

    std::string render(const ResumeContent& content, const RenderingConfig& config) const override;

private:
    std::shared_ptr<const ThemeRegistry> themes_;
    std::shared_ptr<const TemplateEngine> engine_;
};

}  // namespace cvpress
