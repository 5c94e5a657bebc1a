#include "cvpress/HtmlRenderer.hpp"

#include "cvpress/ContextBuilder.hpp"
#include "cvpress/Errors.hpp"

#include <iostream>

namespace cvpress {

HtmlRenderer::HtmlRenderer(std::shared_ptr<const ThemeRegistry> themes,
                           std::shared_ptr<const TemplateEngine> engine)
    : themes_(std::move(themes)), engine_(std::move(engine)) {
    if (!themes_) themes_ = std::make_shared<const ThemeRegistry>();
    if (!engine_) engine_ = std::make_shared<const InjaEngine>();
}

std::string HtmlRenderer::render(const ResumeContent& content, const RenderingConfig& config) const {
    const ResolvedTemplate tpl = themes_->resolve(config.theme, config.custom_template);

    if (tpl.fell_back) {
        if (config.strict_theme) throw UnknownThemeError(config.theme, themes_->names());
        std::cerr << "warning: unknown theme '" << config.theme << "' (available: "
                  << join_names(themes_->names()) << "); using '" << tpl.theme_name << "'\n";
    }

    nlohmann::ordered_json ctx = build_context(content);
    ctx["css"] = config.custom_css.empty() ? tpl.css : config.custom_css;

    return engine_->render(tpl.text, ctx);
}

}  // namespace cvpress
