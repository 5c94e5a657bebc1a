#include "cvpress/Pipeline.hpp"

#include "cvpress/ExternalToolchainRenderer.hpp"
#include "cvpress/HtmlRenderer.hpp"
#include "cvpress/MarkdownRenderer.hpp"
#include "io/FileOutput.hpp"

#include <mutex>

namespace cvpress {

void register_builtin_renderers(RendererRegistry& registry, const RendererDeps& deps) {
    RendererDeps d = deps;
    if (!d.themes) d.themes = std::make_shared<const ThemeRegistry>();
    if (!d.engine) d.engine = std::make_shared<const InjaEngine>();
    if (!d.native) d.native = std::make_shared<const backend::CommandNativeBackend>();

    auto markup = [d]() -> std::shared_ptr<Renderer> {
        return std::make_shared<HtmlRenderer>(d.themes, d.engine);
    };
    auto binary = [d]() -> std::shared_ptr<Renderer> {
        return std::make_shared<PdfRenderer>(std::make_shared<const HtmlRenderer>(d.themes, d.engine), d.native,
                                             d.clock);
    };
    auto toolchain = [d]() -> std::shared_ptr<Renderer> {
        return std::make_shared<ExternalToolchainRenderer>(d.rendercv_program);
    };
    auto markdown = []() -> std::shared_ptr<Renderer> {
        return std::make_shared<MarkdownRenderer>();
    };

    registry.register_renderer("markup", markup);
    registry.register_renderer("html", markup);
    registry.register_renderer("binary", binary);
    registry.register_renderer("pdf", binary);
    registry.register_renderer("external-toolchain", toolchain);
    registry.register_renderer("pdf-rendercv", toolchain);
    registry.register_renderer("markdown", markdown);
    registry.register_renderer("md", markdown);
}

RendererRegistry& default_registry() {
    static RendererRegistry registry;
    static std::once_flag once;
    std::call_once(once, [] { register_builtin_renderers(registry); });
    return registry;
}

std::string render_resume(const ResumeContent& content, const RenderingConfig& config, RendererRegistry& registry) {
    const std::shared_ptr<Renderer> renderer = registry.get(config.format);
    std::string bytes = renderer->render(content, config);

    if (!config.output_path.empty()) write_file_atomic(config.output_path, bytes);
    return bytes;
}

std::string render_resume(const ResumeContent& content, const RenderingConfig& config) {
    return render_resume(content, config, default_registry());
}

}  // namespace cvpress
