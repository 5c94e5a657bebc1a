#pragma once

#include <memory>
#include <string>

#include "backend/NativeBackend.hpp"
#include "cvpress/Models.hpp"
#include "cvpress/PdfRenderer.hpp"
#include "cvpress/RendererRegistry.hpp"
#include "cvpress/RenderingConfig.hpp"
#include "cvpress/TemplateEngine.hpp"
#include "cvpress/ThemeRegistry.hpp"

namespace cvpress {

// Collaborators of the built-in renderers. Null members get the defaults.
struct RendererDeps {
    std::shared_ptr<const ThemeRegistry> themes;              // built-in themes
    std::shared_ptr<const TemplateEngine> engine;             // InjaEngine
    std::shared_ptr<const backend::NativeBackend> native;     // CommandNativeBackend
    PdfRenderer::Clock clock;                                 // no /CreationDate
    std::string rendercv_program = "rendercv";
};

// markup/html, binary/pdf, external-toolchain/pdf-rendercv, markdown/md
void register_builtin_renderers(RendererRegistry& registry, const RendererDeps& deps = {});

// Process-wide registry holding the built-ins.
RendererRegistry& default_registry();

// Looks up config.format, renders, and writes config.output_path atomically
// when it is set. Returns the rendered bytes either way.
std::string render_resume(const ResumeContent& content, const RenderingConfig& config, RendererRegistry& registry);

std::string render_resume(const ResumeContent& content, const RenderingConfig& config);

}  // namespace cvpress
