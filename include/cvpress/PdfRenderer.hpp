#pragma once

#include <ctime>
#include <functional>
#include <memory>
#include <string>

#include "backend/NativeBackend.hpp"
#include "cvpress/Renderer.hpp"

namespace cvpress {

// The binary format. Renders markup with `markup`, hands it to the native
// backend when one is installed, and otherwise lays the text out with the
// built-in PDF writer. A backend that runs and fails raises
// BackendFailureError; only an absent backend falls back.
class PdfRenderer final : public Renderer {
public:
    using Clock = std::function<std::time_t()>;

    PdfRenderer(std::shared_ptr<const Renderer> markup,
                std::shared_ptr<const backend::NativeBackend> native,
                Clock clock = nullptr);

    std::string render(const ResumeContent& content, const RenderingConfig& config) const override;

    // Built-in writer only, no backend probe.
    std::string render_fallback(const std::string& markup, const ResumeContent& content,
                                const RenderingConfig& config) const;

private:
    std::shared_ptr<const Renderer> markup_;
    std::shared_ptr<const backend::NativeBackend> native_;
    Clock clock_;  // null: no /CreationDate, output is byte-for-byte reproducible
};

}  // namespace cvpress
