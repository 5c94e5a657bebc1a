#include "cvpress/PdfRenderer.hpp"

#include "cvpress/Errors.hpp"
#include "cvpress/HtmlRenderer.hpp"
#include "pdf/DocumentWriter.hpp"
#include "pdf/HtmlFlattener.hpp"
#include "pdf/TextLayout.hpp"

namespace cvpress {

PdfRenderer::PdfRenderer(std::shared_ptr<const Renderer> markup,
                         std::shared_ptr<const backend::NativeBackend> native,
                         Clock clock)
    : markup_(std::move(markup)), native_(std::move(native)), clock_(std::move(clock)) {
    if (!markup_) markup_ = std::make_shared<const HtmlRenderer>(nullptr, nullptr);
    if (!native_) native_ = std::make_shared<const backend::NullNativeBackend>();
}

static const pdf::PageProfile& require_profile(const std::string& page_size) {
    const pdf::PageProfile* profile = pdf::find_page_profile(page_size);
    if (!profile) {
        throw Error("unknown page size '" + page_size + "' (available: " +
                    join_names(pdf::page_profile_names()) + ")");
    }
    return *profile;
}

std::string PdfRenderer::render(const ResumeContent& content, const RenderingConfig& config) const {
    // checked before any work so a typo never reaches the converter
    require_profile(config.page_size);

    const std::string markup = markup_->render(content, config);

    if (config.native_backend) {
        backend::BackendResult res = native_->try_render(markup, config);
        switch (res.status) {
            case backend::BackendStatus::Success:
                return std::move(res.bytes);
            case backend::BackendStatus::Failure:
                // the message names the converter that ran
                throw BackendFailureError("native backend failed: " + res.message);
            case backend::BackendStatus::Unavailable:
                break;
        }
    }

    return render_fallback(markup, content, config);
}

std::string PdfRenderer::render_fallback(const std::string& markup, const ResumeContent& content,
                                         const RenderingConfig& config) const {
    const pdf::PageProfile& profile = require_profile(config.page_size);

    pdf::DocumentInfo info;
    info.title = content.basics.name;
    info.producer = "cvpress";
    if (clock_) info.creation_date = pdf::pdf_date(clock_());

    // a custom template may emit plain text; lay it out line by line
    const bool has_tags = markup.find('<') != std::string::npos;
    return pdf::serialize(has_tags ? pdf::flatten_html(markup) : pdf::flatten_text(markup), profile, info);
}

}  // namespace cvpress
