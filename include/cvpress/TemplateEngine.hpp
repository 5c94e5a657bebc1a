#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace cvpress {

class TemplateEngine {
public:
    virtual ~TemplateEngine() = default;

    // Throws InputError on malformed template text or a missing variable.
    virtual std::string render(const std::string& template_text,
                               const nlohmann::ordered_json& context) const = 0;
};

// Jinja-style templates through inja. Values are written as-is; templates
// call escape(x) for text and emit pre-built HTML (extra sections, css) raw.
// Missing names are errors, so optional values are guarded with
// exists("name") / existsIn(obj, "key").
class InjaEngine final : public TemplateEngine {
public:
    std::string render(const std::string& template_text,
                       const nlohmann::ordered_json& context) const override;
};

}  // namespace cvpress
