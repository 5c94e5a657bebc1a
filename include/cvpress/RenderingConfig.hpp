#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace cvpress {

struct RenderingConfig {
    std::string format = "binary";   // markup | binary | external-toolchain | markdown (or an alias)
    std::string theme = "default";

    // Literal template text. When non-empty it wins over `theme`.
    std::string custom_template;

    // Stylesheet text. When non-empty it wins over the theme stylesheet.
    std::string custom_css;

    std::string output_path;         // empty: caller keeps the bytes
    std::string page_size = "letter";

    bool strict_theme = false;       // unknown theme throws instead of falling back
    bool native_backend = true;      // false skips the converter probe
};

// Missing keys keep their defaults; unknown keys are ignored.
RenderingConfig rendering_config_from_json(const nlohmann::json& j, RenderingConfig base = {});

nlohmann::json rendering_config_to_json(const RenderingConfig& cfg);

}  // namespace cvpress
