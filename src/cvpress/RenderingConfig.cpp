#include "cvpress/RenderingConfig.hpp"

namespace cvpress {

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean()) out = j[key].get<bool>();
}

RenderingConfig rendering_config_from_json(const nlohmann::json& j, RenderingConfig base) {
    if (!j.is_object()) return base;

    read_string(j, "format", base.format);
    read_string(j, "theme", base.theme);
    read_string(j, "custom_template", base.custom_template);
    read_string(j, "custom_css", base.custom_css);
    read_string(j, "output_path", base.output_path);
    read_string(j, "page_size", base.page_size);
    read_bool(j, "strict_theme", base.strict_theme);
    read_bool(j, "native_backend", base.native_backend);

    return base;
}

nlohmann::json rendering_config_to_json(const RenderingConfig& cfg) {
    nlohmann::json j;
    j["format"] = cfg.format;
    j["theme"] = cfg.theme;
    if (!cfg.custom_template.empty()) j["custom_template"] = cfg.custom_template;
    if (!cfg.custom_css.empty()) j["custom_css"] = cfg.custom_css;
    if (!cfg.output_path.empty()) j["output_path"] = cfg.output_path;
    j["page_size"] = cfg.page_size;
    j["strict_theme"] = cfg.strict_theme;
    j["native_backend"] = cfg.native_backend;
    return j;
}

}  // namespace cvpress
