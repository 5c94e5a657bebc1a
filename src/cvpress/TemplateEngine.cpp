#include "cvpress/TemplateEngine.hpp"

#include "cvpress/Errors.hpp"
#include "cvpress/TextUtil.hpp"

#include <inja/inja.hpp>

#include <string>

namespace cvpress {

static nlohmann::json escape_value(const nlohmann::json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return textutil::html_escape(v.get<std::string>());
    return textutil::html_escape(v.dump());
}

std::string InjaEngine::render(const std::string& template_text, const nlohmann::ordered_json& context) const {
    // inja renders over nlohmann::json; key order only matters for objects,
    // and every ordered sequence in the context is an array.
    const nlohmann::json data = nlohmann::json::parse(context.dump());

    inja::Environment env;
    env.set_trim_blocks(true);
    env.add_callback("escape", 1, [](inja::Arguments& args) { return escape_value(*args.at(0)); });

    try {
        return env.render(template_text, data);
    } catch (const inja::InjaError& e) {
        throw InputError("template: " + std::string(e.what()));
    }
}

}  // namespace cvpress
