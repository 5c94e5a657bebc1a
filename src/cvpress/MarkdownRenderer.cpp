#include "cvpress/MarkdownRenderer.hpp"

#include "cvpress/ContextBuilder.hpp"

namespace cvpress {

using ojson = nlohmann::ordered_json;

static std::string str(const ojson& j, const char* key) {
    if (!j.is_object()) return "";
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static std::string scalar(const ojson& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

static void append_bullets(std::string& out, const ojson& entry, const char* key) {
    if (!entry.contains(key)) return;
    for (const auto& b : entry[key]) out += "- " + scalar(b) + "\n";
}

// Nested values become indented "- key: value" lines.
static void append_value(std::string& out, const ojson& v, const std::string& indent) {
    if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_structured()) {
                out += indent + "-\n";
                append_value(out, item, indent + "  ");
            } else {
                out += indent + "- " + scalar(item) + "\n";
            }
        }
        return;
    }
    if (v.is_object()) {
        for (const auto& kv : v.items()) {
            if (kv.value().is_structured()) {
                out += indent + "- **" + kv.key() + "**\n";
                append_value(out, kv.value(), indent + "  ");
            } else {
                out += indent + "- **" + kv.key() + "**: " + scalar(kv.value()) + "\n";
            }
        }
        return;
    }
    out += indent + scalar(v) + "\n";
}

std::string render_markdown(const ojson& ctx) {
    std::string out;

    if (ctx.contains("basics")) {
        const ojson& b = ctx["basics"];
        const std::string name = str(b, "name");
        if (!name.empty()) out += "# " + name + "\n\n";
        const std::string label = str(b, "label");
        if (!label.empty()) out += label + "\n\n";

        std::string contact;
        for (const char* key : {"email", "phone", "url"}) {
            const std::string v = str(b, key);
            if (v.empty()) continue;
            if (!contact.empty()) contact += " | ";
            contact += v;
        }
        if (!contact.empty()) out += contact + "\n\n";

        const std::string summary = str(b, "summary");
        if (!summary.empty()) out += "## Summary\n\n" + summary + "\n\n";
    }

    for (const char* key : {"work", "education", "projects"}) {
        if (!ctx.contains(key)) continue;
        const ojson& sec = ctx[key];
        out += "## " + str(sec, "title") + "\n\n";
        for (const auto& e : sec["entries"]) {
            const std::string heading = str(e, "heading");
            if (!heading.empty()) out += "**" + heading + "**\n";
            const std::string dates = str(e, "dates");
            if (!dates.empty()) out += dates + "\n";
            const std::string summary = str(e, "summary");
            if (!summary.empty()) out += summary + "\n";
            const std::string description = str(e, "description");
            if (!description.empty()) out += description + "\n";
            append_bullets(out, e, "highlights");
            append_bullets(out, e, "courses");
            out += "\n";
        }
    }

    if (ctx.contains("skills")) {
        const ojson& sec = ctx["skills"];
        out += "## " + str(sec, "title") + "\n\n";
        for (const auto& e : sec["entries"]) {
            std::string line = "- ";
            const std::string name = str(e, "name");
            if (!name.empty()) line += "**" + name + "**";
            const std::string kw = str(e, "keywords_text");
            if (!kw.empty()) line += (name.empty() ? "" : ": ") + kw;
            out += line + "\n";
        }
        out += "\n";
    }

    if (ctx.contains("extra_sections")) {
        for (const auto& x : ctx["extra_sections"]) {
            out += "## " + str(x, "title") + "\n\n";
            append_value(out, x["value"], "");
            out += "\n";
        }
    }

    return out;
}

std::string MarkdownRenderer::render(const ResumeContent& content, const RenderingConfig&) const {
    return render_markdown(build_context(content));
}

}  // namespace cvpress
