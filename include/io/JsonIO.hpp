#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "cvpress/Models.hpp"
#include "cvpress/RenderingConfig.hpp"

// JSON Resume document -> ResumeContent. Missing or mistyped leaf fields are
// skipped; a core section of the wrong container type throws InputError.
// "meta" and "$schema" are dropped, every other unknown top-level key becomes
// an extra section in document order.
cvpress::ResumeContent resume_content_from_json(const nlohmann::ordered_json& j);

// Throws InputError if the file cannot be opened or parsed.
cvpress::ResumeContent load_resume_content(const std::string& path);

// Config file values are layered over `base`.
cvpress::RenderingConfig load_rendering_config(const std::string& path, cvpress::RenderingConfig base = {});

// Whole file as bytes. Throws InputError naming `what` on failure.
std::string read_text_file(const std::string& path, const std::string& what);
