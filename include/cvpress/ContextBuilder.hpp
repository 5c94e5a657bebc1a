#pragma once

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"
#include "cvpress/Models.hpp"

namespace cvpress {

// Containers nested deeper than this are flattened to their text leaves.
constexpr std::size_t kMaxNestingDepth = 32;

// null, blank strings, and arrays/objects whose members are all empty
bool is_empty_value(const nlohmann::ordered_json& v);

// Drops empty members at every level. An empty input yields null.
// Nesting is capped at kMaxNestingDepth: a deeper container becomes the
// ", "-joined string of its non-blank scalars. Uses no recursion, so any
// parseable value is accepted.
nlohmann::ordered_json prune_value(const nlohmann::ordered_json& v);

// "volunteering" -> "Volunteering", "side_projects" -> "Side Projects"
std::string title_from_key(const std::string& key);

// Minimal escaped HTML for an arbitrary value:
//   string -> <p>, array -> <ul><li>, object -> <dl><dt><dd> (recursively)
std::string extra_section_html(const nlohmann::ordered_json& value);

// Template-ready view of the resume. Layout:
//   basics            pruned basics (absent if empty)
//   work, education,
//   projects, skills  { "title": ..., "entries": [...] } only when non-empty
//   extra_sections    [ { "id", "title", "html", "value" } ] in encounter order
// Never throws for well-formed content.
nlohmann::ordered_json build_context(const ResumeContent& content);

}  // namespace cvpress
