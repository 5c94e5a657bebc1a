#pragma once

#include <string>
#include <vector>

#include "pdf/TextLayout.hpp"

namespace pdf {

// Reduces HTML to ordered text fragments with a style hint per block:
//   h1 -> Title, h2 -> Heading, h3..h6 and dt -> Subheading, li -> Bullet,
//   everything else -> Body.
// <head>, <style>, <script> contents are dropped, entities decoded,
// whitespace collapsed. Never fails: unknown or unbalanced tags are ignored.
std::vector<TextFragment> flatten_html(const std::string& html);

// One Body fragment per non-blank line.
std::vector<TextFragment> flatten_text(const std::string& text);

// &amp; &lt; &gt; &quot; &apos; &#39; &nbsp; and numeric references; unknown ones stay literal.
std::string decode_entities(const std::string& s);

}  // namespace pdf
