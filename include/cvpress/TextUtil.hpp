#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);

// true for "", spaces, tabs, CR/LF
bool is_blank(const std::string& s);

std::string to_lower_copy(std::string s);

// & < > " ' escaped for HTML text and attribute values
std::string html_escape(const std::string& s);

// split on runs of ASCII whitespace, dropping empty pieces
std::vector<std::string> split_words(const std::string& s);

// number of UTF-8 code points (continuation bytes are not counted)
std::size_t utf8_length(const std::string& s);

// decode UTF-8 into code points; malformed bytes become U+FFFD
std::vector<char32_t> utf8_decode(const std::string& s);

// append code point `cp` as UTF-8
void utf8_append(std::string& out, char32_t cp);

}
