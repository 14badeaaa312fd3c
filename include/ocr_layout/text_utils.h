#pragma once

#include <string>
#include <vector>

namespace ocr_layout {
namespace text_utils {

// ASCII whitespace test that is safe for bytes >= 0x80
bool is_space(char c);

std::string trim(const std::string& text);

// Splits on runs of whitespace, dropping empty pieces
std::vector<std::string> split_whitespace(const std::string& text);

// Splits on every occurrence of the separator, keeping empty pieces
std::vector<std::string> split(const std::string& text, const std::string& separator);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

bool is_blank(const std::string& text);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& text);

bool ends_with(const std::string& text, const std::string& suffix);

// Lowercases A-Z only; other bytes, UTF-8 included, pass through
std::string to_lower_ascii(std::string text);

// True when the text has an uppercase letter and no lowercase one. Case
// is known for Latin, Greek and Cyrillic letters; other scripts are
// treated as uncased.
bool is_upper(const std::string& text);

} // namespace text_utils
} // namespace ocr_layout
