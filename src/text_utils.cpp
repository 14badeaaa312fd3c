#include "ocr_layout/text_utils.h"

namespace ocr_layout {
namespace text_utils {

namespace {

// Decodes the code point at pos and advances past it. Each malformed
// byte decodes to U+FFFD.
char32_t next_code_point(const std::string& text, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;

    if (length == 1) {
        ++pos;
        return lead;
    }
    if (length == 0 || pos + length > text.size()) {
        ++pos;
        return 0xFFFD;
    }

    char32_t cp = lead & (0x7F >> length);
    for (size_t i = 1; i < length; ++i) {
        unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    pos += length;
    return cp;
}

// 1 uppercase, -1 lowercase, 0 uncased. Cased letters are known for Latin
// (through Extended-A), Greek and Cyrillic; anything else counts as uncased.
int letter_case(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return 1;
    if (cp >= 'a' && cp <= 'z') return -1;
    if (cp < 0x80) return 0;

    // Latin-1 Supplement
    if (cp == 0xAA || cp == 0xB5 || cp == 0xBA) return -1;
    if (cp >= 0xC0 && cp <= 0xDE) return cp == 0xD7 ? 0 : 1;
    if (cp >= 0xDF && cp <= 0xFF) return cp == 0xF7 ? 0 : -1;

    // Latin Extended-A: upper/lower pairs, with the parity flipping twice
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) return cp % 2 == 0 ? 1 : -1;
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) return cp % 2 == 1 ? 1 : -1;
    if (cp == 0x138 || cp == 0x149 || cp == 0x17F) return -1;
    if (cp == 0x178) return 1;

    // Greek
    if (cp == 0x38B || cp == 0x38D || cp == 0x3A2) return 0;
    if (cp == 0x386 || (cp >= 0x388 && cp <= 0x3AB)) return 1;
    if (cp == 0x390 || (cp >= 0x3AC && cp <= 0x3CE)) return -1;

    // Cyrillic and Cyrillic Supplement
    if (cp >= 0x400 && cp <= 0x42F) return 1;
    if (cp >= 0x430 && cp <= 0x45F) return -1;
    if ((cp >= 0x460 && cp <= 0x481) || (cp >= 0x48A && cp <= 0x4BF) || (cp >= 0x4D0 && cp <= 0x52F)) {
        return cp % 2 == 0 ? 1 : -1;
    }
    if (cp == 0x4C0) return 1;
    if (cp >= 0x4C1 && cp <= 0x4CE) return cp % 2 == 1 ? 1 : -1;
    if (cp == 0x4CF) return -1;

    return 0;
}

} // namespace

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    for (char c : text) {
        if (is_space(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }

    return words;
}

std::vector<std::string> split(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.push_back(text);
        return parts;
    }

    size_t start = 0;
    size_t pos;
    while ((pos = text.find(separator, start)) != std::string::npos) {
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    parts.push_back(text.substr(start));

    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

size_t utf8_length(const std::string& text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower_ascii(std::string text) {
    for (char& c : text) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return text;
}

bool is_upper(const std::string& text) {
    bool has_upper = false;
    size_t pos = 0;
    while (pos < text.size()) {
        int letter = letter_case(next_code_point(text, pos));
        if (letter < 0) {
            return false;
        }
        if (letter > 0) {
            has_upper = true;
        }
    }
    return has_upper;
}

} // namespace text_utils
} // namespace ocr_layout
