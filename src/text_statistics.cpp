#include "ocr_layout/text_statistics.h"
#include "ocr_layout/text_utils.h"

namespace ocr_layout {

namespace {

size_t count_non_blank(const std::string& text, const std::string& separator) {
    size_t count = 0;
    for (const auto& piece : text_utils::split(text, separator)) {
        if (!text_utils::is_blank(piece)) {
            ++count;
        }
    }
    return count;
}

} // namespace

TextStatistics get_word_count(const std::string& text) {
    TextStatistics stats;
    if (text.empty()) {
        return stats;
    }

    std::string without_spaces;
    without_spaces.reserve(text.size());
    for (char c : text) {
        if (c != ' ') {
            without_spaces += c;
        }
    }

    stats.characters = text_utils::utf8_length(without_spaces);
    stats.words = text_utils::split_whitespace(text).size();
    stats.sentences = count_non_blank(text, ".");
    stats.paragraphs = count_non_blank(text, "\n");
    return stats;
}

} // namespace ocr_layout
