#include "ocr_layout/paragraph_assembler.h"
#include "ocr_layout/text_utils.h"

namespace ocr_layout {

std::string ParagraphAssembler::join_lines(const std::vector<std::string>& lines) {
    std::vector<std::string> paragraphs;

    for (const auto& raw_line : lines) {
        std::string line = text_utils::trim(raw_line);
        if (!line.empty()) {
            paragraphs.push_back(line);
        }
    }

    return text_utils::join(paragraphs, "\n\n");
}

bool ParagraphAssembler::closes_paragraph(const std::string& line) {
    bool ends_sentence = text_utils::ends_with(line, ".") ||
                         text_utils::ends_with(line, "!") ||
                         text_utils::ends_with(line, "?");

    return text_utils::utf8_length(line) < kShortLineLength ||
           ends_sentence ||
           text_utils::is_upper(line) ||
           (text_utils::split_whitespace(line).size() <= 3 && text_utils::ends_with(line, "."));
}

std::string ParagraphAssembler::reflow_document(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    std::vector<std::string> cleaned_lines;
    for (const auto& line : text_utils::split(text, "\n")) {
        auto words = text_utils::split_whitespace(line);
        if (!words.empty()) {
            cleaned_lines.push_back(text_utils::join(words, " "));
        }
    }

    std::vector<std::string> paragraphs;
    std::vector<std::string> buffer;

    for (const auto& line : cleaned_lines) {
        buffer.push_back(line);
        if (closes_paragraph(line)) {
            paragraphs.push_back(text_utils::join(buffer, " "));
            buffer.clear();
        }
    }

    if (!buffer.empty()) {
        paragraphs.push_back(text_utils::join(buffer, " "));
    }

    std::string result = collapse_line_breaks(text_utils::join(paragraphs, "\n\n"));
    return text_utils::trim(result);
}

std::string ParagraphAssembler::collapse_line_breaks(std::string text) {
    std::string result;
    result.reserve(text.size());
    size_t run = 0;

    for (char c : text) {
        if (c == '\n') {
            if (++run > 2) {
                continue;
            }
        } else {
            run = 0;
        }
        result += c;
    }

    return result;
}

ParagraphMetrics ParagraphAssembler::measure(const std::string& text) {
    ParagraphMetrics metrics;
    size_t total_words = 0;

    for (const auto& paragraph : text_utils::split(text, "\n\n")) {
        if (text_utils::is_blank(paragraph)) {
            continue;
        }
        ++metrics.paragraph_count;
        total_words += text_utils::split_whitespace(paragraph).size();
    }

    if (metrics.paragraph_count > 0) {
        metrics.avg_paragraph_length =
            static_cast<double>(total_words) / static_cast<double>(metrics.paragraph_count);
    }

    return metrics;
}

} // namespace ocr_layout
