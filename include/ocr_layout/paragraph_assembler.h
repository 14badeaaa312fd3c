#pragma once

#include <string>
#include <vector>

namespace ocr_layout {

struct ParagraphMetrics {
    size_t paragraph_count = 0;
    double avg_paragraph_length = 0.0;  // words per paragraph
};

class ParagraphAssembler {
public:
    // Simple joiner: every non-blank line becomes its own paragraph and
    // paragraphs are joined by "\n\n". Blank lines only separate.
    static std::string join_lines(const std::vector<std::string>& lines);

    // Document heuristic. Re-segments text whose lines are separated by
    // '\n': every cleaned line is appended to the open paragraph, which is
    // closed right after a line that is short (< 50 code points), ends in
    // '.', '!' or '?', or is all caps. Paragraphs are joined by "\n\n".
    static std::string reflow_document(const std::string& text);

    // Line closes the paragraph it was appended to
    static bool closes_paragraph(const std::string& cleaned_line);

    // Replaces every run of three line breaks by two until none is left
    static std::string collapse_line_breaks(std::string text);

    // Counts non-blank "\n\n"-separated paragraphs and their mean word count
    static ParagraphMetrics measure(const std::string& text);

    static constexpr size_t kShortLineLength = 50;
};

} // namespace ocr_layout
