#include "ocr_layout/line_assembler.h"
#include "ocr_layout/text_utils.h"
#include <cstdlib>

namespace ocr_layout {

std::string Line::text() const {
    std::string result;
    for (const auto& token : tokens) {
        if (!result.empty()) {
            result += ' ';
        }
        result += token.text;
    }
    return result;
}

std::vector<Line> LineAssembler::assemble(const std::vector<Token>& tokens) const {
    std::vector<Line> lines;
    Line current;
    int line_y = 0;
    int line_h = 0;

    for (const auto& token : tokens) {
        std::string text = text_utils::trim(token.text);
        if (text.empty()) {
            continue;
        }

        Token kept = token;
        kept.text = std::move(text);

        if (current.tokens.empty()) {
            line_y = kept.y;
            line_h = kept.height;
        } else if (std::abs(kept.y - line_y) > line_h * kBandRatio) {
            lines.push_back(std::move(current));
            current = Line();
            line_y = kept.y;
            line_h = kept.height;
        }

        current.tokens.push_back(std::move(kept));
    }

    if (!current.tokens.empty()) {
        lines.push_back(std::move(current));
    }

    return lines;
}

std::vector<std::string> LineAssembler::assemble_text(const std::vector<Token>& tokens) const {
    std::vector<std::string> texts;
    for (const auto& line : assemble(tokens)) {
        texts.push_back(line.text());
    }
    return texts;
}

} // namespace ocr_layout
