#include "ocr_layout/text_normalizer.h"
#include "ocr_layout/text_utils.h"
#include <cctype>
#include <vector>

namespace ocr_layout {

TextNormalizer::TextNormalizer(const NormalizeOptions& options) : options_(options) {}

std::string TextNormalizer::clean(const std::string& text) const {
    if (text.empty()) {
        return "";
    }

    std::string result = text;
    if (options_.collapse_whitespace) {
        result = collapse_whitespace(result);
    }
    if (options_.fix_ocr_confusions) {
        result = fix_ocr_confusions(std::move(result));
    }
    if (options_.capitalize_sentences) {
        result = capitalize_sentences(result);
    }
    return result;
}

std::string TextNormalizer::collapse_whitespace(const std::string& text) {
    return text_utils::join(text_utils::split_whitespace(text), " ");
}

std::string TextNormalizer::fix_ocr_confusions(std::string text) {
    for (char& c : text) {
        switch (c) {
            case '|': c = 'I'; break;
            case '0': c = 'O'; break;
            case '1': c = 'l'; break;
            default: break;
        }
    }
    return text;
}

std::string TextNormalizer::capitalize_sentences(const std::string& text) {
    std::vector<std::string> sentences;

    for (auto& fragment : text_utils::split(text, ". ")) {
        if (text_utils::is_blank(fragment)) {
            continue;
        }
        unsigned char first = static_cast<unsigned char>(fragment[0]);
        if (first < 0x80) {
            fragment[0] = static_cast<char>(std::toupper(first));
        }
        sentences.push_back(std::move(fragment));
    }

    return text_utils::join(sentences, ". ");
}

} // namespace ocr_layout
