#pragma once

#include <string>

namespace ocr_layout {

// Stages run in declaration order; each one can be switched off.
struct NormalizeOptions {
    bool collapse_whitespace = true;
    bool fix_ocr_confusions = true;   // lossy: rewrites digits 0 and 1
    bool capitalize_sentences = true;
};

class TextNormalizer {
public:
    explicit TextNormalizer(const NormalizeOptions& options = NormalizeOptions{});

    std::string clean(const std::string& text) const;

    // Every whitespace run, line breaks included, becomes one space; the
    // ends are trimmed
    static std::string collapse_whitespace(const std::string& text);

    // '|' -> 'I', '0' -> 'O', '1' -> 'l'
    static std::string fix_ocr_confusions(std::string text);

    // Splits on ". ", drops blank fragments, upper-cases the first
    // character of each fragment and rejoins with ". ". The rest of each
    // fragment is left as is.
    static std::string capitalize_sentences(const std::string& text);

    const NormalizeOptions& options() const { return options_; }

private:
    NormalizeOptions options_;
};

} // namespace ocr_layout
