#pragma once

#include "ocr_layout/types.h"
#include <vector>

namespace ocr_layout {

// Keeps tokens whose confidence is strictly above the threshold.
// A threshold of 0 still drops tokens reported at exactly 0 (and the
// engine's -1 "no word" rows).
class TokenFilter {
public:
    explicit TokenFilter(double threshold) : threshold_(threshold) {}

    bool accepts(const Token& token) const { return token.confidence > threshold_; }

    std::vector<Token> apply(const std::vector<Token>& tokens) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

// Throws MalformedTokenError for negative geometry or a non-finite
// confidence
void validate_token(const Token& token);

} // namespace ocr_layout
