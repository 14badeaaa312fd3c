#include "ocr_layout/token_filter.h"
#include "ocr_layout/errors.h"
#include <cmath>

namespace ocr_layout {

std::vector<Token> TokenFilter::apply(const std::vector<Token>& tokens) const {
    std::vector<Token> kept;
    kept.reserve(tokens.size());

    for (const auto& token : tokens) {
        if (accepts(token)) {
            kept.push_back(token);
        }
    }

    return kept;
}

void validate_token(const Token& token) {
    if (!std::isfinite(token.confidence)) {
        throw MalformedTokenError("Token '" + token.text + "' has a non-finite confidence");
    }
    if (token.x < 0 || token.y < 0 || token.width < 0 || token.height < 0) {
        throw MalformedTokenError("Token '" + token.text + "' has negative geometry");
    }
}

} // namespace ocr_layout
