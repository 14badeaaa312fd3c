#pragma once

#include <stdexcept>
#include <string>

namespace ocr_layout {

// Raised when the recognition engine cannot produce tokens for an image.
class RecognitionError : public std::runtime_error {
public:
    explicit RecognitionError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when a token is missing a field or carries an impossible value.
class MalformedTokenError : public std::invalid_argument {
public:
    explicit MalformedTokenError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace ocr_layout
