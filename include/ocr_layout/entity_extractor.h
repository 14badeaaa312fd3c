#pragma once

#include "ocr_layout/types.h"
#include <regex>
#include <string>
#include <vector>

namespace ocr_layout {

// Five independent scans over the same text. Each category keeps every
// match in order of appearance, duplicates included, and the categories
// may overlap (a phone number's digits also show up under numbers).
//
// Phones and dates use std::regex; their matches are bounded in length.
// Emails, URLs and numbers have unbounded runs, which overflow the stack
// of the recursive std::regex executor on long input, so those three are
// hand-written scanners returning what these patterns would match:
//   email   \b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b
//   url     https?://[URL character]+   (see is_url_char)
//   number  \b\d+(?:\.\d+)?\b
//
// Patterns are compiled once; a single instance can be shared between
// threads since extraction only reads them.
class EntityExtractor {
public:
    EntityExtractor();

    StructuredData extract(const std::string& text) const;

    std::vector<std::string> emails(const std::string& text) const;
    std::vector<std::string> phone_numbers(const std::string& text) const { return find_all(phone_, text); }
    std::vector<std::string> urls(const std::string& text) const;
    std::vector<std::string> numbers(const std::string& text) const;
    std::vector<std::string> dates(const std::string& text) const { return find_all(date_, text); }

private:
    static std::vector<std::string> find_all(const std::regex& pattern, const std::string& text);

    std::regex phone_;
    std::regex date_;
};

} // namespace ocr_layout
