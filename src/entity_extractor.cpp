#include "ocr_layout/entity_extractor.h"

namespace ocr_layout {

namespace {

// Optional +country code, then 3-3-4 digits with optional parentheses
// around the area code and space, '.' or '-' separators
const char* const kPhonePattern =
    R"((?:\+\d{1,3}[-.\s]?)?\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4})";

const char* const kDatePattern = R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)";

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// \w in the "C" locale
bool is_word(char c) {
    return is_alpha(c) || is_digit(c) || c == '_';
}

bool word_boundary(const std::string& text, size_t pos) {
    bool before = pos > 0 && is_word(text[pos - 1]);
    bool after = pos < text.size() && is_word(text[pos]);
    return before != after;
}

bool is_email_local_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool is_email_domain_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '.' || c == '-';
}

// Loose on purpose: letters, digits, the '$'..'_' range and !*\(),
// so trailing punctuation stays attached
bool is_url_char(char c) {
    return is_alpha(c) || (c >= '$' && c <= '_') ||
           c == '!' || c == '*' || c == '\\' || c == '(' || c == ')' || c == ',';
}

size_t run_end(const std::string& text, size_t pos, bool (*accepts)(char)) {
    while (pos < text.size() && accepts(text[pos])) {
        ++pos;
    }
    return pos;
}

// End of "[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b" starting at domain_begin, or npos.
// The greedy domain part backtracks to the rightmost dot that works.
size_t match_email_domain(const std::string& text, size_t domain_begin) {
    size_t domain_end = run_end(text, domain_begin, is_email_domain_char);

    for (size_t dot = domain_end; dot > domain_begin + 1; --dot) {
        if (text[dot - 1] != '.') {
            continue;
        }
        size_t tld_begin = dot;
        size_t tld_end = run_end(text, tld_begin, is_alpha);
        // A shorter TLD would end between two letters, where \b cannot hold
        if (tld_end - tld_begin >= 2 && word_boundary(text, tld_end)) {
            return tld_end;
        }
    }
    return std::string::npos;
}

} // namespace

EntityExtractor::EntityExtractor()
    : phone_(kPhonePattern),
      date_(kDatePattern) {}

StructuredData EntityExtractor::extract(const std::string& text) const {
    StructuredData data;
    data.emails = emails(text);
    data.phone_numbers = phone_numbers(text);
    data.urls = urls(text);
    data.numbers = numbers(text);
    data.dates = dates(text);
    return data;
}

std::vector<std::string> EntityExtractor::emails(const std::string& text) const {
    std::vector<std::string> matches;
    size_t pos = 0;

    while (pos < text.size()) {
        if (!is_email_local_char(text[pos])) {
            ++pos;
            continue;
        }

        // Every start inside this run reaches the same '@' and domain, so
        // the leftmost start with a word boundary decides for all of them
        size_t local_end = run_end(text, pos, is_email_local_char);
        size_t start = pos;
        while (start < local_end && !word_boundary(text, start)) {
            ++start;
        }

        if (start < local_end && local_end < text.size() && text[local_end] == '@') {
            size_t end = match_email_domain(text, local_end + 1);
            if (end != std::string::npos) {
                matches.push_back(text.substr(start, end - start));
                pos = end;
                continue;
            }
        }
        pos = local_end;
    }

    return matches;
}

std::vector<std::string> EntityExtractor::urls(const std::string& text) const {
    std::vector<std::string> matches;
    size_t pos = 0;

    while ((pos = text.find("http", pos)) != std::string::npos) {
        size_t scheme_end = pos + 4;
        if (scheme_end < text.size() && text[scheme_end] == 's') {
            ++scheme_end;
        }

        if (text.compare(scheme_end, 3, "://") == 0) {
            size_t body = scheme_end + 3;
            size_t end = run_end(text, body, is_url_char);
            if (end > body) {
                matches.push_back(text.substr(pos, end - pos));
                pos = end;
                continue;
            }
        }
        ++pos;
    }

    return matches;
}

std::vector<std::string> EntityExtractor::numbers(const std::string& text) const {
    std::vector<std::string> matches;
    size_t pos = 0;

    while (pos < text.size()) {
        if (!is_digit(text[pos])) {
            ++pos;
            continue;
        }

        size_t int_end = run_end(text, pos, is_digit);
        // Starts inside a digit run have no boundary before them
        if (!word_boundary(text, pos)) {
            pos = int_end;
            continue;
        }

        size_t end = std::string::npos;
        if (int_end + 1 < text.size() && text[int_end] == '.' && is_digit(text[int_end + 1])) {
            size_t frac_end = run_end(text, int_end + 1, is_digit);
            if (word_boundary(text, frac_end)) {
                end = frac_end;
            }
        }
        if (end == std::string::npos && word_boundary(text, int_end)) {
            end = int_end;
        }

        if (end != std::string::npos) {
            matches.push_back(text.substr(pos, end - pos));
        }
        pos = end != std::string::npos ? end : int_end;
    }

    return matches;
}

std::vector<std::string> EntityExtractor::find_all(const std::regex& pattern,
                                                   const std::string& text) {
    std::vector<std::string> matches;
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    auto end = std::sregex_iterator();

    for (auto it = begin; it != end; ++it) {
        matches.push_back(it->str());
    }

    return matches;
}

} // namespace ocr_layout
