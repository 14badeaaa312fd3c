#pragma once

#include "ocr_layout/types.h"
#include <string>

namespace ocr_layout {

// characters: code points left after removing every ' ' (other
//             whitespace still counts)
// words:      whitespace-separated tokens
// sentences:  non-blank pieces between '.' characters
// paragraphs: non-blank pieces between '\n' characters
TextStatistics get_word_count(const std::string& text);

} // namespace ocr_layout
