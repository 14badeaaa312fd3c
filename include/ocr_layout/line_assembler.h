#pragma once

#include "ocr_layout/types.h"
#include <string>
#include <vector>

namespace ocr_layout {

// Tokens sharing a vertical band, in arrival order
struct Line {
    std::vector<Token> tokens;

    std::string text() const;
};

// Groups tokens into lines with a single greedy pass.
//
// Precondition: tokens arrive in raster order (left to right inside a
// line, top to bottom across lines). The order is not checked and the
// assembler never reclusters: a token joins the open line when its top
// edge is within half of the line's reference height from the line's
// reference top, otherwise it opens a new line and becomes the new
// reference.
//
// Token text is trimmed; tokens that are blank after trimming are skipped.
class LineAssembler {
public:
    static constexpr double kBandRatio = 0.5;

    std::vector<Line> assemble(const std::vector<Token>& tokens) const;

    // Convenience: the rendered text of every assembled line
    std::vector<std::string> assemble_text(const std::vector<Token>& tokens) const;
};

} // namespace ocr_layout
