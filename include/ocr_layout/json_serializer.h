#pragma once

#include "ocr_layout/types.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ocr_layout {

// nlohmann::json conversions, found through ADL
void to_json(nlohmann::json& j, const BoundingBox& box);
void from_json(const nlohmann::json& j, BoundingBox& box);

void to_json(nlohmann::json& j, const Token& token);
void from_json(const nlohmann::json& j, Token& token);

void to_json(nlohmann::json& j, const RecognizedWord& word);
void to_json(nlohmann::json& j, const ExtractionResult& result);
void to_json(nlohmann::json& j, const StructuredData& data);
void to_json(nlohmann::json& j, const TextStatistics& stats);

class JsonSerializer {
public:
    // Accepts either an array of token objects
    //   [{"text": ..., "confidence": ..., "x": ..., "y": ..., "width": ..., "height": ...}]
    // or the engine's column layout
    //   {"text": [...], "conf": [...], "left": [...], "top": [...], "width": [...], "height": [...]}
    // Missing keys or mismatched column lengths throw.
    static std::vector<Token> tokens_from_json(const nlohmann::json& document);

    static std::string serialize(const nlohmann::json& document, bool pretty = true);
};

} // namespace ocr_layout
