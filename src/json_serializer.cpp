#include "ocr_layout/json_serializer.h"
#include "ocr_layout/errors.h"

namespace ocr_layout {

void to_json(nlohmann::json& j, const BoundingBox& box) {
    j = nlohmann::json{
        {"x", box.x},
        {"y", box.y},
        {"width", box.width},
        {"height", box.height}
    };
}

void from_json(const nlohmann::json& j, BoundingBox& box) {
    j.at("x").get_to(box.x);
    j.at("y").get_to(box.y);
    j.at("width").get_to(box.width);
    j.at("height").get_to(box.height);
}

void to_json(nlohmann::json& j, const Token& token) {
    j = nlohmann::json{
        {"text", token.text},
        {"confidence", token.confidence},
        {"x", token.x},
        {"y", token.y},
        {"width", token.width},
        {"height", token.height}
    };
}

void from_json(const nlohmann::json& j, Token& token) {
    j.at("text").get_to(token.text);
    j.at("confidence").get_to(token.confidence);
    j.at("x").get_to(token.x);
    j.at("y").get_to(token.y);
    j.at("width").get_to(token.width);
    j.at("height").get_to(token.height);
}

void to_json(nlohmann::json& j, const RecognizedWord& word) {
    j = nlohmann::json{
        {"text", word.text},
        {"confidence", word.confidence},
        {"bbox", word.bbox}
    };
}

void to_json(nlohmann::json& j, const ExtractionResult& result) {
    j = nlohmann::json{
        {"text", result.text},
        {"lines", result.lines},
        {"confidence", result.confidence},
        {"confidence_scores", result.confidence_scores},
        {"bounding_boxes", result.bounding_boxes},
        {"language", result.language},
        {"config", result.config},
        {"success", result.success}
    };

    if (result.error) {
        j["error"] = *result.error;
    }
    if (result.paragraph_count) {
        j["paragraph_count"] = *result.paragraph_count;
    }
    if (result.avg_paragraph_length) {
        j["avg_paragraph_length"] = *result.avg_paragraph_length;
    }
}

void to_json(nlohmann::json& j, const StructuredData& data) {
    j = nlohmann::json{
        {"emails", data.emails},
        {"phone_numbers", data.phone_numbers},
        {"urls", data.urls},
        {"numbers", data.numbers},
        {"dates", data.dates}
    };
}

void to_json(nlohmann::json& j, const TextStatistics& stats) {
    j = nlohmann::json{
        {"characters", stats.characters},
        {"words", stats.words},
        {"sentences", stats.sentences},
        {"paragraphs", stats.paragraphs}
    };
}

std::vector<Token> JsonSerializer::tokens_from_json(const nlohmann::json& document) {
    if (document.is_array()) {
        return document.get<std::vector<Token>>();
    }

    if (!document.is_object()) {
        throw MalformedTokenError("Token document must be an array or an object");
    }

    const auto& texts = document.at("text");
    const auto& confs = document.at("conf");
    const auto& lefts = document.at("left");
    const auto& tops = document.at("top");
    const auto& widths = document.at("width");
    const auto& heights = document.at("height");

    size_t count = texts.size();
    if (confs.size() != count || lefts.size() != count || tops.size() != count ||
        widths.size() != count || heights.size() != count) {
        throw MalformedTokenError("Token columns have different lengths");
    }

    std::vector<Token> tokens;
    tokens.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        Token token;
        texts.at(i).get_to(token.text);
        confs.at(i).get_to(token.confidence);
        lefts.at(i).get_to(token.x);
        tops.at(i).get_to(token.y);
        widths.at(i).get_to(token.width);
        heights.at(i).get_to(token.height);
        tokens.push_back(std::move(token));
    }

    return tokens;
}

std::string JsonSerializer::serialize(const nlohmann::json& document, bool pretty) {
    return pretty ? document.dump(2) : document.dump();
}

} // namespace ocr_layout
