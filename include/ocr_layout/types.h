#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ocr_layout {

struct BoundingBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

// One recognized fragment as reported by the recognition engine.
// Origin is top-left, y grows downward, confidence is on a 0-100 scale.
struct Token {
    std::string text;
    double confidence = 0.0;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    BoundingBox bbox() const { return {x, y, width, height}; }
};

// A token kept for visualization (see OcrExtractor::extract_text_with_boxes)
struct RecognizedWord {
    std::string text;
    double confidence = 0.0;
    BoundingBox bbox;
};

struct ExtractionResult {
    std::string text;
    std::vector<std::string> lines;
    double confidence = 0.0;
    std::vector<double> confidence_scores;   // index-aligned with bounding_boxes
    std::vector<BoundingBox> bounding_boxes;
    std::string language;
    std::string config;
    bool success = false;
    std::optional<std::string> error;

    // Only set by OcrExtractor::extract_text_optimized_for_paragraphs
    std::optional<size_t> paragraph_count;
    std::optional<double> avg_paragraph_length;
};

struct StructuredData {
    std::vector<std::string> emails;
    std::vector<std::string> phone_numbers;
    std::vector<std::string> urls;
    std::vector<std::string> numbers;
    std::vector<std::string> dates;
};

struct TextStatistics {
    size_t characters = 0;
    size_t words = 0;
    size_t sentences = 0;
    size_t paragraphs = 0;

    bool operator==(const TextStatistics& other) const {
        return characters == other.characters && words == other.words &&
               sentences == other.sentences && paragraphs == other.paragraphs;
    }
};

} // namespace ocr_layout
