#pragma once

#include "ocr_layout/recognition_engine.h"
#include "ocr_layout/types.h"
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace ocr_layout {

struct ExtractorOptions {
    size_t thread_count = std::thread::hardware_concurrency();  // extract_batch workers
    bool verbose = false;
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Outer extraction boundary: runs the engine, filters tokens, assembles
// lines and paragraphs. None of the extract_* calls throw; every failure
// comes back as success == false with the message in error.
class OcrExtractor {
public:
    static constexpr double kDefaultThreshold = 60.0;

    explicit OcrExtractor(std::shared_ptr<RecognitionEngine> engine,
                          const ExtractorOptions& options = ExtractorOptions{});
    ~OcrExtractor();

    ExtractionResult extract_text(const std::string& image,
                                  const std::string& language = "eng",
                                  const std::string& profile = "default",
                                  double confidence_threshold = kDefaultThreshold);

    // "document" profile, then ParagraphAssembler::reflow_document on the text
    ExtractionResult extract_long_text(const std::string& image,
                                       const std::string& language = "eng",
                                       double confidence_threshold = kDefaultThreshold);

    // extract_long_text plus paragraph_count and avg_paragraph_length
    ExtractionResult extract_text_optimized_for_paragraphs(const std::string& image,
                                                           const std::string& language = "eng",
                                                           double confidence_threshold = kDefaultThreshold);

    // Every non-blank token with confidence > 0; empty on engine failure
    std::vector<RecognizedWord> extract_text_with_boxes(const std::string& image,
                                                        const std::string& language = "eng",
                                                        const std::string& profile = "default");

    // Best mean confidence among a fixed candidate list, "eng" unless it beats 30
    std::string detect_language(const std::string& image);

    std::vector<std::string> get_available_languages();

    // Independent extract_text calls on the worker pool, results in input order
    std::vector<ExtractionResult> extract_batch(const std::vector<std::string>& images,
                                                const std::string& language = "eng",
                                                const std::string& profile = "default",
                                                double confidence_threshold = kDefaultThreshold,
                                                ProgressCallback progress = nullptr);

    nlohmann::json get_stats() const;

    // Reconstruction without the engine, for tokens obtained elsewhere.
    // Malformed tokens yield a failed result.
    static ExtractionResult from_tokens(const std::vector<Token>& tokens,
                                        double confidence_threshold,
                                        const std::string& language = "eng",
                                        const std::string& profile = "default");

    static ExtractionResult failure(const std::string& message,
                                    const std::string& language,
                                    const std::string& profile);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ocr_layout
