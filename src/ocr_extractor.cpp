#include "ocr_layout/ocr_extractor.h"
#include "ocr_layout/errors.h"
#include "ocr_layout/line_assembler.h"
#include "ocr_layout/paragraph_assembler.h"
#include "ocr_layout/text_utils.h"
#include "ocr_layout/thread_pool.h"
#include "ocr_layout/token_filter.h"
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <numeric>

namespace ocr_layout {

namespace {

const char* const kDocumentProfile = "document";

const std::vector<std::string> kDetectionCandidates = {
    "eng", "fra", "deu", "spa", "ita", "por", "rus", "chi_sim", "jpn", "kor"
};

constexpr double kDetectionMinConfidence = 30.0;

const char* const kUnknownError = "Unknown recognition error";

ExtractionResult build_result(const std::vector<Token>& tokens,
                              double confidence_threshold,
                              const std::string& language,
                              const std::string& profile) {
    for (const auto& token : tokens) {
        validate_token(token);
    }

    auto kept = TokenFilter(confidence_threshold).apply(tokens);
    auto lines = LineAssembler().assemble(kept);

    ExtractionResult result;
    result.language = language;
    result.config = profile;

    for (const auto& line : lines) {
        result.lines.push_back(line.text());
        for (const auto& token : line.tokens) {
            result.confidence_scores.push_back(token.confidence);
            result.bounding_boxes.push_back(token.bbox());
        }
    }

    if (!result.confidence_scores.empty()) {
        double sum = std::accumulate(result.confidence_scores.begin(),
                                     result.confidence_scores.end(), 0.0);
        result.confidence = sum / static_cast<double>(result.confidence_scores.size());
    }

    result.text = ParagraphAssembler::join_lines(result.lines);
    result.success = true;
    return result;
}

} // namespace

class OcrExtractor::Impl {
public:
    Impl(std::shared_ptr<RecognitionEngine> engine, const ExtractorOptions& options)
        : engine_(std::move(engine)),
          options_(options),
          thread_pool_(options.thread_count) {
        if (!engine_) {
            throw std::invalid_argument("OcrExtractor requires a recognition engine");
        }
        stats_["extractions"] = 0;
        stats_["failures"] = 0;
        stats_["tokens_processed"] = 0;
        stats_["total_processing_time_ms"] = 0.0;
    }

    ExtractionResult extract_text(const std::string& image,
                                  const std::string& language,
                                  const std::string& profile,
                                  double confidence_threshold) {
        auto start_time = std::chrono::high_resolution_clock::now();
        size_t token_count = 0;
        ExtractionResult result;

        if (options_.verbose) {
            std::cout << "[OcrExtractor::extract_text] " << image << " (language: " << language
                      << ", profile: " << profile << ", threshold: " << confidence_threshold
                      << ")" << std::endl;
        }

        try {
            auto tokens = engine_->recognize(image, language, RecognitionProfiles::flags_for(profile));
            token_count = tokens.size();
            result = build_result(tokens, confidence_threshold, language, profile);

            if (options_.verbose) {
                std::cout << "[OcrExtractor::extract_text] " << token_count << " tokens -> "
                          << result.lines.size() << " lines, confidence "
                          << result.confidence << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[OcrExtractor::extract_text] Extraction failed for " << image
                      << ": " << e.what() << std::endl;
            result = OcrExtractor::failure(e.what(), language, profile);
        } catch (...) {
            std::cerr << "[OcrExtractor::extract_text] Extraction failed for " << image
                      << ": unknown error" << std::endl;
            result = OcrExtractor::failure(kUnknownError, language, profile);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> duration = end_time - start_time;
        record(result.success, token_count, duration.count());

        return result;
    }

    ExtractionResult extract_long_text(const std::string& image,
                                       const std::string& language,
                                       double confidence_threshold) {
        auto result = extract_text(image, language, kDocumentProfile, confidence_threshold);
        if (result.success) {
            result.text = ParagraphAssembler::reflow_document(result.text);
        }
        return result;
    }

    ExtractionResult extract_text_optimized_for_paragraphs(const std::string& image,
                                                           const std::string& language,
                                                           double confidence_threshold) {
        auto result = extract_long_text(image, language, confidence_threshold);
        if (result.success) {
            auto metrics = ParagraphAssembler::measure(result.text);
            result.paragraph_count = metrics.paragraph_count;
            result.avg_paragraph_length = metrics.avg_paragraph_length;
        }
        return result;
    }

    std::vector<RecognizedWord> extract_text_with_boxes(const std::string& image,
                                                        const std::string& language,
                                                        const std::string& profile) {
        std::vector<RecognizedWord> words;

        try {
            auto tokens = engine_->recognize(image, language, RecognitionProfiles::flags_for(profile));
            for (const auto& token : tokens) {
                validate_token(token);
                if (token.confidence <= 0) {
                    continue;
                }
                std::string text = text_utils::trim(token.text);
                if (text.empty()) {
                    continue;
                }
                words.push_back({text, token.confidence, token.bbox()});
            }
        } catch (const std::exception& e) {
            std::cerr << "[OcrExtractor::extract_text_with_boxes] " << image << ": "
                      << e.what() << std::endl;
            words.clear();
        } catch (...) {
            std::cerr << "[OcrExtractor::extract_text_with_boxes] " << image
                      << ": unknown error" << std::endl;
            words.clear();
        }

        return words;
    }

    std::string detect_language(const std::string& image) {
        std::string best_language;
        double best_confidence = 0.0;

        for (const auto& language : kDetectionCandidates) {
            auto result = extract_text(image, language, "default", 0.0);
            if (result.success && result.confidence > best_confidence) {
                best_confidence = result.confidence;
                best_language = language;
            }
        }

        if (options_.verbose) {
            std::cout << "[OcrExtractor::detect_language] best: "
                      << (best_language.empty() ? "none" : best_language)
                      << " (" << best_confidence << ")" << std::endl;
        }

        return best_confidence > kDetectionMinConfidence ? best_language : "eng";
    }

    std::vector<std::string> get_available_languages() {
        try {
            return engine_->available_languages();
        } catch (const std::exception& e) {
            std::cerr << "[OcrExtractor::get_available_languages] " << e.what() << std::endl;
            return {"eng"};
        } catch (...) {
            std::cerr << "[OcrExtractor::get_available_languages] unknown error" << std::endl;
            return {"eng"};
        }
    }

    std::vector<ExtractionResult> extract_batch(const std::vector<std::string>& images,
                                                const std::string& language,
                                                const std::string& profile,
                                                double confidence_threshold,
                                                ProgressCallback progress) {
        std::vector<std::future<ExtractionResult>> futures;
        std::atomic<size_t> completed{0};
        std::mutex progress_mutex;
        const size_t total = images.size();

        futures.reserve(total);
        for (const auto& image : images) {
            futures.push_back(thread_pool_.enqueue(
                [this, image, &language, &profile, confidence_threshold,
                 &completed, &progress_mutex, &progress, total]() {
                    auto result = extract_text(image, language, profile, confidence_threshold);
                    size_t done = ++completed;
                    if (progress) {
                        std::lock_guard<std::mutex> lock(progress_mutex);
                        progress(done, total);
                    }
                    return result;
                }));
        }

        std::vector<ExtractionResult> results;
        results.reserve(total);
        for (auto& future : futures) {
            results.push_back(future.get());
        }

        return results;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        int extractions = stats["extractions"].get<int>();
        if (extractions > 0) {
            stats["average_processing_time_ms"] =
                stats["total_processing_time_ms"].get<double>() / static_cast<double>(extractions);
        }

        return stats;
    }

private:
    void record(bool success, size_t token_count, double elapsed_ms) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_["extractions"] = stats_["extractions"].get<int>() + 1;
        if (!success) {
            stats_["failures"] = stats_["failures"].get<int>() + 1;
        }
        stats_["tokens_processed"] = stats_["tokens_processed"].get<size_t>() + token_count;
        stats_["total_processing_time_ms"] =
            stats_["total_processing_time_ms"].get<double>() + elapsed_ms;
    }

    std::shared_ptr<RecognitionEngine> engine_;
    ExtractorOptions options_;
    ThreadPool thread_pool_;
    mutable std::mutex stats_mutex_;
    nlohmann::json stats_;
};

OcrExtractor::OcrExtractor(std::shared_ptr<RecognitionEngine> engine,
                           const ExtractorOptions& options)
    : pImpl(std::make_unique<Impl>(std::move(engine), options)) {}

OcrExtractor::~OcrExtractor() = default;

ExtractionResult OcrExtractor::extract_text(const std::string& image,
                                            const std::string& language,
                                            const std::string& profile,
                                            double confidence_threshold) {
    return pImpl->extract_text(image, language, profile, confidence_threshold);
}

ExtractionResult OcrExtractor::extract_long_text(const std::string& image,
                                                 const std::string& language,
                                                 double confidence_threshold) {
    return pImpl->extract_long_text(image, language, confidence_threshold);
}

ExtractionResult OcrExtractor::extract_text_optimized_for_paragraphs(const std::string& image,
                                                                     const std::string& language,
                                                                     double confidence_threshold) {
    return pImpl->extract_text_optimized_for_paragraphs(image, language, confidence_threshold);
}

std::vector<RecognizedWord> OcrExtractor::extract_text_with_boxes(const std::string& image,
                                                                  const std::string& language,
                                                                  const std::string& profile) {
    return pImpl->extract_text_with_boxes(image, language, profile);
}

std::string OcrExtractor::detect_language(const std::string& image) {
    return pImpl->detect_language(image);
}

std::vector<std::string> OcrExtractor::get_available_languages() {
    return pImpl->get_available_languages();
}

std::vector<ExtractionResult> OcrExtractor::extract_batch(const std::vector<std::string>& images,
                                                          const std::string& language,
                                                          const std::string& profile,
                                                          double confidence_threshold,
                                                          ProgressCallback progress) {
    return pImpl->extract_batch(images, language, profile, confidence_threshold, progress);
}

nlohmann::json OcrExtractor::get_stats() const {
    return pImpl->get_stats();
}

ExtractionResult OcrExtractor::from_tokens(const std::vector<Token>& tokens,
                                           double confidence_threshold,
                                           const std::string& language,
                                           const std::string& profile) {
    try {
        return build_result(tokens, confidence_threshold, language, profile);
    } catch (const std::exception& e) {
        return failure(e.what(), language, profile);
    } catch (...) {
        return failure(kUnknownError, language, profile);
    }
}

ExtractionResult OcrExtractor::failure(const std::string& message,
                                       const std::string& language,
                                       const std::string& profile) {
    ExtractionResult result;
    result.language = language;
    result.config = profile;
    result.success = false;
    result.error = message;
    return result;
}

} // namespace ocr_layout
