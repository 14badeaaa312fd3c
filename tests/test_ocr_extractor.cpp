#include <gtest/gtest.h>
#include <ocr_layout/errors.h>
#include <ocr_layout/ocr_extractor.h>
#include "test_helpers.h"
#include <map>
#include <mutex>
#include <random>

using namespace ocr_layout;
using ocr_layout::testing_helpers::make_token;

namespace {

struct EngineCall {
    std::string image;
    std::string language;
    std::string flags;
};

// Serves canned tokens per image; images it does not know raise
class ScriptedEngine : public RecognitionEngine {
public:
    std::vector<Token> recognize(const std::string& image,
                                 const std::string& language,
                                 const std::string& engine_flags) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back({image, language, engine_flags});

        auto by_language = per_language.find(image);
        if (by_language != per_language.end()) {
            auto it = by_language->second.find(language);
            if (it != by_language->second.end()) {
                return it->second;
            }
            return {};
        }

        auto it = images.find(image);
        if (it == images.end()) {
            throw RecognitionError("engine crashed on " + image);
        }
        return it->second;
    }

    std::vector<std::string> available_languages() override {
        if (languages_fail) {
            throw RecognitionError("no tessdata");
        }
        return {"eng", "deu"};
    }

    std::map<std::string, std::vector<Token>> images;
    std::map<std::string, std::map<std::string, std::vector<Token>>> per_language;
    std::vector<EngineCall> calls;
    bool languages_fail = false;

private:
    std::mutex mutex_;
};

} // namespace

class OcrExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<ScriptedEngine>();
        engine_->images["hello.png"] = {
            make_token("Hello", 10),
            make_token("World", 10),
            make_token("Foo", 40),
        };

        ExtractorOptions options;
        options.thread_count = 2;
        extractor_ = std::make_unique<OcrExtractor>(engine_, options);
    }

    std::shared_ptr<ScriptedEngine> engine_;
    std::unique_ptr<OcrExtractor> extractor_;
};

TEST_F(OcrExtractorTest, AssemblesLinesAndParagraphs) {
    auto result = extractor_->extract_text("hello.png", "eng", "default", 0);

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.lines, (std::vector<std::string>{"Hello World", "Foo"}));
    EXPECT_EQ(result.text, "Hello World\n\nFoo");
    EXPECT_DOUBLE_EQ(result.confidence, 70.0);
    EXPECT_EQ(result.confidence_scores.size(), 3u);
    EXPECT_EQ(result.bounding_boxes.size(), 3u);
    EXPECT_EQ(result.bounding_boxes[2].y, 40);
    EXPECT_EQ(result.language, "eng");
    EXPECT_EQ(result.config, "default");
}

TEST_F(OcrExtractorTest, PassesProfileFlagsToEngine) {
    extractor_->extract_text("hello.png", "deu", "single_line", 0);
    extractor_->extract_text("hello.png", "eng", "no_such_profile", 0);

    ASSERT_EQ(engine_->calls.size(), 2u);
    EXPECT_EQ(engine_->calls[0].language, "deu");
    EXPECT_EQ(engine_->calls[0].flags, "--oem 3 --psm 7");
    EXPECT_EQ(engine_->calls[1].flags, "--oem 3 --psm 6");
}

TEST_F(OcrExtractorTest, UnknownProfileIsEchoedBack) {
    auto result = extractor_->extract_text("hello.png", "eng", "no_such_profile", 0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.config, "no_such_profile");
}

TEST_F(OcrExtractorTest, ConfidenceIsMeanOfKeptTokens) {
    engine_->images["mixed.png"] = {
        make_token("keep", 10, 20, 80.0),
        make_token("edge", 10, 20, 60.0),
        make_token("also", 10, 20, 90.0),
    };

    auto result = extractor_->extract_text("mixed.png", "eng", "default", 60);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.text, "keep also");
    EXPECT_EQ(result.confidence_scores, (std::vector<double>{80.0, 90.0}));
    EXPECT_DOUBLE_EQ(result.confidence, 85.0);
}

TEST_F(OcrExtractorTest, BlankTokensDoNotCountTowardConfidence) {
    engine_->images["blank.png"] = {
        make_token("A", 10, 20, 90.0),
        make_token("   ", 10, 20, 95.0),
    };

    auto result = extractor_->extract_text("blank.png", "eng", "default", 0);

    EXPECT_EQ(result.confidence_scores, (std::vector<double>{90.0}));
    EXPECT_EQ(result.bounding_boxes.size(), 1u);
    EXPECT_DOUBLE_EQ(result.confidence, 90.0);
}

TEST_F(OcrExtractorTest, NothingAboveThresholdIsAnEmptySuccess) {
    auto result = extractor_->extract_text("hello.png", "eng", "default", 95);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.text, "");
    EXPECT_TRUE(result.lines.empty());
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_TRUE(result.confidence_scores.empty());
}

TEST_F(OcrExtractorTest, EngineFailureBecomesFailedResult) {
    auto result = extractor_->extract_text("missing.png", "fra", "document", 60);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("engine crashed on missing.png"), std::string::npos);
    EXPECT_EQ(result.text, "");
    EXPECT_TRUE(result.lines.empty());
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_TRUE(result.confidence_scores.empty());
    EXPECT_TRUE(result.bounding_boxes.empty());
    EXPECT_EQ(result.language, "fra");
    EXPECT_EQ(result.config, "document");
}

TEST_F(OcrExtractorTest, MalformedTokenFailsTheWholeCall) {
    auto bad = make_token("bad", 10);
    bad.height = -1;
    engine_->images["bad.png"] = {make_token("fine", 10), bad};

    auto result = extractor_->extract_text("bad.png", "eng", "default", 0);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.lines.empty());
    ASSERT_TRUE(result.error.has_value());
}

TEST_F(OcrExtractorTest, LongTextReflowsIntoParagraphs) {
    engine_->images["doc.png"] = {
        make_token("This line is long enough", 10, 20, 90.0),
        make_token("to not trigger an early close", 10, 20, 90.0),
        make_token("Short end.", 40, 20, 90.0),
    };

    auto result = extractor_->extract_long_text("doc.png", "eng", 60);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.config, "document");
    EXPECT_EQ(result.text, "This line is long enough to not trigger an early close Short end.");
    EXPECT_EQ(result.lines.size(), 2u);
    EXPECT_EQ(engine_->calls.back().flags, "--oem 3 --psm 6 -c preserve_interword_spaces=1");
}

TEST_F(OcrExtractorTest, ParagraphMetricsAreAttached) {
    auto result = extractor_->extract_text_optimized_for_paragraphs("hello.png", "eng", 0);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.text, "Hello World\n\nFoo");
    ASSERT_TRUE(result.paragraph_count.has_value());
    EXPECT_EQ(*result.paragraph_count, 2u);
    ASSERT_TRUE(result.avg_paragraph_length.has_value());
    EXPECT_DOUBLE_EQ(*result.avg_paragraph_length, 1.5);
}

TEST_F(OcrExtractorTest, ParagraphMetricsAbsentOnFailure) {
    auto result = extractor_->extract_text_optimized_for_paragraphs("missing.png");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.config, "document");
    EXPECT_FALSE(result.paragraph_count.has_value());
}

TEST_F(OcrExtractorTest, BoxesIgnoreThresholdButNotZeroConfidence) {
    engine_->images["boxes.png"] = {
        make_token("", 0, 480, -1.0),
        make_token("zero", 10, 20, 0.0),
        make_token(" faint ", 10, 20, 12.5, 30),
        make_token("  ", 10, 20, 99.0),
    };

    auto words = extractor_->extract_text_with_boxes("boxes.png");

    ASSERT_EQ(words.size(), 1u);
    EXPECT_EQ(words[0].text, "faint");
    EXPECT_DOUBLE_EQ(words[0].confidence, 12.5);
    EXPECT_EQ(words[0].bbox.x, 30);
}

TEST_F(OcrExtractorTest, BoxesAreEmptyOnFailure) {
    EXPECT_TRUE(extractor_->extract_text_with_boxes("missing.png").empty());
}

TEST_F(OcrExtractorTest, DetectsLanguageWithBestConfidence) {
    engine_->per_language["page.png"] = {
        {"eng", {make_token("word", 10, 20, 25.0)}},
        {"deu", {make_token("wort", 10, 20, 81.0)}},
        {"fra", {make_token("mot", 10, 20, 64.0)}},
    };

    EXPECT_EQ(extractor_->detect_language("page.png"), "deu");
}

TEST_F(OcrExtractorTest, LowConfidenceDetectionFallsBackToEnglish) {
    engine_->per_language["faint.png"] = {
        {"kor", {make_token("x", 10, 20, 30.0)}},
        {"rus", {make_token("y", 10, 20, 12.0)}},
    };

    EXPECT_EQ(extractor_->detect_language("faint.png"), "eng");
}

TEST_F(OcrExtractorTest, DetectionSurvivesEngineFailures) {
    EXPECT_EQ(extractor_->detect_language("missing.png"), "eng");
}

TEST_F(OcrExtractorTest, AvailableLanguages) {
    EXPECT_EQ(extractor_->get_available_languages(), (std::vector<std::string>{"eng", "deu"}));

    engine_->languages_fail = true;
    EXPECT_EQ(extractor_->get_available_languages(), (std::vector<std::string>{"eng"}));
}

TEST_F(OcrExtractorTest, BatchKeepsInputOrder) {
    engine_->images["one.png"] = {make_token("one", 10)};
    engine_->images["two.png"] = {make_token("two", 10)};

    std::vector<std::string> images = {"two.png", "missing.png", "one.png", "hello.png"};
    std::vector<size_t> progress_seen;
    std::mutex progress_mutex;

    auto results = extractor_->extract_batch(images, "eng", "default", 0,
        [&](size_t current, size_t total) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            EXPECT_EQ(total, 4u);
            progress_seen.push_back(current);
        });

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].text, "two");
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[2].text, "one");
    EXPECT_EQ(results[3].text, "Hello World\n\nFoo");
    EXPECT_EQ(progress_seen.size(), 4u);
}

TEST_F(OcrExtractorTest, StatisticsTrackCalls) {
    extractor_->extract_text("hello.png", "eng", "default", 0);
    extractor_->extract_text("missing.png");

    auto stats = extractor_->get_stats();
    EXPECT_EQ(stats["extractions"].get<int>(), 2);
    EXPECT_EQ(stats["failures"].get<int>(), 1);
    EXPECT_EQ(stats["tokens_processed"].get<size_t>(), 3u);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
}

TEST(OcrExtractorConstructionTest, RequiresEngine) {
    EXPECT_THROW(OcrExtractor extractor(nullptr), std::invalid_argument);
}

TEST(FromTokensTest, ScoresAndBoxesStayAligned) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> coord(0, 400);
    std::uniform_int_distribution<int> size(0, 40);
    std::uniform_real_distribution<double> conf(-1.0, 100.0);
    std::uniform_int_distribution<int> blank(0, 4);

    for (int round = 0; round < 50; ++round) {
        std::vector<Token> tokens;
        int count = round % 17;
        for (int i = 0; i < count; ++i) {
            tokens.push_back(make_token(blank(rng) == 0 ? " " : "w" + std::to_string(i),
                                        coord(rng), size(rng), conf(rng), coord(rng), size(rng)));
        }

        auto result = OcrExtractor::from_tokens(tokens, 30.0);

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.confidence_scores.size(), result.bounding_boxes.size());
        EXPECT_EQ(result.confidence == 0.0, result.confidence_scores.empty());
        for (double score : result.confidence_scores) {
            EXPECT_GT(score, 30.0);
        }
    }
}

TEST(FromTokensTest, MalformedTokenGivesFailure) {
    auto token = make_token("x", 10);
    token.x = -5;

    auto result = OcrExtractor::from_tokens({token}, 0.0, "eng", "default");

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.confidence_scores.empty());
    EXPECT_TRUE(result.bounding_boxes.empty());
}

namespace {

// Engine library that reports errors with a non-standard exception type
class ForeignThrowEngine : public RecognitionEngine {
public:
    std::vector<Token> recognize(const std::string&, const std::string&, const std::string&) override {
        throw 42;
    }

    std::vector<std::string> available_languages() override {
        throw 42;
    }
};

} // namespace

TEST(NonStandardExceptionTest, StaysInsideExtractionBoundary) {
    ExtractorOptions options;
    options.thread_count = 2;
    OcrExtractor extractor(std::make_shared<ForeignThrowEngine>(), options);

    ExtractionResult result;
    ASSERT_NO_THROW(result = extractor.extract_text("page.png", "deu", "document"));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Unknown recognition error");
    EXPECT_EQ(result.language, "deu");
    EXPECT_EQ(result.config, "document");

    std::vector<ExtractionResult> batch;
    ASSERT_NO_THROW(batch = extractor.extract_batch({"a.png", "b.png"}));
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_FALSE(batch[0].success);
    EXPECT_FALSE(batch[1].success);

    EXPECT_FALSE(extractor.extract_long_text("page.png").success);
    EXPECT_TRUE(extractor.extract_text_with_boxes("page.png").empty());
    EXPECT_EQ(extractor.detect_language("page.png"), "eng");
    EXPECT_EQ(extractor.get_available_languages(), (std::vector<std::string>{"eng"}));
    // one each for text and long text, two for the batch, ten detection candidates
    EXPECT_EQ(extractor.get_stats()["failures"].get<int>(), 14);
}
