#include <gtest/gtest.h>
#include <ocr_layout/errors.h>
#include <ocr_layout/token_filter.h>
#include "test_helpers.h"
#include <limits>
#include <random>

using ocr_layout::Token;
using ocr_layout::TokenFilter;
using ocr_layout::testing_helpers::make_token;

TEST(TokenFilterTest, ThresholdIsStrict) {
    std::vector<Token> tokens = {
        make_token("low", 10, 20, 59.0),
        make_token("edge", 10, 20, 60.0),
        make_token("high", 10, 20, 60.5),
    };

    auto kept = TokenFilter(60.0).apply(tokens);

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].text, "high");
}

TEST(TokenFilterTest, ZeroThresholdDropsZeroAndNegativeConfidence) {
    std::vector<Token> tokens = {
        make_token("page", 0, 20, -1.0),
        make_token("zero", 10, 20, 0.0),
        make_token("tiny", 10, 20, 0.1),
    };

    auto kept = TokenFilter(0.0).apply(tokens);

    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].text, "tiny");
}

TEST(TokenFilterTest, KeepsBlankTokensForLaterStages) {
    std::vector<Token> tokens = {make_token("   ", 10, 20, 90.0)};
    EXPECT_EQ(TokenFilter(50.0).apply(tokens).size(), 1u);
}

TEST(TokenFilterTest, PreservesOriginalOrderForAnyThreshold) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> conf(-1.0, 100.0);

    std::vector<Token> tokens;
    for (int i = 0; i < 200; ++i) {
        tokens.push_back(make_token("t" + std::to_string(i), i, 20, conf(rng)));
    }

    for (double threshold : {0.0, 25.0, 50.0, 60.0, 99.0, 100.0}) {
        auto kept = TokenFilter(threshold).apply(tokens);

        std::vector<Token> expected;
        for (const auto& token : tokens) {
            if (token.confidence > threshold) {
                expected.push_back(token);
            }
        }

        ASSERT_EQ(kept.size(), expected.size()) << "threshold " << threshold;
        for (size_t i = 0; i < kept.size(); ++i) {
            EXPECT_EQ(kept[i].text, expected[i].text);
        }
    }
}

TEST(TokenFilterTest, ValidateRejectsNegativeGeometry) {
    auto token = make_token("bad", 10);
    token.width = -3;
    EXPECT_THROW(ocr_layout::validate_token(token), ocr_layout::MalformedTokenError);
}

TEST(TokenFilterTest, ValidateRejectsNonFiniteConfidence) {
    auto token = make_token("nan", 10, 20, std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(ocr_layout::validate_token(token), ocr_layout::MalformedTokenError);
}

TEST(TokenFilterTest, ValidateAcceptsEngineNoWordRows) {
    auto token = make_token("", 0, 0, -1.0);
    EXPECT_NO_THROW(ocr_layout::validate_token(token));
}
