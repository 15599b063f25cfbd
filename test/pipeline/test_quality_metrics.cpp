/**
 * @file test_quality_metrics.cpp
 * @brief 单引擎结果质量指标测试
 */

#include <gtest/gtest.h>
#include "common/geometry.h"
#include "pipeline/quality_metrics.h"
#include "../mocks/scripted_recognizer.h"

using namespace multiocr;
using multiocr::testing::RecognizerScript;

namespace {

RecognizedPage pageOf(const std::vector<RecognizedWord>& words, int width = 800, int height = 600) {
    return Geometry::buildPage(words, 1, width, height);
}

} // namespace

// ==================== 文本指标测试 ====================

TEST(QualityMetricsTest, TextRatios) {
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::digitRatio("ab12"), 0.5);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::uppercaseRatio("ABcd 12"), 0.5);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::whitespaceRatio("a b"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::suspiciousCharacterRatio("ab#$"), 0.5);
}

/**
 * @brief 空文本各项比例为 0, 不会除零
 */
TEST(QualityMetricsTest, EmptyTextYieldsZeros) {
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::digitRatio(""), 0.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::uppercaseRatio(""), 0.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::whitespaceRatio(""), 0.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::suspiciousCharacterRatio("   "), 0.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::languageConfidence(""), 0.0);
}

/**
 * @brief 字母比例 * 0.7 + 常用词比例 * 0.3
 */
TEST(QualityMetricsTest, LanguageConfidence) {
    EXPECT_NEAR(QualityMetricsCalculator::languageConfidence("the cat"), 0.7 + 0.3 * 0.5, 1e-9);
    EXPECT_NEAR(QualityMetricsCalculator::languageConfidence("1234"), 0.0, 1e-9);
}

/**
 * @brief 多字节字符按码点计数
 */
TEST(QualityMetricsTest, CountsCodePointsNotBytes) {
    QualityMetrics m = QualityMetricsCalculator::calculate({}, "中文 ok", 0, 0);
    EXPECT_EQ(m.characterCount, 5u);
    EXPECT_DOUBLE_EQ(m.textDensity, 0.0);
}

// ==================== 版面指标测试 ====================

TEST(QualityMetricsTest, TextRegionsCountsDistinctCells) {
    RecognizedPage page = pageOf({
        RecognizerScript::word("a", 0.9, 10, 10),
        RecognizerScript::word("b", 0.9, 50, 10),    // same 100px cell
        RecognizerScript::word("c", 0.9, 250, 10),
        RecognizerScript::word("d", 0.9, 10, 310),
    });
    EXPECT_EQ(QualityMetricsCalculator::textRegions({page}), 3u);
}

TEST(QualityMetricsTest, LayoutComplexityOfAlignedLinesIsLow) {
    RecognizedPage page = pageOf({
        RecognizerScript::word("aaaa", 0.9, 10, 20),
        RecognizerScript::word("bbbb", 0.9, 10, 50),
        RecognizerScript::word("cccc", 0.9, 10, 80),
    });
    // Same margins and spacing: zero variance
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::layoutComplexity({page}), 0.0);
    EXPECT_DOUBLE_EQ(QualityMetricsCalculator::layoutComplexity({}), 0.0);
}

TEST(QualityMetricsTest, SkewNeedsThreeLines) {
    RecognizedPage page = pageOf({
        RecognizerScript::word("a", 0.9, 10, 20), RecognizerScript::word("b", 0.9, 40, 20),
    });
    EXPECT_FALSE(QualityMetricsCalculator::skewAngle(page.allLines()).has_value());
}

TEST(QualityMetricsTest, TableDetectionFromText) {
    EXPECT_TRUE(QualityMetricsCalculator::hasTableStructure({}, "Item\tQty"));
    EXPECT_TRUE(QualityMetricsCalculator::hasTableStructure({}, "Item    Qty"));
    EXPECT_TRUE(QualityMetricsCalculator::hasTableStructure({}, "| Item | Qty |"));
    EXPECT_FALSE(QualityMetricsCalculator::hasTableStructure({}, "plain sentence"));
}

/**
 * @brief 低均值且高方差的置信度视为手写
 */
TEST(QualityMetricsTest, HandwritingHeuristic) {
    std::vector<RecognizedWord> shaky = {
        RecognizerScript::word("a", 0.95, 0), RecognizerScript::word("b", 0.05, 20),
        RecognizerScript::word("c", 0.9, 40), RecognizerScript::word("d", 0.0, 60),
    };
    EXPECT_TRUE(QualityMetricsCalculator::hasHandwriting(shaky));

    std::vector<RecognizedWord> steady = {
        RecognizerScript::word("a", 0.9, 0), RecognizerScript::word("b", 0.92, 20),
    };
    EXPECT_FALSE(QualityMetricsCalculator::hasHandwriting(steady));
    EXPECT_FALSE(QualityMetricsCalculator::hasHandwriting({}));
}

TEST(QualityMetricsTest, ImageQualityBands) {
    EXPECT_EQ(QualityMetricsCalculator::imageQuality(200, 200), ImageQuality::Poor);
    EXPECT_EQ(QualityMetricsCalculator::imageQuality(500, 500), ImageQuality::Fair);
    EXPECT_EQ(QualityMetricsCalculator::imageQuality(1000, 1000), ImageQuality::Good);
    EXPECT_EQ(QualityMetricsCalculator::imageQuality(2000, 2000), ImageQuality::Excellent);
    EXPECT_EQ(QualityMetricsCalculator::imageQuality(0, 0), ImageQuality::Poor);
}

// ==================== 完整指标测试 ====================

TEST(QualityMetricsTest, CalculateFullProfile) {
    RecognizedPage page = pageOf({
        RecognizerScript::word("INVOICE", 0.9, 10, 20),
        RecognizerScript::word("100", 0.8, 110, 20),
    });
    QualityMetrics m = QualityMetricsCalculator::calculate({page}, page.text, 800, 600);

    EXPECT_EQ(m.wordCount, 2u);
    EXPECT_EQ(m.lineCount, 1u);
    EXPECT_EQ(m.characterCount, 11u);
    EXPECT_NEAR(m.averageWordConfidence, 0.85, 1e-9);
    EXPECT_NEAR(m.averageLineConfidence, 0.85, 1e-9);
    EXPECT_NEAR(m.textDensity, 11.0 / (800.0 * 600.0), 1e-12);
    EXPECT_EQ(m.imageQuality, ImageQuality::Good);
    EXPECT_FALSE(m.hasHandwriting);
}

TEST(QualityMetricsTest, FallbackProfile) {
    QualityMetrics m = QualityMetricsCalculator::fallback("one two\nthree");
    EXPECT_EQ(m.wordCount, 3u);
    EXPECT_EQ(m.lineCount, 2u);
    EXPECT_DOUBLE_EQ(m.averageWordConfidence, 0.5);
    EXPECT_EQ(m.imageQuality, ImageQuality::Fair);
}
