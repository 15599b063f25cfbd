/**
 * @file test_quality_assessment.cpp
 * @brief 综合质量评分与建议测试
 */

#include <gtest/gtest.h>
#include "pipeline/quality_assessment.h"
#include <algorithm>
#include <limits>

using namespace multiocr;

namespace {

QualityMetrics goodMetrics() {
    QualityMetrics m;
    m.averageWordConfidence = 1.0;
    m.imageQuality = ImageQuality::Excellent;
    m.layoutComplexity = 0.0;
    return m;
}

bool contains(const std::vector<std::string>& items, const std::string& needle) {
    return std::find(items.begin(), items.end(), needle) != items.end();
}

} // namespace

TEST(QualityAssessorTest, PerfectInputScoresOne) {
    QualityAssessment a = QualityAssessor::assess(goodMetrics(), 1.0, std::nullopt);
    EXPECT_NEAR(a.score, 1.0, 1e-9);
    EXPECT_TRUE(a.recommendations.empty());
}

/**
 * @brief 0.5 / 0.25 / 0.15 / 0.1 加权
 */
TEST(QualityAssessorTest, WeightedSum) {
    QualityMetrics m;
    m.averageWordConfidence = 0.8;
    m.imageQuality = ImageQuality::Good;
    m.layoutComplexity = 0.5;
    QualityAssessment a = QualityAssessor::assess(m, 0.6, std::nullopt);
    EXPECT_NEAR(a.score, 0.8 * 0.5 + 0.6 * 0.25 + 0.8 * 0.15 + 0.5 * 0.1, 1e-9);
}

TEST(QualityAssessorTest, MissingSemanticSuggestsPostProcessing) {
    QualityAssessment a = QualityAssessor::assess(goodMetrics(), std::nullopt, std::nullopt);
    EXPECT_NEAR(a.score, 0.75, 1e-9);
    EXPECT_TRUE(contains(a.recommendations, "Enable post-processing for semantic analysis"));
}

TEST(QualityAssessorTest, RecommendationsForWeakInput) {
    QualityMetrics m;
    m.averageWordConfidence = 0.3;
    m.imageQuality = ImageQuality::Poor;
    m.layoutComplexity = 0.9;
    m.hasHandwriting = true;
    QualityAssessment a = QualityAssessor::assess(m, 0.2, 0.5);

    EXPECT_TRUE(contains(a.recommendations, "Consider image preprocessing to improve OCR quality"));
    EXPECT_TRUE(contains(a.recommendations, "Low semantic confidence detected - review text corrections"));
    EXPECT_TRUE(contains(a.recommendations, "Improve image quality for better OCR results"));
    EXPECT_TRUE(contains(a.recommendations,
                         "Complex document layout detected - consider structure-aware processing"));
    EXPECT_TRUE(contains(a.recommendations, "Overall quality is low - consider using ensemble OCR approach"));
    EXPECT_TRUE(contains(a.recommendations,
                         "Handwriting detected - specialized handwriting OCR may improve results"));
    EXPECT_TRUE(contains(a.recommendations,
                         "Low agreement between engines - review the recognized text manually"));
}

/**
 * @brief 退化输入 (NaN, 越界) 的得分仍在 [0, 1]
 */
TEST(QualityAssessorTest, DegenerateInputStaysInRange) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    for (double value : {nan, inf, -inf, -5.0, 5.0}) {
        QualityMetrics m;
        m.averageWordConfidence = value;
        m.layoutComplexity = value;
        QualityAssessment a = QualityAssessor::assess(m, value, value);
        EXPECT_GE(a.score, 0.0) << value;
        EXPECT_LE(a.score, 1.0) << value;
    }
}

TEST(QualityAssessorTest, ImageQualityScores) {
    EXPECT_DOUBLE_EQ(QualityAssessor::imageQualityScore(ImageQuality::Poor), 0.3);
    EXPECT_DOUBLE_EQ(QualityAssessor::imageQualityScore(ImageQuality::Fair), 0.6);
    EXPECT_DOUBLE_EQ(QualityAssessor::imageQualityScore(ImageQuality::Good), 0.8);
    EXPECT_DOUBLE_EQ(QualityAssessor::imageQualityScore(ImageQuality::Excellent), 1.0);
}
