#include "pipeline/quality_assessment.h"
#include <algorithm>
#include <cmath>

namespace multiocr {

namespace {

// NaN or out-of-range inputs count as zero
double unit(double value) {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

QualityAssessment QualityAssessor::assess(const QualityMetrics& metrics,
                                          std::optional<double> semanticConfidence,
                                          std::optional<double> agreementScore) {
    QualityAssessment assessment;
    auto& recommendations = assessment.recommendations;
    double score = 0.0;

    double engineQuality = unit(metrics.averageWordConfidence);
    score += engineQuality * kEngineWeight;
    if (engineQuality < kLowEngineQuality) {
        recommendations.push_back("Consider image preprocessing to improve OCR quality");
    }

    if (semanticConfidence) {
        double semantic = unit(*semanticConfidence);
        score += semantic * kSemanticWeight;
        if (semantic < kLowSemantic) {
            recommendations.push_back("Low semantic confidence detected - review text corrections");
        }
    } else {
        recommendations.push_back("Enable post-processing for semantic analysis");
    }

    double imageScore = imageQualityScore(metrics.imageQuality);
    score += imageScore * kImageWeight;
    if (imageScore < kLowImageScore) {
        recommendations.push_back("Improve image quality for better OCR results");
    }

    double complexity = unit(metrics.layoutComplexity);
    score += (1.0 - complexity) * kLayoutWeight;
    if (complexity > kComplexLayout) {
        recommendations.push_back("Complex document layout detected - consider structure-aware processing");
    }

    if (score < kLowOverall) {
        recommendations.push_back("Overall quality is low - consider using ensemble OCR approach");
    }
    if (metrics.hasHandwriting) {
        recommendations.push_back("Handwriting detected - specialized handwriting OCR may improve results");
    }
    if (agreementScore && *agreementScore < kLowAgreement) {
        recommendations.push_back("Low agreement between engines - review the recognized text manually");
    }

    assessment.score = std::clamp(score, 0.0, 1.0);
    return assessment;
}

double QualityAssessor::imageQualityScore(ImageQuality quality) {
    switch (quality) {
        case ImageQuality::Poor:      return 0.3;
        case ImageQuality::Fair:      return 0.6;
        case ImageQuality::Good:      return 0.8;
        case ImageQuality::Excellent: return 1.0;
    }
    return 0.5;
}

} // namespace multiocr
