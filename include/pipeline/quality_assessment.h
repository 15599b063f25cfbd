#pragma once

#include "common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace multiocr {

struct QualityAssessment {
    double score = 0.0;                     // [0, 1]
    std::vector<std::string> recommendations;
};

/**
 * @brief Overall quality score of a processed document
 *
 * score = 0.5 * averageWordConfidence
 *       + 0.25 * semanticConfidence (when post-processing ran)
 *       + 0.15 * image quality score
 *       + 0.1 * (1 - layoutComplexity)
 */
class QualityAssessor {
public:
    static constexpr double kEngineWeight = 0.5;
    static constexpr double kSemanticWeight = 0.25;
    static constexpr double kImageWeight = 0.15;
    static constexpr double kLayoutWeight = 0.1;

    static constexpr double kLowEngineQuality = 0.7;
    static constexpr double kLowSemantic = 0.6;
    static constexpr double kLowImageScore = 0.7;
    static constexpr double kComplexLayout = 0.7;
    static constexpr double kLowOverall = 0.6;
    static constexpr double kLowAgreement = 0.8;

    static QualityAssessment assess(const QualityMetrics& metrics,
                                    std::optional<double> semanticConfidence,
                                    std::optional<double> agreementScore);

    /// poor 0.3, fair 0.6, good 0.8, excellent 1.0
    static double imageQualityScore(ImageQuality quality);
};

} // namespace multiocr
