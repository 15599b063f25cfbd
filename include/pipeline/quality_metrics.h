#pragma once

#include "common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Quality profile of a single engine result
 *
 * All functions are pure and never throw; empty input yields the documented
 * safe default for each metric.
 */
class QualityMetricsCalculator {
public:
    /**
     * @brief Full profile
     * @param pages recognized page tree
     * @param text flattened result text
     * @param imageWidth source image width in pixels (0 if unknown)
     * @param imageHeight source image height in pixels (0 if unknown)
     */
    static QualityMetrics calculate(const std::vector<RecognizedPage>& pages,
                                    const std::string& text,
                                    int imageWidth, int imageHeight);

    /**
     * @brief Profile used when calculate() cannot complete
     */
    static QualityMetrics fallback(const std::string& text);

    // Individual metrics, exposed for tests and for the assessor

    /// Distinct 100x100 px cells holding a word origin, summed over pages
    static size_t textRegions(const std::vector<RecognizedPage>& pages);
    /// Mean over pages of min(1, (var(left) + var(right) + var(spacing)) / 10000)
    static double layoutComplexity(const std::vector<RecognizedPage>& pages);
    /// Median line angle (degrees) of multi-word lines; needs at least 3 lines
    static std::optional<double> skewAngle(const std::vector<RecognizedLine>& lines);
    static double languageConfidence(const std::string& text);
    static double suspiciousCharacterRatio(const std::string& text);
    static double whitespaceRatio(const std::string& text);
    static double digitRatio(const std::string& text);
    static double uppercaseRatio(const std::string& text);
    static bool hasTableStructure(const std::vector<RecognizedPage>& pages, const std::string& text);
    static bool hasHandwriting(const std::vector<RecognizedWord>& words);
    static ImageQuality imageQuality(int width, int height);
};

} // namespace multiocr
