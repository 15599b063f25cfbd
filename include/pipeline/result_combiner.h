#pragma once

#include "common/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Merges per-engine results of one document into an ensemble result
 */
class ResultCombiner {
public:
    static constexpr const char* kMethod = "confidence_weighted";
    static constexpr const char* kPostprocessingStep = "ensemble_combination";

    /**
     * @brief Take the most confident result as the base and attach agreement
     * @param results successful results keyed by engine (at least one)
     * @throws OCRError (AllEnginesFailed) when results is empty
     */
    static EnsembleResult combine(const std::map<EngineId, EngineResult>& results);

    /**
     * @brief Mean pairwise text similarity; 1.0 for fewer than two texts
     */
    static double agreementScore(const std::vector<std::string>& texts);

    /**
     * @brief 1 - levenshtein / longer length after lower-casing and trimming.
     *        Two empty strings are identical.
     */
    static double similarity(const std::string& a, const std::string& b);

    static size_t levenshtein(const std::u32string& a, const std::u32string& b);
};

} // namespace multiocr
