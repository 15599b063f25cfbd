#include "pipeline/result_combiner.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utf8.h"
#include <algorithm>

namespace multiocr {

EnsembleResult ResultCombiner::combine(const std::map<EngineId, EngineResult>& results) {
    if (results.empty()) {
        throw OCRError(ErrorKind::AllEnginesFailed, "no engine results to combine");
    }

    // Ties keep the engine that comes first in map order
    auto best = results.begin();
    for (auto it = results.begin(); it != results.end(); ++it) {
        if (it->second.confidence > best->second.confidence) {
            best = it;
        }
    }

    std::vector<std::string> texts;
    texts.reserve(results.size());
    for (const auto& [id, result] : results) {
        texts.push_back(result.text);
    }

    EnsembleResult ensemble;
    ensemble.combined = best->second;
    ensemble.combined.engine = EngineId::Ensemble;
    ensemble.combined.metadata.postprocessing.push_back(kPostprocessingStep);
    ensemble.engineResults = results;
    ensemble.combinationMethod = kMethod;
    ensemble.agreementScore = agreementScore(texts);

    LOG_DEBUG("Combined {} engine results, base {} ({:.3f}), agreement {:.3f}",
              results.size(), toString(best->first), best->second.confidence,
              ensemble.agreementScore);
    return ensemble;
}

double ResultCombiner::agreementScore(const std::vector<std::string>& texts) {
    if (texts.size() < 2) return 1.0;

    double total = 0.0;
    size_t comparisons = 0;
    for (size_t i = 0; i < texts.size(); ++i) {
        for (size_t j = i + 1; j < texts.size(); ++j) {
            total += similarity(texts[i], texts[j]);
            ++comparisons;
        }
    }
    return total / static_cast<double>(comparisons);
}

double ResultCombiner::similarity(const std::string& a, const std::string& b) {
    std::u32string left = Utf8::normalizeForComparison(a);
    std::u32string right = Utf8::normalizeForComparison(b);
    size_t longest = std::max(left.size(), right.size());
    if (longest == 0) return 1.0;

    size_t distance = levenshtein(left, right);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

size_t ResultCombiner::levenshtein(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // Two-row dynamic programming over b
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) previous[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

} // namespace multiocr
