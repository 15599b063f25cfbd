#pragma once

#include "pipeline/collaborators.h"
#include <functional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief One regex correction. rewrite() builds the replacement from the match.
 */
struct CorrectionRule {
    std::string name;
    std::regex pattern;
    std::function<std::string(const std::smatch&)> rewrite;
};

/**
 * @brief Regex based OCR confusion fixes plus dictionary semantic scoring
 *
 * Stateless after construction, safe to share between threads.
 */
class RuleBasedPostProcessor : public IPostProcessor {
public:
    RuleBasedPostProcessor();

    PostProcessResult process(const std::string& text, const ProcessingOptions& options) override;

    /**
     * @brief Share of whitespace separated tokens found in the vocabulary
     *        after lower-casing and stripping non-word characters
     */
    double semanticConfidence(const std::string& text) const;

    const std::vector<CorrectionRule>& rules() const { return rules_; }

private:
    static std::string applyRule(const CorrectionRule& rule, const std::string& text,
                                 std::vector<TextCorrection>& corrections);
    static std::string normalizeWhitespace(const std::string& text);

    std::vector<CorrectionRule> rules_;
    std::set<std::string> vocabulary_;
};

} // namespace multiocr
