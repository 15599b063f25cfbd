/**
 * @file test_text_postprocessor.cpp
 * @brief 规则纠错与语义置信度测试
 */

#include <gtest/gtest.h>
#include "pipeline/text_postprocessor.h"
#include <algorithm>

using namespace multiocr;

namespace {

bool hasRule(const std::vector<TextCorrection>& corrections, const std::string& rule) {
    return std::any_of(corrections.begin(), corrections.end(),
                       [&rule](const TextCorrection& c) { return c.rule == rule; });
}

} // namespace

// ==================== 纠错规则测试 ====================

/**
 * @brief 常见 OCR 混淆、标签与货币格式修正, 空白规范化
 */
TEST(RuleBasedPostProcessorTest, CorrectsCommonConfusions) {
    RuleBasedPostProcessor processor;
    PostProcessResult result = processor.process("0rder Total  : $ 12\n\n  rnonth   end ", ProcessingOptions());

    EXPECT_EQ(result.correctedText, "Order Total: $12\nmonth end");
    EXPECT_EQ(result.corrections.size(), 4u);
    EXPECT_TRUE(hasRule(result.corrections, "zero_to_letter_o"));
    EXPECT_TRUE(hasRule(result.corrections, "rn_to_m"));
    EXPECT_TRUE(hasRule(result.corrections, "total_label"));
    EXPECT_TRUE(hasRule(result.corrections, "currency_spacing"));

    const TextCorrection& first = result.corrections.front();
    EXPECT_EQ(first.original, "0");
    EXPECT_EQ(first.corrected, "O");
    EXPECT_EQ(first.position, 0u);
}

TEST(RuleBasedPostProcessorTest, LetterDigitConfusions) {
    RuleBasedPostProcessor processor;
    EXPECT_EQ(processor.process("l00 units", ProcessingOptions()).correctedText, "100 units");
    EXPECT_EQ(processor.process("qty 50l", ProcessingOptions()).correctedText, "qty 501");
    EXPECT_EQ(processor.process("S7 G7 B2", ProcessingOptions()).correctedText, "57 67 82");
}

/**
 * @brief 纯数字不被改写
 */
TEST(RuleBasedPostProcessorTest, LeavesNumbersAlone) {
    RuleBasedPostProcessor processor;
    PostProcessResult result = processor.process("100 200.00 3040", ProcessingOptions());
    EXPECT_EQ(result.correctedText, "100 200.00 3040");
    EXPECT_TRUE(result.corrections.empty());
}

TEST(RuleBasedPostProcessorTest, EmptyText) {
    RuleBasedPostProcessor processor;
    PostProcessResult result = processor.process("", ProcessingOptions());
    EXPECT_EQ(result.correctedText, "");
    EXPECT_TRUE(result.corrections.empty());
    EXPECT_DOUBLE_EQ(result.semanticConfidence, 0.0);
}

// ==================== 语义置信度测试 ====================

/**
 * @brief 词典命中比例, 忽略大小写与标点
 */
TEST(RuleBasedPostProcessorTest, SemanticConfidenceIsDictionaryRatio) {
    RuleBasedPostProcessor processor;
    EXPECT_DOUBLE_EQ(processor.semanticConfidence("The invoice TOTAL:"), 1.0);
    EXPECT_DOUBLE_EQ(processor.semanticConfidence("Order Total: $12 month end"), 0.4);
    EXPECT_DOUBLE_EQ(processor.semanticConfidence("xqzt vvrp"), 0.0);
}

TEST(RuleBasedPostProcessorTest, SemanticConfidenceOfCorrectedText) {
    RuleBasedPostProcessor processor;
    PostProcessResult result = processor.process("0rder Total  : $ 12\n\n  rnonth   end ", ProcessingOptions());
    EXPECT_DOUBLE_EQ(result.semanticConfidence, 0.4);
}
