/**
 * @file test_geometry.cpp
 * @brief 版面分组 (word -> line -> paragraph -> page) 测试
 */

#include <gtest/gtest.h>
#include "common/geometry.h"
#include "../mocks/scripted_recognizer.h"

using namespace multiocr;
using multiocr::testing::RecognizerScript;

// ==================== 行分组测试 ====================

/**
 * @brief y0 四舍五入到同一个 10 的倍数的单词属于同一行, 行内按 x0 排序
 */
TEST(Geometry, GroupsWordsIntoLinesByRoundedTop) {
    std::vector<RecognizedWord> words = {
        RecognizerScript::word("world", 0.8, 100, 22),
        RecognizerScript::word("hello", 0.9, 10, 18),
        RecognizerScript::word("next", 0.7, 10, 60),
    };

    auto lines = Geometry::groupWordsIntoLines(words);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "hello world");
    EXPECT_NEAR(lines[0].confidence, 0.85, 1e-9);
    EXPECT_EQ(lines[0].bbox.x0, 10);
    EXPECT_EQ(lines[0].bbox.y0, 18);
    EXPECT_EQ(lines[1].text, "next");
}

/**
 * @brief lineKey = round(y0 / 10) * 10
 */
TEST(Geometry, LineKeyRoundsToBucket) {
    EXPECT_EQ(Geometry::lineKey(RecognizerScript::word("a", 1.0, 0, 14)), 10);
    EXPECT_EQ(Geometry::lineKey(RecognizerScript::word("a", 1.0, 0, 15)), 20);
    EXPECT_EQ(Geometry::lineKey(RecognizerScript::word("a", 1.0, 0, 0)), 0);
}

// ==================== 段落分组测试 ====================

/**
 * @brief 行间距超过 20px 时开始新段落
 */
TEST(Geometry, SplitsParagraphsOnLargeGap) {
    std::vector<RecognizedWord> words = {
        RecognizerScript::word("first", 0.9, 10, 20),    // y 20..44
        RecognizerScript::word("second", 0.9, 10, 50),   // gap 6
        RecognizerScript::word("third", 0.6, 10, 120),   // gap 46
    };

    RecognizedPage page = Geometry::buildPage(words, 1, 400, 300);
    ASSERT_EQ(page.paragraphs.size(), 2u);
    EXPECT_EQ(page.paragraphs[0].text, "first\nsecond");
    EXPECT_EQ(page.paragraphs[1].text, "third");
    EXPECT_EQ(page.text, "first\nsecond\nthird");
    EXPECT_NEAR(page.confidence, (0.9 + 0.6) / 2.0, 1e-9);
}

/**
 * @brief 空文本单词被丢弃, 空页置信度为 0
 */
TEST(Geometry, EmptyWordsDropped) {
    std::vector<RecognizedWord> words = {RecognizerScript::word("", 0.9, 10, 20)};
    RecognizedPage page = Geometry::buildPage(words, 1, 100, 100);
    EXPECT_TRUE(page.paragraphs.empty());
    EXPECT_EQ(page.text, "");
    EXPECT_DOUBLE_EQ(page.confidence, 0.0);
}

/**
 * @brief 单词回填 lineIndex / paragraphIndex
 */
TEST(Geometry, BackIndicesAssigned) {
    std::vector<RecognizedWord> words = {
        RecognizerScript::word("a", 0.9, 10, 20),
        RecognizerScript::word("b", 0.9, 10, 100),
    };
    RecognizedPage page = Geometry::buildPage(words, 1, 100, 200);
    auto all = page.allWords();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].lineIndex.value(), 0);
    EXPECT_EQ(all[1].lineIndex.value(), 1);
    EXPECT_EQ(all[1].paragraphIndex.value(), 1);
}

// ==================== 结果汇总测试 ====================

/**
 * @brief 多页文本以换行连接, 置信度为各页均值
 */
TEST(Geometry, FinalizeResultJoinsPages) {
    EngineResult result;
    result.pages.push_back(Geometry::buildPage({RecognizerScript::word("one", 0.8, 0, 0)}, 1, 10, 10));
    result.pages.push_back(Geometry::buildPage({RecognizerScript::word("two", 0.6, 0, 0)}, 2, 10, 10));
    Geometry::finalizeResult(result);
    EXPECT_EQ(result.text, "one\ntwo");
    EXPECT_NEAR(result.confidence, 0.7, 1e-9);
}

TEST(Geometry, UnionAndStatistics) {
    BoundingBox box = Geometry::unionOf({BoundingBox{5, 5, 10, 10}, BoundingBox{0, 7, 8, 20}});
    EXPECT_EQ(box, (BoundingBox{0, 5, 10, 20}));
    EXPECT_EQ(Geometry::unionOf({}), BoundingBox{});

    EXPECT_DOUBLE_EQ(Geometry::mean({}), 0.0);
    EXPECT_DOUBLE_EQ(Geometry::mean({1.0, 2.0, 3.0}), 2.0);
    EXPECT_DOUBLE_EQ(Geometry::variance({1.0, 3.0}), 1.0);
}
