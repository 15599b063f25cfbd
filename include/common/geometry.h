#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Builds the page / paragraph / line tree from flat word boxes
 *
 * Every aggregate carries the union bbox of its children and the unweighted
 * mean of its immediate children's confidences (0 when there are none).
 */
class Geometry {
public:
    /// Words whose y0 rounds to the same multiple of this share a line
    static constexpr int kLineBucket = 10;
    /// Vertical gap (px) between consecutive lines that starts a new paragraph
    static constexpr int kParagraphGap = 20;

    /**
     * @brief Smallest box containing all of the given boxes
     */
    static BoundingBox unionOf(const std::vector<BoundingBox>& boxes);

    /**
     * @brief Row key of a word: round(y0 / 10) * 10
     */
    static int lineKey(const RecognizedWord& word);

    /**
     * @brief Group words into lines, top to bottom, each line left to right
     */
    static std::vector<RecognizedLine> groupWordsIntoLines(const std::vector<RecognizedWord>& words);

    /**
     * @brief Split consecutive lines into paragraphs on large vertical gaps
     */
    static std::vector<RecognizedParagraph> groupLinesIntoParagraphs(const std::vector<RecognizedLine>& lines);

    /**
     * @brief Full page from raw word boxes. Words with empty text are dropped.
     */
    static RecognizedPage buildPage(const std::vector<RecognizedWord>& words,
                                    int pageNumber, int width, int height);

    /**
     * @brief Recompute result.text and result.confidence from its pages
     */
    static void finalizeResult(EngineResult& result);

    static double mean(const std::vector<double>& values);
    static double variance(const std::vector<double>& values);
};

} // namespace multiocr
