#include "common/geometry.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace multiocr {

namespace {

template<typename T>
std::string joinTexts(const std::vector<T>& items, const char* separator) {
    std::string text;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) text += separator;
        text += items[i].text;
    }
    return text;
}

template<typename T>
double meanConfidence(const std::vector<T>& items) {
    if (items.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& item : items) sum += item.confidence;
    return sum / static_cast<double>(items.size());
}

template<typename T>
BoundingBox unionOfItems(const std::vector<T>& items) {
    std::vector<BoundingBox> boxes;
    boxes.reserve(items.size());
    for (const auto& item : items) boxes.push_back(item.bbox);
    return Geometry::unionOf(boxes);
}

} // namespace

BoundingBox Geometry::unionOf(const std::vector<BoundingBox>& boxes) {
    if (boxes.empty()) return BoundingBox{};

    BoundingBox box = boxes.front();
    for (const auto& b : boxes) {
        box.x0 = std::min(box.x0, b.x0);
        box.y0 = std::min(box.y0, b.y0);
        box.x1 = std::max(box.x1, b.x1);
        box.y1 = std::max(box.y1, b.y1);
    }
    return box;
}

int Geometry::lineKey(const RecognizedWord& word) {
    return static_cast<int>(std::floor(word.bbox.y0 / static_cast<double>(kLineBucket) + 0.5)) * kLineBucket;
}

std::vector<RecognizedLine> Geometry::groupWordsIntoLines(const std::vector<RecognizedWord>& words) {
    std::map<int, std::vector<RecognizedWord>> rows;
    for (const auto& word : words) {
        rows[lineKey(word)].push_back(word);
    }

    std::vector<RecognizedLine> lines;
    lines.reserve(rows.size());
    for (auto& [key, rowWords] : rows) {
        std::stable_sort(rowWords.begin(), rowWords.end(),
                         [](const RecognizedWord& a, const RecognizedWord& b) {
                             return a.bbox.x0 < b.bbox.x0;
                         });

        RecognizedLine line;
        line.words = std::move(rowWords);
        line.text = joinTexts(line.words, " ");
        line.confidence = meanConfidence(line.words);
        line.bbox = unionOfItems(line.words);
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<RecognizedParagraph> Geometry::groupLinesIntoParagraphs(const std::vector<RecognizedLine>& lines) {
    std::vector<RecognizedParagraph> paragraphs;
    std::vector<RecognizedLine> current;

    auto flush = [&paragraphs, &current]() {
        if (current.empty()) return;
        RecognizedParagraph paragraph;
        paragraph.lines = std::move(current);
        paragraph.text = joinTexts(paragraph.lines, "\n");
        paragraph.confidence = meanConfidence(paragraph.lines);
        paragraph.bbox = unionOfItems(paragraph.lines);
        paragraphs.push_back(std::move(paragraph));
        current.clear();
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        current.push_back(lines[i]);
        bool last = (i + 1 == lines.size());
        if (last || lines[i + 1].bbox.y0 - lines[i].bbox.y1 > kParagraphGap) {
            flush();
        }
    }
    return paragraphs;
}

RecognizedPage Geometry::buildPage(const std::vector<RecognizedWord>& words,
                                   int pageNumber, int width, int height) {
    std::vector<RecognizedWord> kept;
    kept.reserve(words.size());
    for (const auto& word : words) {
        if (!word.text.empty()) kept.push_back(word);
    }

    RecognizedPage page;
    page.pageNumber = pageNumber;
    page.width = width;
    page.height = height;
    page.paragraphs = groupLinesIntoParagraphs(groupWordsIntoLines(kept));

    // Informational back-indices
    int lineIndex = 0;
    for (size_t p = 0; p < page.paragraphs.size(); ++p) {
        for (auto& line : page.paragraphs[p].lines) {
            for (auto& word : line.words) {
                word.lineIndex = lineIndex;
                word.paragraphIndex = static_cast<int>(p);
            }
            ++lineIndex;
        }
    }

    page.text = joinTexts(page.paragraphs, "\n");
    page.confidence = meanConfidence(page.paragraphs);
    return page;
}

void Geometry::finalizeResult(EngineResult& result) {
    result.text = joinTexts(result.pages, "\n");
    result.confidence = meanConfidence(result.pages);
}

double Geometry::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double Geometry::variance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double m = mean(values);
    double sum = 0.0;
    for (double v : values) sum += (v - m) * (v - m);
    return sum / static_cast<double>(values.size());
}

} // namespace multiocr
