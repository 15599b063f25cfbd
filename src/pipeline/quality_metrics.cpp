#include "pipeline/quality_metrics.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include "common/utf8.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <utility>

namespace multiocr {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool isSpace(char32_t c) {
    return Utf8::isSpace(c);
}

bool isAsciiAlpha(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

bool isAsciiDigit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

bool isSuspicious(char32_t c) {
    static const std::u32string kAscii = U"~`!@#$%^&*()_+={}[]|\\:\";'<>?,./";
    static const std::u32string kSymbols =
        U"§±¶•†‡°¢£¤¥¦©®™´¨≠Æ";
    return kAscii.find(c) != std::u32string::npos || kSymbols.find(c) != std::u32string::npos;
}

size_t countNonSpace(const std::u32string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
                                             [](char32_t c) { return !isSpace(c); }));
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

std::vector<RecognizedWord> collectWords(const std::vector<RecognizedPage>& pages) {
    std::vector<RecognizedWord> words;
    for (const auto& page : pages) {
        std::vector<RecognizedWord> pageWords = page.allWords();
        words.insert(words.end(), pageWords.begin(), pageWords.end());
    }
    return words;
}

std::vector<RecognizedLine> collectLines(const std::vector<RecognizedPage>& pages) {
    std::vector<RecognizedLine> lines;
    for (const auto& page : pages) {
        std::vector<RecognizedLine> pageLines = page.allLines();
        lines.insert(lines.end(), pageLines.begin(), pageLines.end());
    }
    return lines;
}

} // namespace

QualityMetrics QualityMetricsCalculator::calculate(const std::vector<RecognizedPage>& pages,
                                                   const std::string& text,
                                                   int imageWidth, int imageHeight) {
    try {
        QualityMetrics m;
        std::vector<RecognizedWord> words = collectWords(pages);
        std::vector<RecognizedLine> lines = collectLines(pages);

        std::vector<double> wordConfidences;
        wordConfidences.reserve(words.size());
        for (const auto& word : words) wordConfidences.push_back(word.confidence);

        std::vector<double> lineConfidences;
        for (const auto& line : lines) lineConfidences.push_back(line.confidence);

        std::vector<double> paragraphConfidences;
        for (const auto& page : pages) {
            for (const auto& paragraph : page.paragraphs) {
                paragraphConfidences.push_back(paragraph.confidence);
            }
        }

        m.averageWordConfidence = Geometry::mean(wordConfidences);
        m.averageLineConfidence = Geometry::mean(lineConfidences);
        m.averageParagraphConfidence = Geometry::mean(paragraphConfidences);

        m.wordCount = words.size();
        m.characterCount = Utf8::decode(text).size();
        m.lineCount = lines.size();

        double area = static_cast<double>(std::max(imageWidth, 0)) * std::max(imageHeight, 0);
        m.textDensity = area > 0 ? static_cast<double>(m.characterCount) / area : 0.0;

        m.textRegions = textRegions(pages);
        m.layoutComplexity = layoutComplexity(pages);
        m.skewAngle = skewAngle(lines);

        m.languageConfidence = languageConfidence(text);
        m.suspiciousCharacterRatio = suspiciousCharacterRatio(text);
        m.whitespaceRatio = whitespaceRatio(text);
        m.digitRatio = digitRatio(text);
        m.uppercaseRatio = uppercaseRatio(text);

        m.hasTableStructure = hasTableStructure(pages, text);
        m.hasHandwriting = hasHandwriting(words);
        m.imageQuality = imageQuality(imageWidth, imageHeight);
        return m;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to calculate quality metrics: {}", e.what());
        return fallback(text);
    }
}

QualityMetrics QualityMetricsCalculator::fallback(const std::string& text) {
    QualityMetrics m;
    m.averageWordConfidence = 0.5;
    m.averageLineConfidence = 0.5;
    m.averageParagraphConfidence = 0.5;
    m.textDensity = 0.0;
    m.wordCount = splitWords(text).size();
    m.characterCount = text.size();
    m.lineCount = static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
    m.textRegions = 1;
    m.layoutComplexity = 0.5;
    m.languageConfidence = 0.5;
    m.suspiciousCharacterRatio = 0.1;
    m.whitespaceRatio = 0.2;
    m.digitRatio = 0.1;
    m.uppercaseRatio = 0.1;
    m.hasTableStructure = false;
    m.hasHandwriting = false;
    m.imageQuality = ImageQuality::Fair;
    return m;
}

size_t QualityMetricsCalculator::textRegions(const std::vector<RecognizedPage>& pages) {
    size_t total = 0;
    for (const auto& page : pages) {
        std::set<std::pair<int, int>> cells;
        for (const auto& word : page.allWords()) {
            int cx = static_cast<int>(std::floor(word.bbox.x0 / 100.0));
            int cy = static_cast<int>(std::floor(word.bbox.y0 / 100.0));
            cells.emplace(cx, cy);
        }
        total += cells.size();
    }
    return total;
}

double QualityMetricsCalculator::layoutComplexity(const std::vector<RecognizedPage>& pages) {
    if (pages.empty()) return 0.0;

    double total = 0.0;
    for (const auto& page : pages) {
        std::vector<RecognizedLine> lines = page.allLines();
        if (lines.empty()) continue;

        std::vector<double> left;
        std::vector<double> right;
        std::vector<double> spacing;
        for (size_t i = 0; i < lines.size(); ++i) {
            left.push_back(lines[i].bbox.x0);
            right.push_back(lines[i].bbox.x1);
            if (i > 0) {
                spacing.push_back(lines[i].bbox.y0 - lines[i - 1].bbox.y1);
            }
        }

        double sum = Geometry::variance(left) + Geometry::variance(right) + Geometry::variance(spacing);
        total += std::min(1.0, sum / 10000.0);
    }
    return total / static_cast<double>(pages.size());
}

std::optional<double> QualityMetricsCalculator::skewAngle(const std::vector<RecognizedLine>& lines) {
    if (lines.size() < 3) return std::nullopt;

    std::vector<double> angles;
    for (const auto& line : lines) {
        if (line.words.size() < 2) continue;
        double dx = line.bbox.x1 - line.bbox.x0;
        double dy = line.bbox.y1 - line.bbox.y0;
        angles.push_back(std::atan2(dy, dx) * 180.0 / kPi);
    }
    if (angles.empty()) return std::nullopt;

    std::sort(angles.begin(), angles.end());
    size_t mid = angles.size() / 2;
    if (angles.size() % 2 == 0) {
        return (angles[mid - 1] + angles[mid]) / 2.0;
    }
    return angles[mid];
}

double QualityMetricsCalculator::languageConfidence(const std::string& text) {
    std::u32string decoded = Utf8::decode(text);
    size_t total = countNonSpace(decoded);
    if (total == 0) return 0.0;

    size_t alpha = static_cast<size_t>(std::count_if(decoded.begin(), decoded.end(), isAsciiAlpha));
    double alphaRatio = static_cast<double>(alpha) / static_cast<double>(total);

    static const std::set<std::string> kCommonWords = {
        "the", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by"
    };
    std::vector<std::string> words = splitWords(text);
    size_t common = static_cast<size_t>(std::count_if(words.begin(), words.end(),
        [](const std::string& w) { return kCommonWords.count(w) > 0; }));
    double commonRatio = words.empty() ? 0.0 : static_cast<double>(common) / static_cast<double>(words.size());

    return alphaRatio * 0.7 + commonRatio * 0.3;
}

double QualityMetricsCalculator::suspiciousCharacterRatio(const std::string& text) {
    std::u32string decoded = Utf8::decode(text);
    size_t total = countNonSpace(decoded);
    if (total == 0) return 0.0;
    size_t suspicious = static_cast<size_t>(std::count_if(decoded.begin(), decoded.end(), isSuspicious));
    return static_cast<double>(suspicious) / static_cast<double>(total);
}

double QualityMetricsCalculator::whitespaceRatio(const std::string& text) {
    std::u32string decoded = Utf8::decode(text);
    if (decoded.empty()) return 0.0;
    size_t spaces = static_cast<size_t>(std::count_if(decoded.begin(), decoded.end(), isSpace));
    return static_cast<double>(spaces) / static_cast<double>(decoded.size());
}

double QualityMetricsCalculator::digitRatio(const std::string& text) {
    std::u32string decoded = Utf8::decode(text);
    size_t total = countNonSpace(decoded);
    if (total == 0) return 0.0;
    size_t digits = static_cast<size_t>(std::count_if(decoded.begin(), decoded.end(), isAsciiDigit));
    return static_cast<double>(digits) / static_cast<double>(total);
}

double QualityMetricsCalculator::uppercaseRatio(const std::string& text) {
    size_t alpha = 0;
    size_t upper = 0;
    for (char c : text) {
        if (c >= 'A' && c <= 'Z') {
            ++alpha;
            ++upper;
        } else if (c >= 'a' && c <= 'z') {
            ++alpha;
        }
    }
    return alpha > 0 ? static_cast<double>(upper) / static_cast<double>(alpha) : 0.0;
}

bool QualityMetricsCalculator::hasTableStructure(const std::vector<RecognizedPage>& pages,
                                                 const std::string& text) {
    for (const auto& page : pages) {
        std::vector<RecognizedLine> lines = page.allLines();
        if (lines.size() < 3) continue;

        std::set<int> starts;
        for (const auto& line : lines) starts.insert(line.bbox.x0);

        // Repeated left margins suggest column alignment
        if (starts.size() >= 2 && static_cast<double>(starts.size()) <= lines.size() / 2.0) {
            return true;
        }
    }

    static const std::regex kPipeCell(R"(\|\s*\w+\s*\|)");
    if (text.find('\t') != std::string::npos) return true;

    size_t run = 0;
    for (char c : text) {
        run = std::isspace(static_cast<unsigned char>(c)) ? run + 1 : 0;
        if (run >= 3) return true;
    }
    return std::regex_search(text, kPipeCell);
}

bool QualityMetricsCalculator::hasHandwriting(const std::vector<RecognizedWord>& words) {
    if (words.empty()) return false;

    std::vector<double> confidences;
    confidences.reserve(words.size());
    for (const auto& word : words) confidences.push_back(word.confidence);

    return Geometry::mean(confidences) < 0.6 && Geometry::variance(confidences) > 0.1;
}

ImageQuality QualityMetricsCalculator::imageQuality(int width, int height) {
    double pixels = static_cast<double>(std::max(width, 0)) * std::max(height, 0);
    if (pixels < 300.0 * 400.0) return ImageQuality::Poor;
    if (pixels < 600.0 * 800.0) return ImageQuality::Fair;
    if (pixels < 1200.0 * 1600.0) return ImageQuality::Good;
    return ImageQuality::Excellent;
}

} // namespace multiocr
