#include "common/types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>

namespace multiocr {

const char* toString(EngineId id) {
    switch (id) {
        case EngineId::Tesseract: return "tesseract";
        case EngineId::EasyOCR:   return "easyocr";
        case EngineId::PaddleOCR: return "paddleocr";
        case EngineId::Ensemble:  return "ensemble";
    }
    return "unknown";
}

bool parseEngineId(const std::string& name, EngineId& id) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "tesseract") { id = EngineId::Tesseract; return true; }
    if (lower == "easyocr")   { id = EngineId::EasyOCR;   return true; }
    if (lower == "paddleocr") { id = EngineId::PaddleOCR; return true; }
    if (lower == "ensemble")  { id = EngineId::Ensemble;  return true; }
    return false;
}

const std::vector<EngineId>& concreteEngines() {
    static const std::vector<EngineId> engines = {
        EngineId::Tesseract, EngineId::EasyOCR, EngineId::PaddleOCR
    };
    return engines;
}

bool EngineCapabilities::supportsLanguage(const std::string& language) const {
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

std::vector<RecognizedLine> RecognizedPage::allLines() const {
    std::vector<RecognizedLine> lines;
    for (const auto& paragraph : paragraphs) {
        lines.insert(lines.end(), paragraph.lines.begin(), paragraph.lines.end());
    }
    return lines;
}

std::vector<RecognizedWord> RecognizedPage::allWords() const {
    std::vector<RecognizedWord> words;
    for (const auto& paragraph : paragraphs) {
        for (const auto& line : paragraph.lines) {
            words.insert(words.end(), line.words.begin(), line.words.end());
        }
    }
    return words;
}

const char* toString(ImageQuality quality) {
    switch (quality) {
        case ImageQuality::Poor:      return "poor";
        case ImageQuality::Fair:      return "fair";
        case ImageQuality::Good:      return "good";
        case ImageQuality::Excellent: return "excellent";
    }
    return "fair";
}

const char* toString(EventType type) {
    switch (type) {
        case EventType::Started:         return "started";
        case EventType::EngineSelected:  return "engine_selected";
        case EventType::Preprocessing:   return "preprocessing";
        case EventType::EngineCompleted: return "ocr_completed";
        case EventType::PostProcessing:  return "postprocessing";
        case EventType::Completed:       return "completed";
        case EventType::Error:           return "error";
        case EventType::Warning:         return "warning";
    }
    return "unknown";
}

bool ProcessingOptions::isEnsemble() const {
    const EngineId* single = std::get_if<EngineId>(&engine);
    return single != nullptr && *single == EngineId::Ensemble;
}

bool ProcessingOptions::isMultiEngine() const {
    return isEnsemble() || std::holds_alternative<std::vector<EngineId>>(engine);
}

json ProcessingOptions::normalized() const {
    json j;
    j["language"] = language;
    if (const EngineId* single = std::get_if<EngineId>(&engine)) {
        j["engine"] = toString(*single);
    } else {
        // List order does not change which engines run
        std::set<std::string> names;
        for (EngineId id : std::get<std::vector<EngineId>>(engine)) {
            names.insert(toString(id));
        }
        j["engine"] = names;
    }
    j["confidenceThreshold"] = confidenceThreshold;
    j["timeoutMs"] = timeoutMs;
    j["maxRetries"] = maxRetries;
    j["enableFallback"] = enableFallback;
    j["preprocessing"] = {
        {"denoise", preprocessing.denoise},
        {"enhanceContrast", preprocessing.enhanceContrast},
        {"sharpen", preprocessing.sharpen},
        {"binarize", preprocessing.binarize},
        {"normalizeSize", preprocessing.normalizeSize}
    };
    j["enablePostProcessing"] = enablePostProcessing;
    j["qualityThreshold"] = qualityThreshold ? json(*qualityThreshold) : json(nullptr);
    return j;
}

// ==================== JSON ====================

namespace {

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

} // namespace

json toJson(const BoundingBox& bbox) {
    return {{"x0", bbox.x0}, {"y0", bbox.y0}, {"x1", bbox.x1}, {"y1", bbox.y1}};
}

json toJson(const RecognizedWord& word) {
    json j;
    j["text"] = word.text;
    j["confidence"] = round3(word.confidence);
    j["bbox"] = toJson(word.bbox);
    if (word.lineIndex) j["lineIndex"] = *word.lineIndex;
    if (word.paragraphIndex) j["paragraphIndex"] = *word.paragraphIndex;
    if (word.blockIndex) j["blockIndex"] = *word.blockIndex;
    return j;
}

json toJson(const RecognizedPage& page) {
    json paragraphs = json::array();
    for (const auto& paragraph : page.paragraphs) {
        json lines = json::array();
        for (const auto& line : paragraph.lines) {
            json words = json::array();
            for (const auto& word : line.words) {
                words.push_back(toJson(word));
            }
            lines.push_back({
                {"text", line.text},
                {"confidence", round3(line.confidence)},
                {"bbox", toJson(line.bbox)},
                {"words", words}
            });
        }
        paragraphs.push_back({
            {"text", paragraph.text},
            {"confidence", round3(paragraph.confidence)},
            {"bbox", toJson(paragraph.bbox)},
            {"lines", lines}
        });
    }

    json j;
    j["pageNumber"] = page.pageNumber;
    j["width"] = page.width;
    j["height"] = page.height;
    j["text"] = page.text;
    j["confidence"] = round3(page.confidence);
    j["paragraphs"] = paragraphs;
    return j;
}

json toJson(const QualityMetrics& m) {
    json j;
    j["averageWordConfidence"] = round3(m.averageWordConfidence);
    j["averageLineConfidence"] = round3(m.averageLineConfidence);
    j["averageParagraphConfidence"] = round3(m.averageParagraphConfidence);
    j["wordCount"] = m.wordCount;
    j["characterCount"] = m.characterCount;
    j["lineCount"] = m.lineCount;
    j["textDensity"] = m.textDensity;
    j["textRegions"] = m.textRegions;
    j["layoutComplexity"] = round3(m.layoutComplexity);
    j["skewAngle"] = m.skewAngle ? json(round3(*m.skewAngle)) : json(nullptr);
    j["recognizedLanguageConfidence"] = round3(m.languageConfidence);
    j["suspiciousCharacterRatio"] = round3(m.suspiciousCharacterRatio);
    j["whitespaceRatio"] = round3(m.whitespaceRatio);
    j["digitRatio"] = round3(m.digitRatio);
    j["uppercaseRatio"] = round3(m.uppercaseRatio);
    j["hasTableStructure"] = m.hasTableStructure;
    j["hasHandwriting"] = m.hasHandwriting;
    j["imageQuality"] = toString(m.imageQuality);
    return j;
}

json toJson(const EngineResult& result) {
    json pages = json::array();
    for (const auto& page : result.pages) {
        pages.push_back(toJson(page));
    }

    json j;
    j["engine"] = toString(result.engine);
    j["text"] = result.text;
    j["confidence"] = round3(result.confidence);
    j["processingTime"] = result.processingTimeMs;
    j["language"] = result.language;
    j["pages"] = pages;
    j["qualityMetrics"] = toJson(result.qualityMetrics);
    j["metadata"] = {
        {"correlationId", result.metadata.correlationId},
        {"timestamp", result.metadata.timestamp},
        {"version", result.metadata.version},
        {"preprocessing", result.metadata.preprocessing},
        {"postprocessing", result.metadata.postprocessing},
        {"engineVersion", result.metadata.engineVersion}
    };
    if (!result.errors.empty()) j["errors"] = result.errors;
    if (!result.warnings.empty()) j["warnings"] = result.warnings;
    return j;
}

json toJson(const CompleteResult& result) {
    json j;
    j["ocrResult"] = toJson(result.ocrResult);

    if (!result.engineResults.empty()) {
        json engines = json::object();
        for (const auto& [id, engineResult] : result.engineResults) {
            engines[toString(id)] = toJson(engineResult);
        }
        j["engineResults"] = engines;
        j["combinationMethod"] = result.combinationMethod;
    }
    if (result.agreementScore) j["agreementScore"] = round3(*result.agreementScore);

    if (result.postProcessedText) j["postProcessedText"] = *result.postProcessedText;
    json corrections = json::array();
    for (const auto& c : result.textCorrections) {
        corrections.push_back({
            {"original", c.original}, {"corrected", c.corrected},
            {"rule", c.rule}, {"position", c.position}
        });
    }
    j["textCorrections"] = corrections;
    if (result.semanticConfidence) j["semanticConfidence"] = round3(*result.semanticConfidence);

    j["overallQuality"] = round3(result.overallQuality);
    j["processingRecommendations"] = result.recommendations;
    j["totalProcessingTime"] = result.totalProcessingTimeMs;
    j["breakdown"] = {
        {"preprocessing", result.breakdown.preprocessingMs},
        {"ocr", result.breakdown.ocrMs},
        {"postprocessing", result.breakdown.postprocessingMs},
        {"qualityAssessment", result.breakdown.qualityAssessmentMs}
    };
    j["metadata"] = {
        {"correlationId", result.correlationId},
        {"processingId", result.processingId},
        {"timestamp", result.timestamp},
        {"version", result.version},
        {"engineUsed", toString(result.engineUsed)},
        {"fromCache", result.fromCache}
    };

    json errors = json::array();
    for (const auto& e : result.errors) {
        errors.push_back({
            {"stage", e.stage}, {"message", e.message},
            {"severity", e.severity}, {"recoveryAction", e.recoveryAction}
        });
    }
    j["errors"] = errors;

    json warnings = json::array();
    for (const auto& w : result.warnings) {
        warnings.push_back({{"stage", w.stage}, {"message", w.message}, {"impact", w.impact}});
    }
    j["warnings"] = warnings;
    return j;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace multiocr
