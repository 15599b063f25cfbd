#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace multiocr {

using json = nlohmann::json;

// ==================== Engines ====================

/**
 * @brief Closed set of recognition engines. Ensemble is synthetic and is
 *        never dispatched to a backend.
 */
enum class EngineId {
    Tesseract,
    EasyOCR,
    PaddleOCR,
    Ensemble
};

const char* toString(EngineId id);

/**
 * @brief Parse "tesseract" / "easyocr" / "paddleocr" / "ensemble"
 * @return false for anything else
 */
bool parseEngineId(const std::string& name, EngineId& id);

/**
 * @brief The three dispatchable engines, in fallback-table order
 */
const std::vector<EngineId>& concreteEngines();

struct EngineCapabilities {
    std::vector<std::string> languages;
    std::vector<std::string> formats;
    std::vector<std::string> features;
    std::vector<std::string> specialties;
    int maxConcurrency = 1;

    bool supportsLanguage(const std::string& language) const;
};

// ==================== Recognized layout ====================

struct BoundingBox {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    int width() const { return x1 - x0; }
    int height() const { return y1 - y0; }
    bool operator==(const BoundingBox& other) const {
        return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
    }
};

struct RecognizedWord {
    std::string text;
    double confidence = 0.0;   // [0, 1]
    BoundingBox bbox;
    std::optional<int> lineIndex;
    std::optional<int> paragraphIndex;
    std::optional<int> blockIndex;
};

struct RecognizedLine {
    std::string text;
    double confidence = 0.0;
    BoundingBox bbox;
    std::vector<RecognizedWord> words;
};

struct RecognizedParagraph {
    std::string text;
    double confidence = 0.0;
    BoundingBox bbox;
    std::vector<RecognizedLine> lines;
};

struct RecognizedPage {
    int pageNumber = 1;
    int width = 0;
    int height = 0;
    std::string text;
    double confidence = 0.0;
    std::vector<RecognizedParagraph> paragraphs;

    std::vector<RecognizedLine> allLines() const;
    std::vector<RecognizedWord> allWords() const;
};

// ==================== Quality ====================

enum class ImageQuality {
    Poor,
    Fair,
    Good,
    Excellent
};

const char* toString(ImageQuality quality);

struct QualityMetrics {
    double averageWordConfidence = 0.0;
    double averageLineConfidence = 0.0;
    double averageParagraphConfidence = 0.0;
    size_t wordCount = 0;
    size_t characterCount = 0;
    size_t lineCount = 0;
    double textDensity = 0.0;           // characters per pixel
    size_t textRegions = 0;
    double layoutComplexity = 0.0;      // [0, 1]
    std::optional<double> skewAngle;    // degrees
    double languageConfidence = 0.0;
    double suspiciousCharacterRatio = 0.0;
    double whitespaceRatio = 0.0;
    double digitRatio = 0.0;
    double uppercaseRatio = 0.0;
    bool hasTableStructure = false;
    bool hasHandwriting = false;
    ImageQuality imageQuality = ImageQuality::Fair;
};

// ==================== Engine results ====================

struct ResultMetadata {
    std::string correlationId;
    int64_t timestamp = 0;              // unix epoch milliseconds
    std::string version = "1.0.0";
    std::vector<std::string> preprocessing;
    std::vector<std::string> postprocessing;
    std::string engineVersion;
};

/**
 * @brief Output of one engine invocation. text is always the page texts
 *        joined by '\n'.
 */
struct EngineResult {
    EngineId engine = EngineId::Tesseract;
    std::vector<RecognizedPage> pages;
    std::string text;
    double confidence = 0.0;
    double processingTimeMs = 0.0;
    std::string language;
    QualityMetrics qualityMetrics;
    ResultMetadata metadata;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/**
 * @brief Combined multi-engine result; combined.engine is EngineId::Ensemble
 */
struct EnsembleResult {
    EngineResult combined;
    std::map<EngineId, EngineResult> engineResults;
    std::string combinationMethod;
    double agreementScore = 1.0;
};

// ==================== Options ====================

/**
 * @brief Single engine (EngineId::Ensemble means every available engine)
 *        or an explicit list run in parallel
 */
using EngineSelector = std::variant<EngineId, std::vector<EngineId>>;

struct PreprocessingFlags {
    bool denoise = false;
    bool enhanceContrast = false;
    bool sharpen = false;
    bool binarize = false;
    bool normalizeSize = false;

    bool any() const { return denoise || enhanceContrast || sharpen || binarize || normalizeSize; }
};

struct ProcessingOptions {
    std::string language = "eng";
    EngineSelector engine = EngineId::Tesseract;
    double confidenceThreshold = 0.0;
    int timeoutMs = 60000;
    int maxRetries = 2;
    bool enableFallback = true;
    std::string correlationId;

    PreprocessingFlags preprocessing;
    bool enablePostProcessing = true;
    bool enableCaching = false;
    std::optional<double> qualityThreshold;

    bool isEnsemble() const;
    bool isMultiEngine() const;

    /**
     * @brief Canonical JSON of every option except correlationId, used for
     *        deduplication and cache keys
     */
    json normalized() const;
};

// ==================== Events ====================

enum class EventType {
    Started,
    EngineSelected,
    Preprocessing,
    EngineCompleted,
    PostProcessing,
    Completed,
    Error,
    Warning
};

const char* toString(EventType type);

struct ProcessingEvent {
    EventType type = EventType::Started;
    std::string correlationId;
    int64_t timestamp = 0;
    json payload;
};

// ==================== Complete result ====================

struct TextCorrection {
    std::string original;
    std::string corrected;
    std::string rule;
    size_t position = 0;
};

struct ProcessingError {
    std::string stage;
    std::string message;
    std::string severity;        // low / medium / high / critical
    std::string recoveryAction;
};

struct ProcessingWarning {
    std::string stage;
    std::string message;
    std::string impact;          // low / medium / high
};

struct StageBreakdown {
    double preprocessingMs = 0.0;
    double ocrMs = 0.0;
    double postprocessingMs = 0.0;
    double qualityAssessmentMs = 0.0;
};

struct CompleteResult {
    EngineResult ocrResult;
    std::map<EngineId, EngineResult> engineResults;   // filled for multi-engine runs
    std::string combinationMethod;
    std::optional<double> agreementScore;

    std::optional<std::string> postProcessedText;
    std::vector<TextCorrection> textCorrections;
    std::optional<double> semanticConfidence;

    double overallQuality = 0.0;
    std::vector<std::string> recommendations;

    double totalProcessingTimeMs = 0.0;
    StageBreakdown breakdown;

    std::string correlationId;
    std::string processingId;
    int64_t timestamp = 0;
    std::string version = "1.0.0";
    EngineId engineUsed = EngineId::Tesseract;
    bool fromCache = false;

    std::vector<ProcessingError> errors;
    std::vector<ProcessingWarning> warnings;
};

// ==================== JSON ====================

json toJson(const BoundingBox& bbox);
json toJson(const RecognizedWord& word);
json toJson(const RecognizedPage& page);
json toJson(const QualityMetrics& metrics);
json toJson(const EngineResult& result);
json toJson(const CompleteResult& result);

/**
 * @brief Current wall-clock time in unix epoch milliseconds
 */
int64_t nowMillis();

} // namespace multiocr
