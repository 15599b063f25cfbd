#include "engine/bridge_protocol.h"
#include "common/errors.hpp"
#include <algorithm>
#include <cmath>

namespace multiocr {

namespace {

double normalizeConfidence(double confidence) {
    if (confidence > 1.0) confidence /= 100.0;
    return std::clamp(confidence, 0.0, 1.0);
}

int coordinate(const json& bbox, const char* key) {
    if (!bbox.contains(key) || !bbox[key].is_number()) {
        throw OCRError(ErrorKind::BridgeProtocolError,
                       std::string("bbox without numeric '") + key + "'");
    }
    return static_cast<int>(std::lround(bbox[key].get<double>()));
}

} // namespace

std::vector<RecognizedWord> BridgeProtocol::parseWords(const json& response, EngineId engine) {
    std::vector<RecognizedWord> words;
    if (!response.contains("results") || response["results"].is_null()) {
        return words;
    }

    const json& results = response["results"];
    if (!results.is_array()) {
        throw OCRError(ErrorKind::BridgeProtocolError, "'results' is not an array", engine);
    }

    for (const auto& item : results) {
        if (!item.is_object() || !item.contains("text") || !item["text"].is_string()) {
            throw OCRError(ErrorKind::BridgeProtocolError, "result entry without text", engine);
        }

        RecognizedWord word;
        word.text = item["text"].get<std::string>();
        if (word.text.empty()) continue;

        double confidence = 0.0;
        if (item.contains("confidence") && item["confidence"].is_number()) {
            confidence = item["confidence"].get<double>();
        }
        word.confidence = normalizeConfidence(confidence);

        if (item.contains("bbox")) {
            const json& bbox = item["bbox"];
            if (!bbox.is_object()) {
                throw OCRError(ErrorKind::BridgeProtocolError, "result bbox is not an object", engine);
            }
            try {
                word.bbox.x0 = coordinate(bbox, "x0");
                word.bbox.y0 = coordinate(bbox, "y0");
                word.bbox.x1 = coordinate(bbox, "x1");
                word.bbox.y1 = coordinate(bbox, "y1");
            } catch (const OCRError& e) {
                throw OCRError(ErrorKind::BridgeProtocolError, e.what(), engine);
            }
        }
        words.push_back(std::move(word));
    }
    return words;
}

std::string BridgeProtocol::responseText(const json& response) {
    if (response.contains("text") && response["text"].is_string()) {
        return response["text"].get<std::string>();
    }
    return "";
}

double BridgeProtocol::responseConfidence(const json& response) {
    if (response.contains("confidence") && response["confidence"].is_number()) {
        return normalizeConfidence(response["confidence"].get<double>());
    }
    return 0.0;
}

} // namespace multiocr
