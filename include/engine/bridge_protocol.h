#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Decoding of bridge worker responses
 */
class BridgeProtocol {
public:
    /**
     * @brief Word boxes from a success response's "results" array
     *
     * Confidences above 1 are taken as percentages. Entries with empty text
     * are skipped; a missing "results" array yields no words.
     * @throws OCRError (BridgeProtocolError) when an entry has the wrong shape
     */
    static std::vector<RecognizedWord> parseWords(const json& response, EngineId engine);

    /**
     * @brief The worker's own flattened text, empty if absent
     */
    static std::string responseText(const json& response);

    /**
     * @brief Top-level "confidence" of the response in [0, 1], 0 if absent
     */
    static double responseConfidence(const json& response);
};

} // namespace multiocr
