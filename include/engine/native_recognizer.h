#pragma once

#include "common/types.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief In-process recognizer owned by exactly one native worker thread
 *
 * Implementations are not required to be thread-safe; the worker pool
 * creates one instance per worker.
 */
class INativeRecognizer {
public:
    virtual ~INativeRecognizer() = default;

    /**
     * @brief Load models / language data
     * @return false with error_msg set when the recognizer cannot be used
     */
    virtual bool initialize(const std::string& language, std::string& error_msg) = 0;

    /**
     * @brief Recognize words in a decoded image
     * @param image BGR or grayscale image
     * @param language engine language code
     * @return word boxes, confidence in [0, 1]
     * @throws OCRError (EngineReportedFailure) when recognition fails
     */
    virtual std::vector<RecognizedWord> recognize(const cv::Mat& image,
                                                  const std::string& language) = 0;

    virtual std::string version() const = 0;
};

using RecognizerFactory = std::function<std::unique_ptr<INativeRecognizer>()>;

} // namespace multiocr
