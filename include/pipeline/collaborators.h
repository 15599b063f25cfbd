#pragma once

#include "common/types.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Result cache keyed by document identity and normalized options
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    virtual std::optional<CompleteResult> lookup(const std::string& key) = 0;
    virtual void store(const std::string& key, const CompleteResult& result) = 0;
};

struct PostProcessResult {
    std::string correctedText;
    std::vector<TextCorrection> corrections;
    double semanticConfidence = 0.0;    // [0, 1]
};

/**
 * @brief Text correction and semantic scoring applied after recognition
 */
class IPostProcessor {
public:
    virtual ~IPostProcessor() = default;

    virtual PostProcessResult process(const std::string& text, const ProcessingOptions& options) = 0;
};

struct PreprocessOutput {
    cv::Mat image;
    std::vector<std::string> steps;     // names of the filters actually applied
};

/**
 * @brief Image filters applied before recognition
 */
class IImagePreprocessor {
public:
    virtual ~IImagePreprocessor() = default;

    virtual PreprocessOutput apply(const cv::Mat& image, const PreprocessingFlags& flags) = 0;
};

} // namespace multiocr
