#pragma once

#include "pipeline/collaborators.h"

namespace multiocr {

/**
 * @brief OpenCV implementation of the preprocessing collaborator
 *
 * Filters run in a fixed order: normalizeSize, denoise, enhanceContrast,
 * sharpen, binarize.
 */
class OpenCvPreprocessor : public IImagePreprocessor {
public:
    explicit OpenCvPreprocessor(int maxSideLen = 2048);

    /**
     * @throws OCRError (ValidationError) for an empty image
     */
    PreprocessOutput apply(const cv::Mat& image, const PreprocessingFlags& flags) override;

private:
    int maxSideLen_;
};

} // namespace multiocr
