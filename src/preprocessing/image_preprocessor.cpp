#include "preprocessing/image_preprocessor.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "preprocessing/image_ops.h"

namespace multiocr {

OpenCvPreprocessor::OpenCvPreprocessor(int maxSideLen)
    : maxSideLen_(maxSideLen) {}

PreprocessOutput OpenCvPreprocessor::apply(const cv::Mat& image, const PreprocessingFlags& flags) {
    if (image.empty()) {
        throw OCRError(ErrorKind::ValidationError, "cannot preprocess an empty image");
    }

    PreprocessOutput output;
    output.image = image;

    if (flags.normalizeSize) {
        output.image = ImageOps::resizeByMaxLen(output.image, maxSideLen_);
        output.steps.push_back("normalize_size");
    }
    if (flags.denoise) {
        output.image = ImageOps::denoise(output.image);
        output.steps.push_back("denoise");
    }
    if (flags.enhanceContrast) {
        output.image = ImageOps::enhanceContrast(output.image);
        output.steps.push_back("enhance_contrast");
    }
    if (flags.sharpen) {
        output.image = ImageOps::sharpen(output.image);
        output.steps.push_back("sharpen");
    }
    if (flags.binarize) {
        output.image = ImageOps::binarize(output.image);
        output.steps.push_back("binarize");
    }

    LOG_DEBUG("Preprocessed {}x{} -> {}x{} ({} steps)",
              image.cols, image.rows, output.image.cols, output.image.rows, output.steps.size());
    return output;
}

} // namespace multiocr
