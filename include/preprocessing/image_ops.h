#pragma once

#include <opencv2/core.hpp>

namespace multiocr {

/**
 * @brief Image filters used ahead of recognition
 *
 * Every function returns a new image and leaves the input untouched.
 * Output keeps the input's channel count unless stated otherwise.
 */
class ImageOps {
public:
    static constexpr int kMaxSideLen = 2048;
    static constexpr int kBinarizeThreshold = 128;

    /**
     * @brief Downscale so that the longer side is at most max_side_len.
     *        Images already within the limit are returned as-is.
     */
    static cv::Mat resizeByMaxLen(const cv::Mat& image, int max_side_len = kMaxSideLen);

    /**
     * @brief Median blur with a 3x3 kernel
     */
    static cv::Mat denoise(const cv::Mat& image);

    /**
     * @brief Histogram equalization on the luminance channel
     */
    static cv::Mat enhanceContrast(const cv::Mat& image);

    /**
     * @brief 3x3 sharpening kernel
     */
    static cv::Mat sharpen(const cv::Mat& image);

    /**
     * @brief Fixed threshold on grayscale; the result is converted back to the
     *        input's channel count
     */
    static cv::Mat binarize(const cv::Mat& image, int threshold = kBinarizeThreshold);

    /**
     * @brief Single channel 8-bit view of the image
     */
    static cv::Mat toGray(const cv::Mat& image);
};

} // namespace multiocr
