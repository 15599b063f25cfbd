#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace multiocr {
namespace testing {

/**
 * @brief PNG bytes of a blank white page
 */
inline std::string blankPng(int width = 320, int height = 240) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<uchar> encoded;
    if (!cv::imencode(".png", image, encoded)) {
        throw std::runtime_error("cv::imencode failed");
    }
    return std::string(encoded.begin(), encoded.end());
}

inline std::shared_ptr<const std::string> blankPngBytes(int width = 320, int height = 240) {
    return std::make_shared<const std::string>(blankPng(width, height));
}

} // namespace testing
} // namespace multiocr
