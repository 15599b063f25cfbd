#include "preprocessing/image_ops.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace multiocr {

namespace {

// Restore the channel layout of `like` after a grayscale operation
cv::Mat matchChannels(const cv::Mat& gray, const cv::Mat& like) {
    cv::Mat out;
    if (like.channels() == 3) {
        cv::cvtColor(gray, out, cv::COLOR_GRAY2BGR);
    } else if (like.channels() == 4) {
        cv::cvtColor(gray, out, cv::COLOR_GRAY2BGRA);
    } else {
        out = gray;
    }
    return out;
}

} // namespace

cv::Mat ImageOps::resizeByMaxLen(const cv::Mat& image, int max_side_len) {
    int h = image.rows;
    int w = image.cols;
    if (max_side_len <= 0 || std::max(h, w) <= max_side_len) {
        return image.clone();
    }

    float ratio = h > w
        ? static_cast<float>(max_side_len) / h
        : static_cast<float>(max_side_len) / w;

    int resize_h = std::max(1, static_cast<int>(h * ratio));
    int resize_w = std::max(1, static_cast<int>(w * ratio));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(resize_w, resize_h), 0, 0, cv::INTER_AREA);
    return resized;
}

cv::Mat ImageOps::denoise(const cv::Mat& image) {
    cv::Mat out;
    cv::medianBlur(image, out, 3);
    return out;
}

cv::Mat ImageOps::enhanceContrast(const cv::Mat& image) {
    if (image.channels() == 1) {
        cv::Mat out;
        cv::equalizeHist(image, out);
        return out;
    }

    // Equalize luminance only
    cv::Mat bgr;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = image;
    }
    cv::Mat ycrcb;
    cv::cvtColor(bgr, ycrcb, cv::COLOR_BGR2YCrCb);
    std::vector<cv::Mat> channels;
    cv::split(ycrcb, channels);
    cv::equalizeHist(channels[0], channels[0]);
    cv::merge(channels, ycrcb);

    cv::Mat out;
    cv::cvtColor(ycrcb, out, cv::COLOR_YCrCb2BGR);
    if (image.channels() == 4) {
        cv::cvtColor(out, out, cv::COLOR_BGR2BGRA);
    }
    return out;
}

cv::Mat ImageOps::sharpen(const cv::Mat& image) {
    static const cv::Mat kernel = (cv::Mat_<float>(3, 3) <<
         0, -1,  0,
        -1,  5, -1,
         0, -1,  0);
    cv::Mat out;
    cv::filter2D(image, out, -1, kernel);
    return out;
}

cv::Mat ImageOps::binarize(const cv::Mat& image, int threshold) {
    cv::Mat binary;
    cv::threshold(toGray(image), binary, threshold, 255, cv::THRESH_BINARY);
    return matchChannels(binary, image);
}

cv::Mat ImageOps::toGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }
    return gray;
}

} // namespace multiocr
