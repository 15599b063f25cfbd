#pragma once

#include "common/errors.hpp"
#include "engine/engine_registry.h"
#include "engine/native_recognizer.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace multiocr {
namespace testing {

/**
 * @brief Shared behaviour of every ScriptedRecognizer made by one factory
 */
struct RecognizerScript {
    std::vector<RecognizedWord> words;
    std::string version = "scripted-1.0";
    int failFirst = 0;                  // calls 1..failFirst throw
    bool failAlways = false;
    ErrorKind failureKind = ErrorKind::EngineReportedFailure;
    bool failInitialize = false;
    int delayMs = 0;
    std::atomic<int> calls{0};
    std::atomic<int> initializations{0};

    static RecognizedWord word(const std::string& text, double confidence, int x0, int y0 = 20) {
        RecognizedWord w;
        w.text = text;
        w.confidence = confidence;
        w.bbox = BoundingBox{x0, y0, x0 + 12 * static_cast<int>(text.size()), y0 + 24};
        return w;
    }
};

/**
 * @brief Native recognizer whose answers are scripted by a RecognizerScript
 */
class ScriptedRecognizer : public INativeRecognizer {
public:
    explicit ScriptedRecognizer(std::shared_ptr<RecognizerScript> script)
        : script_(std::move(script)) {}

    bool initialize(const std::string& language, std::string& error_msg) override {
        ++script_->initializations;
        if (script_->failInitialize) {
            error_msg = "scripted initialization failure for " + language;
            return false;
        }
        return true;
    }

    std::vector<RecognizedWord> recognize(const cv::Mat& image, const std::string& language) override {
        int call = ++script_->calls;
        if (script_->delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(script_->delayMs));
        }
        if (script_->failAlways || call <= script_->failFirst) {
            throw OCRError(script_->failureKind,
                           "scripted failure " + std::to_string(call) + " (" + language + ")");
        }
        (void)image;
        return script_->words;
    }

    std::string version() const override { return script_->version; }

private:
    std::shared_ptr<RecognizerScript> script_;
};

inline RecognizerFactory scriptedFactory(std::shared_ptr<RecognizerScript> script) {
    return [script]() { return std::make_unique<ScriptedRecognizer>(script); };
}

/**
 * @brief Settings for a natively hosted engine with one worker
 */
inline EngineSettings nativeSettings(EngineId id, size_t workers = 1) {
    EngineSettings settings;
    settings.id = id;
    settings.workers = workers;
    return settings;
}

} // namespace testing
} // namespace multiocr
