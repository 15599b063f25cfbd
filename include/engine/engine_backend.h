#pragma once

#include "common/serial_executor.hpp"
#include "common/types.hpp"
#include "engine/native_worker_pool.h"
#include "engine/process_bridge.h"
#include <opencv2/core.hpp>
#include <future>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace multiocr {

/**
 * @brief One engine call. Native engines read the decoded image, bridged
 *        engines the encoded bytes.
 */
struct EngineRequest {
    std::shared_ptr<const std::string> imageBytes;
    cv::Mat image;
    std::string language;
    int timeoutMs = 60000;
    std::string correlationId;
};

/**
 * @brief Engine output before layout grouping
 */
struct RawRecognition {
    EngineId engine = EngineId::Tesseract;
    std::vector<RecognizedWord> words;
    std::string text;              // engine's own flattened text, bridges only
    double confidence = 0.0;       // response-level confidence, bridges only
    std::string engineVersion;
    double elapsedMs = 0.0;
};

/**
 * @brief In-process engine: a NativeWorkerPool
 */
class NativeEngine {
public:
    NativeEngine(EngineId id, std::unique_ptr<NativeWorkerPool> pool);

    bool start(const std::string& language, std::string& error_msg);

    /**
     * @brief Queue the job now; the returned future gives up once
     *        request.timeoutMs has passed since this call
     */
    std::future<RawRecognition> invoke(const EngineRequest& request);

    std::vector<std::string> stop();

    bool available() const;
    size_t workers() const;
    EngineId id() const { return id_; }

private:
    EngineId id_;
    std::unique_ptr<NativeWorkerPool> pool_;
};

/**
 * @brief Out-of-process engine: a ProcessBridge driven by a one-thread actor
 */
class BridgedEngine {
public:
    BridgedEngine(EngineId id, BridgeCommand command);

    /**
     * @brief Spawn the worker and probe it
     */
    bool start(int probeTimeoutMs, std::string& error_msg);

    /**
     * @brief Queue the call on the actor. request.timeoutMs counts from this
     *        call, time spent queued included; a call whose budget ran out
     *        in the queue fails with EngineTimeout without touching the worker.
     */
    std::future<RawRecognition> invoke(const EngineRequest& request);

    std::vector<std::string> stop();

    bool available() const;
    bool processAlive() const;
    EngineId id() const { return id_; }
    const ProcessBridge& bridge() const { return *bridge_; }

private:
    EngineId id_;
    std::unique_ptr<ProcessBridge> bridge_;
    std::unique_ptr<SerialExecutor> actor_;
};

using EngineBackend = std::variant<NativeEngine, BridgedEngine>;

} // namespace multiocr
