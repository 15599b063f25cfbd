#include "engine/engine_backend.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/bridge_protocol.h"
#include <chrono>

namespace multiocr {

// ==================== NativeEngine ====================

NativeEngine::NativeEngine(EngineId id, std::unique_ptr<NativeWorkerPool> pool)
    : id_(id)
    , pool_(std::move(pool)) {}

bool NativeEngine::start(const std::string& language, std::string& error_msg) {
    return pool_ && pool_->start(language, error_msg);
}

std::future<RawRecognition> NativeEngine::invoke(const EngineRequest& request) {
    if (!available()) {
        throw OCRError(ErrorKind::EngineUnavailable,
                       std::string(toString(id_)) + " worker pool is not running", id_);
    }

    NativeJob job;
    job.image = request.image;
    job.language = request.language;
    job.correlationId = request.correlationId;
    std::future<NativeJobResult> pending = pool_->submit(std::move(job));

    EngineId id = id_;
    int timeoutMs = request.timeoutMs;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    return std::async(std::launch::deferred,
        [id, timeoutMs, deadline, pending = std::move(pending)]() mutable -> RawRecognition {
            if (pending.wait_until(deadline) != std::future_status::ready) {
                // The worker keeps running the job; its result is dropped
                throw OCRError(ErrorKind::EngineTimeout,
                               std::string(toString(id)) + " timed out after " +
                               std::to_string(timeoutMs) + "ms", id);
            }
            NativeJobResult result = pending.get();

            RawRecognition raw;
            raw.engine = id;
            raw.words = std::move(result.words);
            raw.engineVersion = std::move(result.engineVersion);
            raw.elapsedMs = result.elapsedMs;
            return raw;
        });
}

std::vector<std::string> NativeEngine::stop() {
    if (pool_) {
        pool_->shutdown();
    }
    return {};
}

bool NativeEngine::available() const {
    return pool_ && pool_->running();
}

size_t NativeEngine::workers() const {
    return available() ? pool_->size() : 0;
}

// ==================== BridgedEngine ====================

BridgedEngine::BridgedEngine(EngineId id, BridgeCommand command)
    : id_(id)
    , bridge_(std::make_unique<ProcessBridge>(id, std::move(command))) {}

bool BridgedEngine::start(int probeTimeoutMs, std::string& error_msg) {
    if (!bridge_->spawn(error_msg)) {
        return false;
    }
    if (!bridge_->probe(probeTimeoutMs)) {
        error_msg = "probe failed";
        bridge_->terminate();
        return false;
    }
    actor_ = std::make_unique<SerialExecutor>(toString(id_));
    return true;
}

std::future<RawRecognition> BridgedEngine::invoke(const EngineRequest& request) {
    if (!available()) {
        throw OCRError(ErrorKind::EngineUnavailable,
                       std::string(toString(id_)) + " worker is not available", id_);
    }

    ProcessBridge* bridge = bridge_.get();
    EngineId id = id_;
    std::shared_ptr<const std::string> bytes = request.imageBytes;
    std::string language = request.language;
    int timeoutMs = request.timeoutMs;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    try {
        return actor_->submit([bridge, id, bytes, language, timeoutMs, deadline]() -> RawRecognition {
            auto started = std::chrono::steady_clock::now();
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - started).count();
            if (remaining <= 0) {
                // Spent queued behind other calls; the worker itself is healthy
                throw OCRError(ErrorKind::EngineTimeout,
                               std::string(toString(id)) + " timed out after " +
                               std::to_string(timeoutMs) + "ms waiting for the worker", id);
            }
            json response = bridge->invoke(bytes ? *bytes : std::string(), language,
                                           static_cast<int>(remaining));

            RawRecognition raw;
            raw.engine = id;
            raw.words = BridgeProtocol::parseWords(response, id);
            raw.text = BridgeProtocol::responseText(response);
            raw.confidence = BridgeProtocol::responseConfidence(response);
            if (response.contains("version") && response["version"].is_string()) {
                raw.engineVersion = response["version"].get<std::string>();
            } else {
                raw.engineVersion = toString(id);
            }
            raw.elapsedMs = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - started).count();
            return raw;
        });
    } catch (const std::runtime_error& e) {
        throw OCRError(ErrorKind::EngineUnavailable, e.what(), id_);
    }
}

std::vector<std::string> BridgedEngine::stop() {
    std::vector<std::string> errors;
    // Kill first so an in-flight call ends on EOF instead of its timeout
    if (!bridge_->terminate()) {
        errors.push_back(std::string(toString(id_)) + ": worker pid could not be reaped");
    }
    if (actor_) {
        actor_->shutdown();
    }
    return errors;
}

bool BridgedEngine::available() const {
    return actor_ && bridge_->isAvailable();
}

bool BridgedEngine::processAlive() const {
    return bridge_->pid() > 0;
}

} // namespace multiocr
