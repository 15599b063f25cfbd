#include "engine/native_worker_pool.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>

namespace multiocr {

NativeWorkerPool::NativeWorkerPool(size_t numWorkers, RecognizerFactory factory, size_t queueCapacity)
    : numWorkers_(numWorkers == 0 ? 1 : numWorkers)
    , factory_(std::move(factory))
    , queue_(queueCapacity) {}

NativeWorkerPool::~NativeWorkerPool() {
    shutdown();
}

bool NativeWorkerPool::start(const std::string& language, std::string& error_msg) {
    if (running_) return true;
    if (!factory_) {
        error_msg = "no recognizer factory";
        return false;
    }

    recognizers_.clear();
    for (size_t i = 0; i < numWorkers_; ++i) {
        std::unique_ptr<INativeRecognizer> recognizer = factory_();
        if (!recognizer) {
            error_msg = "recognizer factory returned null";
            recognizers_.clear();
            return false;
        }
        if (!recognizer->initialize(language, error_msg)) {
            recognizers_.clear();
            return false;
        }
        recognizers_.push_back(std::move(recognizer));
    }
    engineVersion_ = recognizers_.front()->version();

    running_ = true;
    workers_.reserve(numWorkers_);
    for (size_t i = 0; i < numWorkers_; ++i) {
        workers_.emplace_back(&NativeWorkerPool::workerLoop, this, i, recognizers_[i].get());
    }

    LOG_INFO("Native worker pool started: {} workers ({})", numWorkers_, engineVersion_);
    return true;
}

std::future<NativeJobResult> NativeWorkerPool::submit(NativeJob job) {
    if (!running_) {
        throw OCRError(ErrorKind::EngineUnavailable, "native worker pool is not running");
    }

    Task task;
    task.job = std::move(job);
    std::future<NativeJobResult> future = task.promise.get_future();
    if (!queue_.tryPush(std::move(task))) {
        throw OCRError(ErrorKind::EngineUnavailable, "native job queue is full or closed");
    }
    return future;
}

void NativeWorkerPool::shutdown() {
    queue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (running_) {
        LOG_INFO("Native worker pool stopped");
    }
    workers_.clear();
    recognizers_.clear();
    running_ = false;
}

void NativeWorkerPool::workerLoop(size_t workerIndex, INativeRecognizer* recognizer) {
    while (true) {
        std::optional<Task> task = queue_.pop();
        if (!task) {
            return;
        }

        LOG_DEBUG("[Worker {}] job {}", workerIndex, task->job.correlationId);
        auto started = std::chrono::steady_clock::now();
        try {
            NativeJobResult result;
            result.words = recognizer->recognize(task->job.image, task->job.language);
            result.engineVersion = recognizer->version();
            result.elapsedMs = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - started).count();
            task->promise.set_value(std::move(result));
        } catch (...) {
            // Delivered to the waiting caller through the future
            task->promise.set_exception(std::current_exception());
        }
    }
}

} // namespace multiocr
