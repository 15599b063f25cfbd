#pragma once

#include "common/concurrent_queue.hpp"
#include "engine/native_recognizer.h"
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace multiocr {

struct NativeJob {
    cv::Mat image;
    std::string language;
    std::string correlationId;
};

/**
 * @brief Raw output of one native job, before layout grouping
 */
struct NativeJobResult {
    std::vector<RecognizedWord> words;
    std::string engineVersion;
    double elapsedMs = 0.0;
};

/**
 * @brief Fixed pool of native recognition workers on a shared job queue
 *
 * Each worker thread owns its own recognizer instance created by the factory.
 * A job runs to completion once a worker picks it up.
 */
class NativeWorkerPool {
public:
    NativeWorkerPool(size_t numWorkers, RecognizerFactory factory, size_t queueCapacity = 256);
    ~NativeWorkerPool();

    NativeWorkerPool(const NativeWorkerPool&) = delete;
    NativeWorkerPool& operator=(const NativeWorkerPool&) = delete;

    /**
     * @brief Create and initialize every worker's recognizer, then start threads
     * @return false if any recognizer failed to initialize (no threads started)
     */
    bool start(const std::string& language, std::string& error_msg);

    /**
     * @brief Queue a job
     * @throws OCRError (EngineUnavailable) if the pool is not running or the
     *         queue is full
     */
    std::future<NativeJobResult> submit(NativeJob job);

    /**
     * @brief Finish queued jobs and join the workers. Idempotent.
     */
    void shutdown();

    bool running() const { return running_; }
    size_t size() const { return numWorkers_; }
    size_t pendingJobs() const { return queue_.size(); }
    std::string engineVersion() const { return engineVersion_; }

private:
    struct Task {
        NativeJob job;
        std::promise<NativeJobResult> promise;
    };

    void workerLoop(size_t workerIndex, INativeRecognizer* recognizer);

    const size_t numWorkers_;
    RecognizerFactory factory_;
    ConcurrentQueue<Task> queue_;
    std::vector<std::unique_ptr<INativeRecognizer>> recognizers_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::string engineVersion_;
};

} // namespace multiocr
