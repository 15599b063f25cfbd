#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"
#include "engine/engine_registry.h"
#include "pipeline/collaborators.h"
#include "pipeline/processing_events.h"
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace multiocr {

struct OrchestratorConfig {
    int backoffBaseMs = 1000;           // delay before retry n is 2^n * base
    size_t eventCapacity = 1024;

    void Show() const;
};

/**
 * @brief Optional collaborators; any of them may be left empty
 */
struct Collaborators {
    std::shared_ptr<ICacheStore> cache;
    std::shared_ptr<IPostProcessor> postProcessor;
    std::shared_ptr<IImagePreprocessor> preprocessor;
    EventSink sink;
};

/**
 * @brief Input document. documentId is the caller's identity for the bytes;
 *        when empty the content itself identifies the document.
 */
struct Document {
    std::string documentId;
    std::shared_ptr<const std::string> bytes;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Turns one request into one or many engine invocations
 *
 * Stages: cache check, dedup, preprocessing, engine dispatch, post-processing,
 * quality assessment. Every stage publishes a ProcessingEvent on events().
 * Identical concurrent requests share one execution.
 */
class ProcessingOrchestrator {
public:
    ProcessingOrchestrator(EngineRegistry& registry,
                           OrchestratorConfig config = {},
                           Collaborators collaborators = {});

    ProcessingOrchestrator(const ProcessingOrchestrator&) = delete;
    ProcessingOrchestrator& operator=(const ProcessingOrchestrator&) = delete;

    /**
     * @brief Run the full pipeline for one document
     * @throws OCRError ValidationError for undecodable input,
     *         AllEnginesFailed when no engine produced a result
     */
    CompleteResult process(const Document& document, const ProcessingOptions& options);

    EventChannel& events() { return events_; }

    /**
     * @brief Replace the backoff sleep (tests record delays instead of waiting)
     */
    void setSleepFunction(SleepFunction sleep);

    size_t inFlightCount() const;

    /**
     * @brief Dedup and cache key: document identity plus normalized options
     */
    static std::string requestKey(const Document& document, const ProcessingOptions& options);

    /**
     * @brief Engines tried after the primary exhausted its retries
     */
    static const std::vector<EngineId>& fallbackChain(EngineId primary);

private:
    struct PreparedImage {
        cv::Mat image;
        std::shared_ptr<const std::string> bytes;
        std::vector<std::string> steps;
    };

    struct DispatchOutcome {
        EngineResult result;
        std::map<EngineId, EngineResult> engineResults;
        std::string combinationMethod;
        std::optional<double> agreementScore;
        std::vector<ProcessingWarning> warnings;
    };

    CompleteResult execute(const Document& document, const ProcessingOptions& options,
                           const std::string& key);

    PreparedImage prepare(const Document& document, const ProcessingOptions& options,
                          std::vector<ProcessingWarning>& warnings);

    DispatchOutcome dispatchSingle(EngineId primary, const PreparedImage& prepared,
                                   const ProcessingOptions& options);
    DispatchOutcome dispatchMulti(const PreparedImage& prepared, const ProcessingOptions& options);

    EngineResult callEngine(EngineId id, const PreparedImage& prepared, const ProcessingOptions& options);
    EngineResult buildEngineResult(RawRecognition raw, const PreparedImage& prepared,
                                   const ProcessingOptions& options) const;
    EngineRequest makeRequest(const PreparedImage& prepared, const ProcessingOptions& options) const;

    std::optional<CompleteResult> cacheLookup(const std::string& key, const ProcessingOptions& options);
    void cacheStore(const std::string& key, const CompleteResult& result, const ProcessingOptions& options);

    void backoff(int attempt, const std::string& correlationId);

    EngineRegistry& registry_;
    OrchestratorConfig config_;
    Collaborators collaborators_;
    EventChannel events_;

    std::mutex sleepMutex_;
    SleepFunction sleep_;

    mutable std::mutex inFlightMutex_;
    std::map<std::string, std::shared_future<CompleteResult>> inFlight_;
};

} // namespace multiocr
