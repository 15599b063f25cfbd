#include "pipeline/processing_orchestrator.h"
#include "common/geometry.h"
#include "common/id_generator.h"
#include "common/logger.hpp"
#include "pipeline/quality_assessment.h"
#include "pipeline/quality_metrics.h"
#include "pipeline/result_combiner.h"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <iostream>
#include <set>
#include <thread>

namespace multiocr {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

json errorPayload(const OCRError& e) {
    json payload = {{"kind", toString(e.kind())}, {"message", e.what()}};
    if (e.engine()) payload["engine"] = toString(*e.engine());
    return payload;
}

std::string trimmed(const std::string& text) {
    const char* space = " \t\r\n";
    size_t begin = text.find_first_not_of(space);
    if (begin == std::string::npos) return "";
    return text.substr(begin, text.find_last_not_of(space) - begin + 1);
}

json engineNames(const std::vector<EngineId>& engines) {
    json names = json::array();
    for (EngineId id : engines) names.push_back(toString(id));
    return names;
}

} // namespace

void OrchestratorConfig::Show() const {
    std::cout << "Orchestrator Config:" << std::endl;
    std::cout << "  Backoff base: " << backoffBaseMs << "ms" << std::endl;
    std::cout << "  Event channel capacity: " << eventCapacity << std::endl;
}

ProcessingOrchestrator::ProcessingOrchestrator(EngineRegistry& registry,
                                               OrchestratorConfig config,
                                               Collaborators collaborators)
    : registry_(registry)
    , config_(config)
    , collaborators_(std::move(collaborators))
    , events_(config.eventCapacity)
    , sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (collaborators_.sink) {
        events_.setSink(collaborators_.sink);
    }
}

void ProcessingOrchestrator::setSleepFunction(SleepFunction sleep) {
    std::lock_guard<std::mutex> lock(sleepMutex_);
    sleep_ = std::move(sleep);
}

size_t ProcessingOrchestrator::inFlightCount() const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlight_.size();
}

std::string ProcessingOrchestrator::requestKey(const Document& document, const ProcessingOptions& options) {
    std::string identity;
    if (!document.documentId.empty()) {
        identity = "id:" + document.documentId;
    } else if (document.bytes) {
        identity = "content:" + std::to_string(document.bytes->size()) + ":" +
                   std::to_string(std::hash<std::string>{}(*document.bytes));
    } else {
        identity = "content:0";
    }
    return identity + "|" + options.normalized().dump();
}

const std::vector<EngineId>& ProcessingOrchestrator::fallbackChain(EngineId primary) {
    static const std::map<EngineId, std::vector<EngineId>> kFallbacks = {
        {EngineId::Tesseract, {EngineId::EasyOCR, EngineId::PaddleOCR}},
        {EngineId::EasyOCR,   {EngineId::Tesseract, EngineId::PaddleOCR}},
        {EngineId::PaddleOCR, {EngineId::Tesseract, EngineId::EasyOCR}},
    };
    static const std::vector<EngineId> kNone;
    auto it = kFallbacks.find(primary);
    return it == kFallbacks.end() ? kNone : it->second;
}

// ==================== Entry ====================

CompleteResult ProcessingOrchestrator::process(const Document& document, const ProcessingOptions& options) {
    ProcessingOptions opts = options;
    if (opts.correlationId.empty()) {
        opts.correlationId = IdGenerator::prefixed("ocr");
    }
    const std::string& cid = opts.correlationId;

    events_.publish(EventType::Started, cid, {
        {"documentId", document.documentId},
        {"bytes", document.bytes ? document.bytes->size() : 0},
        {"options", opts.normalized()}
    });
    LOG_INFO("[{}] Processing started (document '{}')", cid, document.documentId);

    const std::string key = requestKey(document, opts);

    // Cache check
    if (auto cached = cacheLookup(key, opts)) {
        cached->fromCache = true;
        LOG_INFO("[{}] Returning cached result", cid);
        events_.publish(EventType::Completed, cid, {
            {"fromCache", true},
            {"overallQuality", cached->overallQuality}
        });
        return *cached;
    }

    // Dedup check: insert-if-absent under the lock
    std::promise<CompleteResult> promise;
    std::shared_future<CompleteResult> shared;
    bool primary = false;
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        auto it = inFlight_.find(key);
        if (it != inFlight_.end()) {
            shared = it->second;
        } else {
            shared = promise.get_future().share();
            inFlight_.emplace(key, shared);
            primary = true;
        }
    }

    if (!primary) {
        LOG_INFO("[{}] Identical request already in flight, awaiting its result", cid);
        try {
            CompleteResult result = shared.get();
            events_.publish(EventType::Completed, cid, {
                {"deduplicated", true},
                {"overallQuality", result.overallQuality}
            });
            return result;
        } catch (const OCRError& e) {
            events_.publish(EventType::Error, cid, errorPayload(e));
            throw;
        }
    }

    try {
        CompleteResult result = execute(document, opts, key);
        {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            inFlight_.erase(key);
        }
        promise.set_value(result);
        return result;
    } catch (const OCRError& e) {
        {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            inFlight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        LOG_ERROR("[{}] Processing failed: {} ({})", cid, e.what(), toString(e.kind()));
        events_.publish(EventType::Error, cid, errorPayload(e));
        throw;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            inFlight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        LOG_ERROR("[{}] Processing failed: {}", cid, e.what());
        events_.publish(EventType::Error, cid, {{"message", e.what()}});
        throw;
    }
}

CompleteResult ProcessingOrchestrator::execute(const Document& document, const ProcessingOptions& options,
                                               const std::string& key) {
    const std::string& cid = options.correlationId;
    auto pipelineStart = std::chrono::steady_clock::now();

    CompleteResult complete;
    complete.correlationId = cid;
    complete.processingId = IdGenerator::prefixed("proc");

    // Preprocessing
    auto stageStart = std::chrono::steady_clock::now();
    PreparedImage prepared = prepare(document, options, complete.warnings);
    complete.breakdown.preprocessingMs = elapsedMs(stageStart);

    // Engine dispatch
    stageStart = std::chrono::steady_clock::now();
    DispatchOutcome outcome = options.isMultiEngine()
        ? dispatchMulti(prepared, options)
        : dispatchSingle(std::get<EngineId>(options.engine), prepared, options);
    complete.breakdown.ocrMs = elapsedMs(stageStart);

    complete.ocrResult = std::move(outcome.result);
    complete.engineResults = std::move(outcome.engineResults);
    complete.combinationMethod = std::move(outcome.combinationMethod);
    complete.agreementScore = outcome.agreementScore;
    complete.engineUsed = complete.ocrResult.engine;
    complete.warnings.insert(complete.warnings.end(), outcome.warnings.begin(), outcome.warnings.end());

    if (options.confidenceThreshold > 0.0 && complete.ocrResult.confidence < options.confidenceThreshold) {
        ProcessingWarning warning;
        warning.stage = "ocr";
        warning.message = fmt::format("Confidence {:.3f} below threshold {}",
                                      complete.ocrResult.confidence, options.confidenceThreshold);
        warning.impact = "medium";
        complete.warnings.push_back(warning);
    }

    // Post-processing
    if (options.enablePostProcessing && collaborators_.postProcessor) {
        events_.publish(EventType::PostProcessing, cid, {{"textLength", complete.ocrResult.text.size()}});
        stageStart = std::chrono::steady_clock::now();
        try {
            PostProcessResult post = collaborators_.postProcessor->process(complete.ocrResult.text, options);
            complete.postProcessedText = std::move(post.correctedText);
            complete.textCorrections = std::move(post.corrections);
            complete.semanticConfidence = post.semanticConfidence;
        } catch (const std::exception& e) {
            LOG_WARN("[{}] Post-processing failed, keeping raw text: {}", cid, e.what());
            ProcessingError error;
            error.stage = "postprocessing";
            error.message = e.what();
            error.severity = "low";
            error.recoveryAction = "Use raw OCR text without post-processing";
            complete.errors.push_back(error);

            ProcessingWarning warning;
            warning.stage = "postprocessing";
            warning.message = "Post-processing failed, using raw OCR text";
            warning.impact = "medium";
            complete.warnings.push_back(warning);
            events_.publish(EventType::Warning, cid, {{"stage", "postprocessing"}, {"message", e.what()}});
        }
        complete.breakdown.postprocessingMs = elapsedMs(stageStart);
    }

    // Quality assessment
    stageStart = std::chrono::steady_clock::now();
    try {
        QualityAssessment assessment = QualityAssessor::assess(
            complete.ocrResult.qualityMetrics, complete.semanticConfidence, complete.agreementScore);
        complete.overallQuality = assessment.score;
        complete.recommendations = std::move(assessment.recommendations);
    } catch (const std::exception& e) {
        LOG_WARN("[{}] Quality assessment failed: {}", cid, e.what());
        complete.overallQuality = 0.0;
        ProcessingWarning warning;
        warning.stage = "quality";
        warning.message = std::string("Quality assessment failed: ") + e.what();
        warning.impact = "low";
        complete.warnings.push_back(warning);
        events_.publish(EventType::Warning, cid, {{"stage", "quality"}, {"message", e.what()}});
    }
    complete.breakdown.qualityAssessmentMs = elapsedMs(stageStart);

    complete.totalProcessingTimeMs = elapsedMs(pipelineStart);
    complete.timestamp = nowMillis();

    cacheStore(key, complete, options);

    events_.publish(EventType::Completed, cid, {
        {"engine", toString(complete.engineUsed)},
        {"overallQuality", complete.overallQuality},
        {"totalProcessingTime", complete.totalProcessingTimeMs},
        {"errorsCount", complete.errors.size()},
        {"warningsCount", complete.warnings.size()}
    });
    LOG_INFO("[{}] Processing completed: engine={}, confidence={:.3f}, quality={:.3f}, {:.1f}ms",
             cid, toString(complete.engineUsed), complete.ocrResult.confidence,
             complete.overallQuality, complete.totalProcessingTimeMs);
    return complete;
}

// ==================== Preprocessing ====================

ProcessingOrchestrator::PreparedImage ProcessingOrchestrator::prepare(
        const Document& document, const ProcessingOptions& options,
        std::vector<ProcessingWarning>& warnings) {
    const std::string& cid = options.correlationId;
    if (!document.bytes || document.bytes->empty()) {
        throw OCRError(ErrorKind::ValidationError, "document has no image data");
    }

    PreparedImage prepared;
    prepared.bytes = document.bytes;

    std::vector<uchar> buffer(document.bytes->begin(), document.bytes->end());
    prepared.image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (prepared.image.empty()) {
        throw OCRError(ErrorKind::ValidationError, "document is not a decodable image");
    }

    if (!options.preprocessing.any()) {
        return prepared;
    }

    events_.publish(EventType::Preprocessing, cid, {
        {"denoise", options.preprocessing.denoise},
        {"enhanceContrast", options.preprocessing.enhanceContrast},
        {"sharpen", options.preprocessing.sharpen},
        {"binarize", options.preprocessing.binarize},
        {"normalizeSize", options.preprocessing.normalizeSize}
    });

    if (!collaborators_.preprocessor) {
        LOG_DEBUG("[{}] Preprocessing requested but no preprocessor installed", cid);
        return prepared;
    }

    try {
        PreprocessOutput output = collaborators_.preprocessor->apply(prepared.image, options.preprocessing);
        if (output.steps.empty() || output.image.empty()) {
            return prepared;
        }

        // Bridged engines receive the filtered image, re-encoded
        std::vector<uchar> encoded;
        if (!cv::imencode(".png", output.image, encoded)) {
            throw std::runtime_error("failed to encode preprocessed image");
        }
        prepared.image = output.image;
        prepared.bytes = std::make_shared<const std::string>(encoded.begin(), encoded.end());
        prepared.steps = std::move(output.steps);
        LOG_DEBUG("[{}] Preprocessing applied {} steps", cid, prepared.steps.size());
    } catch (const std::exception& e) {
        LOG_WARN("[{}] Preprocessing failed, using original image: {}", cid, e.what());
        ProcessingWarning warning;
        warning.stage = "preprocessing";
        warning.message = std::string("Preprocessing failed, original image used: ") + e.what();
        warning.impact = "medium";
        warnings.push_back(warning);
        events_.publish(EventType::Warning, cid, {{"stage", "preprocessing"}, {"message", e.what()}});
    }
    return prepared;
}

// ==================== Dispatch ====================

ProcessingOrchestrator::DispatchOutcome ProcessingOrchestrator::dispatchSingle(
        EngineId primary, const PreparedImage& prepared, const ProcessingOptions& options) {
    const std::string& cid = options.correlationId;
    events_.publish(EventType::EngineSelected, cid, {{"engine", toString(primary)}, {"fallback", false}});

    std::optional<OCRError> lastError;
    const int maxAttempts = std::max(1, options.maxRetries);
    int protocolErrors = 0;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        try {
            LOG_DEBUG("[{}] {} attempt {}/{}", cid, toString(primary), attempt, maxAttempts);
            DispatchOutcome outcome;
            outcome.result = callEngine(primary, prepared, options);
            LOG_INFO("[{}] {} succeeded on attempt {}", cid, toString(primary), attempt);
            return outcome;
        } catch (const OCRError& e) {
            if (e.kind() == ErrorKind::ValidationError) throw;
            lastError = e;
            LOG_WARN("[{}] {} attempt {} failed: {} ({})",
                     cid, toString(primary), attempt, e.what(), toString(e.kind()));

            bool retry = e.isRetryable();
            if (e.kind() == ErrorKind::BridgeProtocolError && ++protocolErrors > 1) {
                retry = false;
            }
            if (!retry || attempt == maxAttempts) break;
            backoff(attempt, cid);
        }
    }

    if (options.enableFallback) {
        for (EngineId fallback : fallbackChain(primary)) {
            if (!registry_.isAvailable(fallback)) {
                LOG_DEBUG("[{}] Fallback {} not available, skipped", cid, toString(fallback));
                continue;
            }
            events_.publish(EventType::EngineSelected, cid, {{"engine", toString(fallback)}, {"fallback", true}});
            try {
                LOG_INFO("[{}] Attempting fallback engine {}", cid, toString(fallback));
                DispatchOutcome outcome;
                outcome.result = callEngine(fallback, prepared, options);
                ProcessingWarning warning;
                warning.stage = "ocr";
                warning.message = fmt::format("{} failed, result produced by fallback engine {}",
                                              toString(primary), toString(fallback));
                warning.impact = "low";
                outcome.warnings.push_back(warning);
                return outcome;
            } catch (const OCRError& e) {
                if (e.kind() == ErrorKind::ValidationError) throw;
                lastError = e;
                LOG_WARN("[{}] Fallback engine {} failed: {}", cid, toString(fallback), e.what());
            }
        }
    }

    if (!lastError) {
        throw OCRError(ErrorKind::AllEnginesFailed, "no engine attempt was made");
    }
    throw OCRError::allEnginesFailed(
        std::string("all engines failed for primary ") + toString(primary), *lastError);
}

ProcessingOrchestrator::DispatchOutcome ProcessingOrchestrator::dispatchMulti(
        const PreparedImage& prepared, const ProcessingOptions& options) {
    const std::string& cid = options.correlationId;

    std::vector<EngineId> engines;
    if (options.isEnsemble()) {
        std::set<EngineId> available = registry_.availableEngines();
        engines.assign(available.begin(), available.end());
    } else {
        std::set<EngineId> seen;
        for (EngineId id : std::get<std::vector<EngineId>>(options.engine)) {
            if (id != EngineId::Ensemble && seen.insert(id).second) engines.push_back(id);
        }
    }
    events_.publish(EventType::EngineSelected, cid, {{"engines", engineNames(engines)}, {"ensemble", true}});

    if (engines.empty()) {
        throw OCRError(ErrorKind::AllEnginesFailed, "no engines available for a multi-engine run");
    }

    // Launch every call before waiting on any of them
    EngineRequest request = makeRequest(prepared, options);
    std::vector<std::pair<EngineId, std::future<RawRecognition>>> pending;
    std::optional<OCRError> lastError;
    DispatchOutcome outcome;

    auto recordFailure = [&](EngineId id, const OCRError& e) {
        lastError = e;
        LOG_WARN("[{}] {} failed in multi-engine run: {}", cid, toString(id), e.what());
        ProcessingWarning warning;
        warning.stage = "ocr";
        warning.message = fmt::format("{} failed: {}", toString(id), e.what());
        warning.impact = "low";
        outcome.warnings.push_back(warning);
    };

    for (EngineId id : engines) {
        try {
            pending.emplace_back(id, registry_.invoke(id, request));
        } catch (const OCRError& e) {
            recordFailure(id, e);
        }
    }

    std::map<EngineId, EngineResult> successes;
    for (auto& [id, future] : pending) {
        try {
            EngineResult result = buildEngineResult(future.get(), prepared, options);
            events_.publish(EventType::EngineCompleted, cid, {
                {"engine", toString(id)},
                {"confidence", result.confidence},
                {"textLength", result.text.size()}
            });
            successes.emplace(id, std::move(result));
        } catch (const OCRError& e) {
            recordFailure(id, e);
        } catch (const std::exception& e) {
            recordFailure(id, OCRError(ErrorKind::EngineReportedFailure, e.what(), id));
        }
    }

    if (successes.empty()) {
        throw OCRError::allEnginesFailed(
            fmt::format("all {} engines failed", engines.size()), *lastError);
    }

    EnsembleResult ensemble = ResultCombiner::combine(successes);
    ensemble.combined.metadata.correlationId = cid;
    outcome.result = std::move(ensemble.combined);
    outcome.engineResults = std::move(ensemble.engineResults);
    outcome.combinationMethod = std::move(ensemble.combinationMethod);
    outcome.agreementScore = ensemble.agreementScore;

    LOG_INFO("[{}] Multi-engine run: {} of {} engines succeeded, agreement {:.3f}",
             cid, outcome.engineResults.size(), engines.size(), ensemble.agreementScore);
    return outcome;
}

EngineResult ProcessingOrchestrator::callEngine(EngineId id, const PreparedImage& prepared,
                                                const ProcessingOptions& options) {
    std::future<RawRecognition> future = registry_.invoke(id, makeRequest(prepared, options));
    RawRecognition raw;
    try {
        raw = future.get();
    } catch (const OCRError&) {
        throw;
    } catch (const std::exception& e) {
        throw OCRError(ErrorKind::EngineReportedFailure, e.what(), id);
    }

    EngineResult result = buildEngineResult(std::move(raw), prepared, options);
    events_.publish(EventType::EngineCompleted, options.correlationId, {
        {"engine", toString(id)},
        {"confidence", result.confidence},
        {"textLength", result.text.size()}
    });
    return result;
}

EngineRequest ProcessingOrchestrator::makeRequest(const PreparedImage& prepared,
                                                  const ProcessingOptions& options) const {
    EngineRequest request;
    request.imageBytes = prepared.bytes;
    request.image = prepared.image;
    request.language = options.language;
    request.timeoutMs = options.timeoutMs;
    request.correlationId = options.correlationId;
    return request;
}

EngineResult ProcessingOrchestrator::buildEngineResult(RawRecognition raw, const PreparedImage& prepared,
                                                       const ProcessingOptions& options) const {
    const int width = prepared.image.cols;
    const int height = prepared.image.rows;

    bool textOnly = raw.words.empty() && !trimmed(raw.text).empty();
    if (textOnly) {
        // Keep the engine's text as a single word on a single line
        RecognizedWord word;
        word.text = trimmed(raw.text);
        word.confidence = raw.confidence;
        raw.words.push_back(std::move(word));
    }

    EngineResult result;
    result.engine = raw.engine;
    result.pages.push_back(Geometry::buildPage(raw.words, 1, width, height));
    Geometry::finalizeResult(result);
    result.processingTimeMs = raw.elapsedMs;
    result.language = options.language;
    result.qualityMetrics = QualityMetricsCalculator::calculate(result.pages, result.text, width, height);

    result.metadata.correlationId = options.correlationId;
    result.metadata.timestamp = nowMillis();
    result.metadata.preprocessing = prepared.steps;
    result.metadata.engineVersion = raw.engineVersion;

    if (textOnly) {
        result.warnings.push_back("engine returned text without word boxes");
    }
    return result;
}

// ==================== Helpers ====================

std::optional<CompleteResult> ProcessingOrchestrator::cacheLookup(const std::string& key,
                                                                  const ProcessingOptions& options) {
    if (!options.enableCaching || !collaborators_.cache) return std::nullopt;
    try {
        return collaborators_.cache->lookup(key);
    } catch (const std::exception& e) {
        LOG_WARN("[{}] Cache lookup failed, ignored: {}", options.correlationId, e.what());
        return std::nullopt;
    }
}

void ProcessingOrchestrator::cacheStore(const std::string& key, const CompleteResult& result,
                                        const ProcessingOptions& options) {
    if (!options.enableCaching || !collaborators_.cache) return;
    try {
        collaborators_.cache->store(key, result);
    } catch (const std::exception& e) {
        LOG_WARN("[{}] Cache store failed, ignored: {}", options.correlationId, e.what());
    }
}

void ProcessingOrchestrator::backoff(int attempt, const std::string& correlationId) {
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(config_.backoffBaseMs) << attempt);
    LOG_DEBUG("[{}] Backing off {}ms before attempt {}", correlationId, delay.count(), attempt + 1);

    SleepFunction sleep;
    {
        std::lock_guard<std::mutex> lock(sleepMutex_);
        sleep = sleep_;
    }
    sleep(delay);
}

} // namespace multiocr
