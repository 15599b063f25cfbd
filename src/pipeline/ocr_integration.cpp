#include "pipeline/ocr_integration.h"
#include "common/errors.hpp"
#include "common/id_generator.h"
#include "common/logger.hpp"
#include <regex>

namespace multiocr {

namespace {

constexpr int kMaxTimeoutMs = 10 * 60 * 1000;
constexpr int kMaxRetries = 10;

bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // namespace

json HealthStatus::toJson() const {
    json enginesJson = json::object();
    for (const auto& [id, up] : engines) {
        enginesJson[toString(id)] = up;
    }
    return {
        {"status", healthy ? "healthy" : "unhealthy"},
        {"engines", enginesJson},
        {"workerPoolSize", workerPoolSize},
        {"bridgeProcessCount", bridgeProcessCount}
    };
}

OCRIntegrationService::OCRIntegrationService(EngineRegistry& registry, ProcessingOrchestrator& orchestrator)
    : registry_(registry)
    , orchestrator_(orchestrator) {}

bool OCRIntegrationService::Validate(const Document& document, const ProcessingOptions& options,
                                     std::string& error_msg) {
    if (!document.bytes || document.bytes->empty()) {
        error_msg = "document image is empty";
        return false;
    }

    static const std::regex kLanguage("^[A-Za-z_]{2,16}(\\+[A-Za-z_]{2,16})*$");
    if (!std::regex_match(options.language, kLanguage)) {
        error_msg = "invalid language code '" + options.language + "'";
        return false;
    }

    if (options.timeoutMs <= 0 || options.timeoutMs > kMaxTimeoutMs) {
        error_msg = "timeout must be in (0, " + std::to_string(kMaxTimeoutMs) + "] ms";
        return false;
    }
    if (options.maxRetries < 1 || options.maxRetries > kMaxRetries) {
        error_msg = "maxRetries must be in [1, " + std::to_string(kMaxRetries) + "]";
        return false;
    }
    if (!inUnitRange(options.confidenceThreshold)) {
        error_msg = "confidenceThreshold must be in [0, 1]";
        return false;
    }
    if (options.qualityThreshold && !inUnitRange(*options.qualityThreshold)) {
        error_msg = "qualityThreshold must be in [0, 1]";
        return false;
    }

    if (const auto* list = std::get_if<std::vector<EngineId>>(&options.engine)) {
        if (list->empty()) {
            error_msg = "engine list is empty";
            return false;
        }
        for (EngineId id : *list) {
            if (id == EngineId::Ensemble) {
                error_msg = "'ensemble' cannot appear in an engine list";
                return false;
            }
        }
    }
    return true;
}

CompleteResult OCRIntegrationService::processDocument(const Document& document, const ProcessingOptions& options) {
    ProcessingOptions opts = options;
    if (opts.correlationId.empty()) {
        opts.correlationId = IdGenerator::prefixed("ocr");
    }

    std::string error_msg;
    if (!Validate(document, opts, error_msg)) {
        LOG_WARN("[{}] Request rejected: {}", opts.correlationId, error_msg);
        throw OCRError(ErrorKind::ValidationError, error_msg);
    }

    CompleteResult result;
    try {
        result = orchestrator_.process(document, opts);
    } catch (const OCRError& e) {
        if (e.kind() == ErrorKind::ValidationError || e.kind() == ErrorKind::AllEnginesFailed) {
            throw;
        }
        // Anything else from dispatch means no engine produced a result
        throw OCRError::allEnginesFailed("processing failed", e);
    } catch (const std::exception& e) {
        throw OCRError::allEnginesFailed("processing failed",
                                         OCRError(ErrorKind::EngineReportedFailure, e.what()));
    }

    if (opts.qualityThreshold && result.overallQuality < *opts.qualityThreshold) {
        ProcessingWarning warning;
        warning.stage = "quality";
        warning.message = fmt::format("Quality score {:.3f} below threshold {}",
                                      result.overallQuality, *opts.qualityThreshold);
        warning.impact = "high";
        result.warnings.push_back(warning);
        LOG_WARN("[{}] {}", opts.correlationId, warning.message);
    }
    return result;
}

HealthStatus OCRIntegrationService::healthCheck() const {
    HealthStatus status;
    status.engines = registry_.engineStatus();
    for (const auto& [id, up] : status.engines) {
        if (up) status.healthy = true;
    }
    status.workerPoolSize = registry_.workerPoolSize();
    status.bridgeProcessCount = registry_.bridgeProcessCount();
    return status;
}

} // namespace multiocr
