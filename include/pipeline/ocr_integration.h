#pragma once

#include "common/types.hpp"
#include "engine/engine_registry.h"
#include "pipeline/processing_orchestrator.h"
#include <map>
#include <string>

namespace multiocr {

/**
 * @brief Health snapshot of the engines behind the service
 */
struct HealthStatus {
    bool healthy = false;
    std::map<EngineId, bool> engines;
    size_t workerPoolSize = 0;
    size_t bridgeProcessCount = 0;

    json toJson() const;
};

/**
 * @brief Public entry point of the coordination layer
 *
 * Validates the request, runs the orchestrator and returns a structured
 * result. Only ValidationError and AllEnginesFailed escape process().
 */
class OCRIntegrationService {
public:
    OCRIntegrationService(EngineRegistry& registry, ProcessingOrchestrator& orchestrator);

    /**
     * @throws OCRError (ValidationError, AllEnginesFailed)
     */
    CompleteResult processDocument(const Document& document, const ProcessingOptions& options);

    HealthStatus healthCheck() const;

    /**
     * @brief Check options and document before any engine work
     * @return false with error_msg set when the request must be rejected
     */
    static bool Validate(const Document& document, const ProcessingOptions& options, std::string& error_msg);

private:
    EngineRegistry& registry_;
    ProcessingOrchestrator& orchestrator_;
};

} // namespace multiocr
