#pragma once

#include "common/logger.hpp"
#include "common/types.hpp"
#include "engine/engine_registry.h"
#include "engine/tesseract_recognizer.h"
#include "pipeline/processing_orchestrator.h"
#include <string>

namespace multiocr {

struct CacheConfig {
    bool enabled = true;
    size_t capacity = 128;
};

struct ServerConfig {
    int port = 8080;
    int threads = 4;
};

/**
 * @brief Everything the service reads from its JSON configuration file
 *
 * Every section is optional; missing keys keep the defaults below.
 */
struct ServiceConfig {
    LoggerConfig logging;
    RegistryConfig registry = RegistryConfig::defaults();
    TesseractConfig tesseract;
    OrchestratorConfig orchestrator;
    CacheConfig cache;
    ServerConfig server;
    bool enablePostProcessor = true;
    bool enablePreprocessor = true;
    ProcessingOptions defaults;

    void Show() const;

    /**
     * @throws OCRError (ValidationError) on a malformed section
     */
    static ServiceConfig FromJson(const json& j);
};

/**
 * @brief Read and parse a configuration file
 * @return false with error_msg set if the file is missing or invalid
 */
bool LoadServiceConfig(const std::string& path, ServiceConfig& config, std::string& error_msg);

/**
 * @brief Overlay request options onto defaults
 *
 * Accepted keys: language, engine (name or list of names), confidenceThreshold,
 * timeout, maxRetries, enableFallback, correlationId, preprocessing{...},
 * enablePostProcessing, enableCaching, qualityThreshold.
 * @throws OCRError (ValidationError) for unknown engines or mistyped values
 */
ProcessingOptions ParseProcessingOptions(const json& j, const ProcessingOptions& defaults);

} // namespace multiocr
