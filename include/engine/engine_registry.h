#pragma once

#include "engine/engine_backend.h"
#include "engine/native_recognizer.h"
#include <atomic>
#include <future>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Per-engine registry settings
 */
struct EngineSettings {
    EngineId id = EngineId::Tesseract;
    bool enabled = true;
    BridgeCommand command;                              // empty executable: native engine
    size_t workers = 0;                                 // native only; 0 = registry default
    std::optional<EngineCapabilities> capabilities;     // overrides the built-in table
};

/**
 * @brief Engine Registry configuration
 */
struct RegistryConfig {
    size_t concurrency = 2;         // queue concurrency; native pool gets min(concurrency, maxNativeWorkers)
    size_t maxNativeWorkers = 4;
    int probeTimeoutMs = 5000;
    std::string nativeLanguage = "eng";
    std::vector<EngineSettings> engines;

    void Show() const;

    /**
     * @brief Tesseract native, EasyOCR and PaddleOCR through the bundled
     *        python bridge scripts under bridgeDir
     */
    static RegistryConfig defaults(const std::string& bridgeDir = "engine/bridges");
};

/**
 * @brief Built-in capability table for an engine
 */
EngineCapabilities defaultCapabilities(EngineId id, size_t workers);

/**
 * @brief Owns every engine backend and its lifecycle
 *
 * The backend map is written only by initialize() and dispose(); everything
 * else reads it without locking, so dispose() must not race with invoke().
 */
class EngineRegistry {
public:
    /**
     * @param nativeFactories recognizer factory per natively hosted engine
     */
    explicit EngineRegistry(RegistryConfig config,
                            std::map<EngineId, RecognizerFactory> nativeFactories = {});
    ~EngineRegistry();

    EngineRegistry(const EngineRegistry&) = delete;
    EngineRegistry& operator=(const EngineRegistry&) = delete;

    /**
     * @brief Start native pools, spawn and probe bridges. An engine that fails
     *        is logged and left out of availableEngines().
     * @return number of engines that came up
     */
    size_t initialize();

    std::set<EngineId> availableEngines() const;
    bool isAvailable(EngineId id) const;

    std::optional<EngineCapabilities> capabilitiesOf(EngineId id) const;

    /**
     * @brief Dispatch one call to the engine's backend
     * @throws OCRError (EngineUnavailable) for unknown, failed or evicted engines
     */
    std::future<RawRecognition> invoke(EngineId id, const EngineRequest& request);

    /**
     * @brief Stop every pool and bridge. Idempotent; continues past failures.
     * @return one message per resource that did not shut down cleanly
     */
    std::vector<std::string> dispose();

    /**
     * @brief Availability of every configured engine, for health reporting
     */
    std::map<EngineId, bool> engineStatus() const;

    size_t workerPoolSize() const;
    size_t bridgeProcessCount() const;
    bool initialized() const { return initialized_; }

private:
    bool startEngine(const EngineSettings& settings, std::string& error_msg);

    RegistryConfig config_;
    std::map<EngineId, RecognizerFactory> nativeFactories_;
    std::map<EngineId, EngineBackend> backends_;
    std::map<EngineId, EngineCapabilities> capabilities_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace multiocr
