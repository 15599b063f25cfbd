#include "pipeline/service_config.h"
#include "common/errors.hpp"
#include <fstream>
#include <iostream>

namespace multiocr {

namespace {

template<typename T>
void readIf(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw OCRError(ErrorKind::ValidationError,
                       std::string("invalid value for '") + key + "': " + e.what());
    }
}

EngineId engineFromName(const std::string& name) {
    EngineId id;
    if (!parseEngineId(name, id)) {
        throw OCRError(ErrorKind::ValidationError, "unknown engine '" + name + "'");
    }
    return id;
}

EngineSelector parseSelector(const json& j) {
    if (j.is_string()) {
        return engineFromName(j.get<std::string>());
    }
    if (j.is_array()) {
        std::vector<EngineId> engines;
        for (const auto& item : j) {
            if (!item.is_string()) {
                throw OCRError(ErrorKind::ValidationError, "engine list must contain names");
            }
            engines.push_back(engineFromName(item.get<std::string>()));
        }
        return engines;
    }
    throw OCRError(ErrorKind::ValidationError, "engine must be a name or a list of names");
}

EngineCapabilities parseCapabilities(const json& j, EngineCapabilities caps) {
    readIf(j, "languages", caps.languages);
    readIf(j, "formats", caps.formats);
    readIf(j, "features", caps.features);
    readIf(j, "specialties", caps.specialties);
    readIf(j, "maxConcurrency", caps.maxConcurrency);
    return caps;
}

EngineSettings parseEngine(const json& j) {
    if (!j.is_object() || !j.contains("id")) {
        throw OCRError(ErrorKind::ValidationError, "engine entry needs an 'id'");
    }
    EngineSettings settings;
    std::string name;
    readIf(j, "id", name);
    settings.id = engineFromName(name);
    readIf(j, "enabled", settings.enabled);
    readIf(j, "workers", settings.workers);

    if (j.contains("command")) {
        std::vector<std::string> argv;
        readIf(j, "command", argv);
        if (!argv.empty()) {
            settings.command.executable = argv.front();
            settings.command.args.assign(argv.begin() + 1, argv.end());
        }
    }
    if (j.contains("capabilities")) {
        settings.capabilities = parseCapabilities(j["capabilities"],
                                                  defaultCapabilities(settings.id, settings.workers));
    }
    return settings;
}

} // namespace

ProcessingOptions ParseProcessingOptions(const json& j, const ProcessingOptions& defaults) {
    ProcessingOptions options = defaults;
    if (!j.is_object()) return options;

    readIf(j, "language", options.language);
    if (j.contains("engine") && !j["engine"].is_null()) {
        options.engine = parseSelector(j["engine"]);
    }
    readIf(j, "confidenceThreshold", options.confidenceThreshold);
    readIf(j, "timeout", options.timeoutMs);
    readIf(j, "maxRetries", options.maxRetries);
    readIf(j, "enableFallback", options.enableFallback);
    readIf(j, "correlationId", options.correlationId);
    readIf(j, "enablePostProcessing", options.enablePostProcessing);
    readIf(j, "enableCaching", options.enableCaching);

    if (j.contains("qualityThreshold") && !j["qualityThreshold"].is_null()) {
        double threshold = 0.0;
        readIf(j, "qualityThreshold", threshold);
        options.qualityThreshold = threshold;
    }

    if (j.contains("preprocessing") && j["preprocessing"].is_object()) {
        const json& p = j["preprocessing"];
        readIf(p, "denoise", options.preprocessing.denoise);
        readIf(p, "enhanceContrast", options.preprocessing.enhanceContrast);
        readIf(p, "sharpen", options.preprocessing.sharpen);
        readIf(p, "binarize", options.preprocessing.binarize);
        readIf(p, "normalizeSize", options.preprocessing.normalizeSize);
    }
    return options;
}

ServiceConfig ServiceConfig::FromJson(const json& j) {
    ServiceConfig config;
    if (!j.is_object()) {
        throw OCRError(ErrorKind::ValidationError, "configuration root must be an object");
    }

    if (j.contains("logging")) {
        const json& l = j["logging"];
        readIf(l, "logDir", config.logging.logDir);
        readIf(l, "logFile", config.logging.logFile);
        readIf(l, "level", config.logging.level);
        readIf(l, "maxFileSize", config.logging.maxFileSize);
        readIf(l, "maxFiles", config.logging.maxFiles);
        readIf(l, "console", config.logging.enableConsole);
        readIf(l, "file", config.logging.enableFile);
    }

    if (j.contains("registry")) {
        const json& r = j["registry"];
        std::string bridgeDir = "engine/bridges";
        readIf(r, "bridgeDir", bridgeDir);
        config.registry = RegistryConfig::defaults(bridgeDir);
        readIf(r, "concurrency", config.registry.concurrency);
        readIf(r, "maxNativeWorkers", config.registry.maxNativeWorkers);
        readIf(r, "probeTimeoutMs", config.registry.probeTimeoutMs);
        readIf(r, "nativeLanguage", config.registry.nativeLanguage);

        if (r.contains("engines")) {
            if (!r["engines"].is_array()) {
                throw OCRError(ErrorKind::ValidationError, "registry.engines must be an array");
            }
            config.registry.engines.clear();
            for (const auto& engine : r["engines"]) {
                config.registry.engines.push_back(parseEngine(engine));
            }
        }
    }

    if (j.contains("tesseract")) {
        const json& t = j["tesseract"];
        readIf(t, "tessdataPath", config.tesseract.tessdataPath);
        readIf(t, "pageSegMode", config.tesseract.pageSegMode);
        readIf(t, "dpi", config.tesseract.dpi);
    }

    if (j.contains("orchestrator")) {
        const json& o = j["orchestrator"];
        readIf(o, "backoffBaseMs", config.orchestrator.backoffBaseMs);
        readIf(o, "eventCapacity", config.orchestrator.eventCapacity);
    }

    if (j.contains("cache")) {
        readIf(j["cache"], "enabled", config.cache.enabled);
        readIf(j["cache"], "capacity", config.cache.capacity);
    }

    if (j.contains("server")) {
        readIf(j["server"], "port", config.server.port);
        readIf(j["server"], "threads", config.server.threads);
    }

    readIf(j, "postProcessor", config.enablePostProcessor);
    readIf(j, "preprocessor", config.enablePreprocessor);

    if (j.contains("defaults")) {
        config.defaults = ParseProcessingOptions(j["defaults"], config.defaults);
    }
    return config;
}

bool LoadServiceConfig(const std::string& path, ServiceConfig& config, std::string& error_msg) {
    std::ifstream file(path);
    if (!file) {
        error_msg = "cannot open config file: " + path;
        return false;
    }

    try {
        json j = json::parse(file);
        config = ServiceConfig::FromJson(j);
    } catch (const json::exception& e) {
        error_msg = "invalid JSON in " + path + ": " + e.what();
        return false;
    } catch (const OCRError& e) {
        error_msg = path + ": " + e.what();
        return false;
    }
    return true;
}

void ServiceConfig::Show() const {
    logging.Show();
    registry.Show();
    tesseract.Show();
    orchestrator.Show();
    std::cout << "Cache: " << (cache.enabled ? "enabled" : "disabled")
              << " (capacity " << cache.capacity << ")" << std::endl;
    std::cout << "Post-processor: " << (enablePostProcessor ? "enabled" : "disabled") << std::endl;
    std::cout << "Preprocessor: " << (enablePreprocessor ? "enabled" : "disabled") << std::endl;
    std::cout << "Server: port " << server.port << ", " << server.threads << " threads" << std::endl;
    std::cout << "Default options: " << defaults.normalized().dump() << std::endl;
}

} // namespace multiocr
