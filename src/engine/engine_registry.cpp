#include "engine/engine_registry.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <iostream>

namespace multiocr {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

void RegistryConfig::Show() const {
    std::cout << "Registry Config:" << std::endl;
    std::cout << "  Concurrency: " << concurrency << " (native max " << maxNativeWorkers << ")" << std::endl;
    std::cout << "  Probe timeout: " << probeTimeoutMs << "ms" << std::endl;
    std::cout << "  Native language: " << nativeLanguage << std::endl;
    for (const auto& engine : engines) {
        std::cout << "  - " << toString(engine.id)
                  << (engine.enabled ? "" : " (disabled)") << ": "
                  << (engine.command.executable.empty() ? "native" : engine.command.describe())
                  << std::endl;
    }
}

RegistryConfig RegistryConfig::defaults(const std::string& bridgeDir) {
    RegistryConfig config;

    EngineSettings tesseract;
    tesseract.id = EngineId::Tesseract;
    config.engines.push_back(tesseract);

    EngineSettings easyocr;
    easyocr.id = EngineId::EasyOCR;
    easyocr.command.executable = "python3";
    easyocr.command.args = {bridgeDir + "/easyocr_bridge.py"};
    config.engines.push_back(easyocr);

    EngineSettings paddleocr;
    paddleocr.id = EngineId::PaddleOCR;
    paddleocr.command.executable = "python3";
    paddleocr.command.args = {bridgeDir + "/paddleocr_bridge.py"};
    config.engines.push_back(paddleocr);

    return config;
}

EngineCapabilities defaultCapabilities(EngineId id, size_t workers) {
    EngineCapabilities caps;
    switch (id) {
        case EngineId::Tesseract:
            caps.languages = {"eng", "spa", "fra", "deu", "chi_sim", "chi_tra", "jpn", "kor", "ara", "hin", "rus"};
            caps.formats = {"jpg", "jpeg", "png", "bmp", "tiff", "pdf"};
            caps.features = {"text_detection", "layout_analysis", "confidence_scoring", "multiple_languages"};
            caps.specialties = {"printed_text", "documents"};
            caps.maxConcurrency = static_cast<int>(std::max<size_t>(workers, 1));
            break;
        case EngineId::EasyOCR:
            caps.languages = {"en", "es", "fr", "de", "zh", "ja", "ko", "ar", "hi", "ru"};
            caps.formats = {"jpg", "jpeg", "png", "bmp"};
            caps.features = {"text_detection", "paragraph_detection", "confidence_scoring"};
            caps.specialties = {"receipts", "invoices", "forms"};
            caps.maxConcurrency = 1;
            break;
        case EngineId::PaddleOCR:
            caps.languages = {"en", "ch", "ta", "te", "ka", "ja", "ko"};
            caps.formats = {"jpg", "jpeg", "png", "bmp"};
            caps.features = {"text_detection", "angle_classification", "layout_analysis", "multilingual"};
            caps.specialties = {"complex_layouts", "rotated_text", "multilingual_documents"};
            caps.maxConcurrency = 1;
            break;
        case EngineId::Ensemble:
            break;
    }
    return caps;
}

EngineRegistry::EngineRegistry(RegistryConfig config,
                               std::map<EngineId, RecognizerFactory> nativeFactories)
    : config_(std::move(config))
    , nativeFactories_(std::move(nativeFactories)) {}

EngineRegistry::~EngineRegistry() {
    std::vector<std::string> errors = dispose();
    for (const auto& error : errors) {
        LOG_WARN("Registry teardown: {}", error);
    }
}

size_t EngineRegistry::initialize() {
    if (initialized_) return availableEngines().size();
    LOG_INFO("Initializing engine registry ({} engines configured)", config_.engines.size());

    for (const auto& settings : config_.engines) {
        if (settings.id == EngineId::Ensemble) {
            LOG_WARN("'ensemble' is not an engine backend, ignored");
            continue;
        }
        if (!settings.enabled) {
            LOG_INFO("[{}] disabled by configuration", toString(settings.id));
            continue;
        }
        if (backends_.count(settings.id)) {
            LOG_WARN("[{}] configured twice, keeping the first entry", toString(settings.id));
            continue;
        }

        std::string error_msg;
        if (!startEngine(settings, error_msg)) {
            LOG_WARN("[{}] unavailable: {}", toString(settings.id), error_msg);
        }
    }

    initialized_ = true;
    disposed_ = false;

    std::set<EngineId> available = availableEngines();
    std::string names;
    for (EngineId id : available) {
        if (!names.empty()) names += ", ";
        names += toString(id);
    }
    LOG_INFO("Engine registry ready: {} of {} engines available [{}]",
             available.size(), config_.engines.size(), names);
    return available.size();
}

bool EngineRegistry::startEngine(const EngineSettings& settings, std::string& error_msg) {
    if (settings.command.executable.empty()) {
        auto factory = nativeFactories_.find(settings.id);
        if (factory == nativeFactories_.end()) {
            error_msg = "no native recognizer and no bridge command";
            return false;
        }

        size_t workers = settings.workers > 0
            ? settings.workers
            : std::min(std::max<size_t>(config_.concurrency, 1), config_.maxNativeWorkers);
        NativeEngine engine(settings.id, std::make_unique<NativeWorkerPool>(workers, factory->second));
        if (!engine.start(config_.nativeLanguage, error_msg)) {
            return false;
        }

        capabilities_[settings.id] = settings.capabilities.value_or(defaultCapabilities(settings.id, workers));
        backends_.emplace(settings.id, EngineBackend(std::move(engine)));
        return true;
    }

    BridgedEngine engine(settings.id, settings.command);
    if (!engine.start(config_.probeTimeoutMs, error_msg)) {
        for (const auto& stopError : engine.stop()) {
            LOG_WARN("[{}] cleanup after failed start: {}", toString(settings.id), stopError);
        }
        return false;
    }

    capabilities_[settings.id] = settings.capabilities.value_or(defaultCapabilities(settings.id, 1));
    backends_.emplace(settings.id, EngineBackend(std::move(engine)));
    return true;
}

std::set<EngineId> EngineRegistry::availableEngines() const {
    std::set<EngineId> available;
    if (disposed_) return available;
    for (const auto& [id, backend] : backends_) {
        bool up = std::visit([](const auto& engine) { return engine.available(); }, backend);
        if (up) available.insert(id);
    }
    return available;
}

bool EngineRegistry::isAvailable(EngineId id) const {
    if (disposed_) return false;
    auto it = backends_.find(id);
    if (it == backends_.end()) return false;
    return std::visit([](const auto& engine) { return engine.available(); }, it->second);
}

std::optional<EngineCapabilities> EngineRegistry::capabilitiesOf(EngineId id) const {
    if (disposed_) return std::nullopt;
    auto it = capabilities_.find(id);
    if (it == capabilities_.end()) return std::nullopt;
    return it->second;
}

std::future<RawRecognition> EngineRegistry::invoke(EngineId id, const EngineRequest& request) {
    if (id == EngineId::Ensemble) {
        throw OCRError(ErrorKind::EngineUnavailable, "ensemble is not a dispatchable engine");
    }
    auto it = backends_.find(id);
    if (disposed_ || it == backends_.end()) {
        throw OCRError(ErrorKind::EngineUnavailable,
                       std::string(toString(id)) + " is not registered", id);
    }
    return std::visit([&request](auto& engine) { return engine.invoke(request); }, it->second);
}

std::vector<std::string> EngineRegistry::dispose() {
    std::vector<std::string> errors;
    if (disposed_.exchange(true)) {
        return errors;
    }

    for (auto& [id, backend] : backends_) {
        std::vector<std::string> engineErrors = std::visit(overloaded{
            [](NativeEngine& engine) { return engine.stop(); },
            [](BridgedEngine& engine) { return engine.stop(); }
        }, backend);
        errors.insert(errors.end(), engineErrors.begin(), engineErrors.end());
    }
    backends_.clear();
    capabilities_.clear();
    initialized_ = false;

    if (errors.empty()) {
        LOG_INFO("Engine registry disposed");
    } else {
        LOG_WARN("Engine registry disposed with {} errors", errors.size());
    }
    return errors;
}

std::map<EngineId, bool> EngineRegistry::engineStatus() const {
    std::map<EngineId, bool> status;
    for (const auto& settings : config_.engines) {
        if (settings.id == EngineId::Ensemble) continue;
        status[settings.id] = isAvailable(settings.id);
    }
    return status;
}

size_t EngineRegistry::workerPoolSize() const {
    if (disposed_) return 0;
    size_t total = 0;
    for (const auto& [id, backend] : backends_) {
        if (const NativeEngine* native = std::get_if<NativeEngine>(&backend)) {
            total += native->workers();
        }
    }
    return total;
}

size_t EngineRegistry::bridgeProcessCount() const {
    if (disposed_) return 0;
    size_t count = 0;
    for (const auto& [id, backend] : backends_) {
        if (const BridgedEngine* bridged = std::get_if<BridgedEngine>(&backend)) {
            if (bridged->processAlive()) ++count;
        }
    }
    return count;
}

} // namespace multiocr
