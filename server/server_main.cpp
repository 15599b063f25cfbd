#include "ocr_handler.h"
#include "json_response.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/engine_registry.h"
#include "engine/tesseract_recognizer.h"
#include "pipeline/memory_cache.h"
#include "pipeline/ocr_integration.h"
#include "pipeline/processing_orchestrator.h"
#include "pipeline/service_config.h"
#include "pipeline/text_postprocessor.h"
#include "preprocessing/image_preprocessor.h"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace multiocr_server;

namespace {

crow::response JsonResponse(int status_code, const json& body) {
    crow::response res(status_code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <path>      JSON configuration file\n"
              << "  -p, --port <port>        Server port (default: 8080)\n"
              << "  -t, --threads <num>      Number of threads (default: 4)\n"
              << "  -l, --log-dir <path>     Log directory (default: logs)\n"
              << "  -h, --help               Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    int port = -1;
    int threads = -1;
    std::string log_dir;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"port",     required_argument, 0, 'p'},
        {"threads",  required_argument, 0, 't'},
        {"log-dir",  required_argument, 0, 'l'},
        {"help",     no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 解析命令行参数
    int opt;
    int option_index = 0;
    try {
        while ((opt = getopt_long(argc, argv, "c:p:t:l:h", long_options, &option_index)) != -1) {
            switch (opt) {
                case 'c':
                    config_path = optarg;
                    break;
                case 'p':
                    port = std::stoi(optarg);
                    break;
                case 't':
                    threads = std::stoi(optarg);
                    break;
                case 'l':
                    log_dir = optarg;
                    break;
                case 'h':
                    PrintUsage(argv[0]);
                    return 0;
                default:
                    std::cerr << "Use -h or --help for usage information\n";
                    return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric option: " << e.what() << "\n";
        return 1;
    }

    // 加载配置, 命令行参数优先
    multiocr::ServiceConfig config;
    if (!config_path.empty()) {
        std::string error_msg;
        if (!multiocr::LoadServiceConfig(config_path, config, error_msg)) {
            std::cerr << "Error: " << error_msg << "\n";
            return 1;
        }
    }
    if (port > 0) config.server.port = port;
    if (threads > 0) config.server.threads = threads;
    if (!log_dir.empty()) config.logging.logDir = log_dir;

    try {
        multiocr::InitLogger(config.logging);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Error: logger initialization failed: " << ex.what() << "\n";
        return 1;
    }

    LOG_INFO("========== MultiOCR Server Starting ==========");
    LOG_INFO("Log directory: {}", config.logging.logDir);
    config.Show();

    // Engines
    std::map<multiocr::EngineId, multiocr::RecognizerFactory> native_factories = {
        {multiocr::EngineId::Tesseract, multiocr::TesseractRecognizer::factory(config.tesseract)}
    };
    multiocr::EngineRegistry registry(config.registry, native_factories);
    size_t available = registry.initialize();
    if (available == 0) {
        LOG_WARN("No OCR engine is available; /ocr will answer 502 until restart");
    }

    // Pipeline
    multiocr::Collaborators collaborators;
    if (config.cache.enabled) {
        collaborators.cache = std::make_shared<multiocr::MemoryCacheStore>(config.cache.capacity);
    }
    if (config.enablePostProcessor) {
        collaborators.postProcessor = std::make_shared<multiocr::RuleBasedPostProcessor>();
    }
    if (config.enablePreprocessor) {
        collaborators.preprocessor = std::make_shared<multiocr::OpenCvPreprocessor>();
    }
    // Events are consumed here; the bounded channel behind it evicts its oldest entries
    collaborators.sink = [](const multiocr::ProcessingEvent& event) {
        LOG_DEBUG("[{}] {} {}", event.correlationId, multiocr::toString(event.type), event.payload.dump());
    };

    multiocr::ProcessingOrchestrator orchestrator(registry, config.orchestrator, collaborators);
    multiocr::OCRIntegrationService service(registry, orchestrator);
    OCRHandler ocr_handler(service);
    const multiocr::ProcessingOptions defaults = config.defaults;

    crow::SimpleApp app;

    // 健康检查接口
    CROW_ROUTE(app, "/health")
    ([&ocr_handler]() {
        json response_json;
        int status_code = ocr_handler.HandleHealth(response_json);
        return JsonResponse(status_code, response_json);
    });

    // OCR识别接口
    CROW_ROUTE(app, "/ocr").methods(crow::HTTPMethod::POST)
    ([&ocr_handler, defaults](const crow::request& req) {
        LOG_INFO("Received OCR request from {}", req.remote_ip_address);

        try {
            json request_json = json::parse(req.body);
            auto ocr_request = OCRRequest::FromJson(request_json, defaults);

            json response_json;
            int status_code = ocr_handler.HandleRequest(ocr_request, response_json);
            return JsonResponse(status_code, response_json);

        } catch (const json::exception& e) {
            LOG_ERROR("JSON parse error: {}", e.what());
            return JsonResponse(400, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON format: ") + e.what()));

        } catch (const multiocr::OCRError& e) {
            LOG_WARN("Invalid request options: {}", e.what());
            return JsonResponse(400, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, e.what()));

        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error: {}", e.what());
            return JsonResponse(500, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INTERNAL_ERROR, std::string("Internal server error: ") + e.what()));
        }
    });

    LOG_INFO("Starting server on port {} with {} threads...", config.server.port, config.server.threads);
    LOG_INFO("Endpoints:");
    LOG_INFO("  - POST   /ocr           (OCR Recognition)");
    LOG_INFO("  - GET    /health        (Health Check)");
    LOG_INFO("===============================================");

    app.port(static_cast<uint16_t>(config.server.port))
       .concurrency(static_cast<uint16_t>(config.server.threads))
       .run();

    LOG_INFO("Server stopped, releasing engines");
    for (const auto& error : registry.dispose()) {
        LOG_WARN("Shutdown: {}", error);
    }
    multiocr::FlushLogger();
    return 0;
}
