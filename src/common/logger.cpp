#include "common/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace multiocr {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void LoggerConfig::Show() const {
    std::cout << "Logger Config:" << std::endl;
    std::cout << "  Log dir: " << logDir << "/" << logFile << std::endl;
    std::cout << "  Level: " << level << std::endl;
    std::cout << "  Rotation: " << maxFileSize << " bytes x " << maxFiles << " files" << std::endl;
    std::cout << "  Console: " << (enableConsole ? "on" : "off")
              << ", File: " << (enableFile ? "on" : "off") << std::endl;
}

void InitLogger(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (config.enableFile) {
        std::filesystem::create_directories(config.logDir);
        std::string path = (std::filesystem::path(config.logDir) / config.logFile).string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("multiocr", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    spdlog::drop("multiocr");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    g_logger = logger;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return g_logger;
    }
    return spdlog::default_logger();
}

void FlushLogger() {
    GetLogger()->flush();
}

} // namespace multiocr
