#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>

/**
 * Logging system for MultiOCR
 *
 * All modules log through the LOG_* macros below. Before InitLogger() is
 * called the macros write to spdlog's default console logger.
 */

namespace multiocr {

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    std::string logDir = "logs";
    std::string logFile = "multiocr.log";
    std::string level = "info";               // trace / debug / info / warn / error / off
    size_t maxFileSize = 10 * 1024 * 1024;    // rotate after 10MB
    size_t maxFiles = 5;
    bool enableConsole = true;
    bool enableFile = true;

    void Show() const;
};

/**
 * @brief Create the "multiocr" logger with console and rotating file sinks
 *        and install it as the spdlog default logger
 * @throws spdlog::spdlog_ex when a sink cannot be created
 */
void InitLogger(const LoggerConfig& config);

/**
 * @brief Logger used by the LOG_* macros
 */
std::shared_ptr<spdlog::logger> GetLogger();

void FlushLogger();

} // namespace multiocr

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::multiocr::GetLogger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::multiocr::GetLogger(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::multiocr::GetLogger(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::multiocr::GetLogger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::multiocr::GetLogger(), __VA_ARGS__)
