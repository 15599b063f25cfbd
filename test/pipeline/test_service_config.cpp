/**
 * @file test_service_config.cpp
 * @brief 服务配置与请求选项解析测试
 */

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "pipeline/service_config.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace multiocr;

// ==================== ProcessingOptions 解析测试 ====================

TEST(ParseOptionsTest, EmptyObjectKeepsDefaults) {
    ProcessingOptions defaults;
    defaults.language = "deu";
    defaults.maxRetries = 4;
    ProcessingOptions options = ParseProcessingOptions(json::object(), defaults);
    EXPECT_EQ(options.language, "deu");
    EXPECT_EQ(options.maxRetries, 4);
    EXPECT_EQ(std::get<EngineId>(options.engine), EngineId::Tesseract);
}

TEST(ParseOptionsTest, OverlaysEveryKey) {
    json j = {
        {"language", "fra"},
        {"engine", "paddleocr"},
        {"confidenceThreshold", 0.6},
        {"timeout", 1500},
        {"maxRetries", 3},
        {"enableFallback", false},
        {"correlationId", "ocr_client"},
        {"enablePostProcessing", false},
        {"enableCaching", true},
        {"qualityThreshold", 0.7},
        {"preprocessing", {{"denoise", true}, {"binarize", true}}}
    };
    ProcessingOptions options = ParseProcessingOptions(j, ProcessingOptions{});

    EXPECT_EQ(options.language, "fra");
    EXPECT_EQ(std::get<EngineId>(options.engine), EngineId::PaddleOCR);
    EXPECT_DOUBLE_EQ(options.confidenceThreshold, 0.6);
    EXPECT_EQ(options.timeoutMs, 1500);
    EXPECT_EQ(options.maxRetries, 3);
    EXPECT_FALSE(options.enableFallback);
    EXPECT_EQ(options.correlationId, "ocr_client");
    EXPECT_FALSE(options.enablePostProcessing);
    EXPECT_TRUE(options.enableCaching);
    EXPECT_DOUBLE_EQ(options.qualityThreshold.value(), 0.7);
    EXPECT_TRUE(options.preprocessing.denoise);
    EXPECT_TRUE(options.preprocessing.binarize);
    EXPECT_FALSE(options.preprocessing.sharpen);
}

/**
 * @brief engine 可以是名称、"ensemble" 或名称列表
 */
TEST(ParseOptionsTest, EngineSelectorForms) {
    ProcessingOptions ensemble = ParseProcessingOptions({{"engine", "ensemble"}}, ProcessingOptions{});
    EXPECT_TRUE(ensemble.isEnsemble());
    EXPECT_TRUE(ensemble.isMultiEngine());

    ProcessingOptions list = ParseProcessingOptions({{"engine", {"easyocr", "tesseract"}}}, ProcessingOptions{});
    ASSERT_TRUE(list.isMultiEngine());
    EXPECT_FALSE(list.isEnsemble());
    auto engines = std::get<std::vector<EngineId>>(list.engine);
    EXPECT_EQ(engines, (std::vector<EngineId>{EngineId::EasyOCR, EngineId::Tesseract}));
}

TEST(ParseOptionsTest, UnknownEngineRejected) {
    try {
        ParseProcessingOptions({{"engine", "abbyy"}}, ProcessingOptions{});
        FAIL() << "expected ValidationError";
    } catch (const OCRError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
        EXPECT_NE(std::string(e.what()).find("abbyy"), std::string::npos);
    }
    EXPECT_THROW(ParseProcessingOptions({{"engine", {"tesseract", 3}}}, ProcessingOptions{}), OCRError);
    EXPECT_THROW(ParseProcessingOptions({{"engine", 7}}, ProcessingOptions{}), OCRError);
}

TEST(ParseOptionsTest, MistypedValueRejected) {
    try {
        ParseProcessingOptions({{"maxRetries", "three"}}, ProcessingOptions{});
        FAIL() << "expected ValidationError";
    } catch (const OCRError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
        EXPECT_NE(std::string(e.what()).find("maxRetries"), std::string::npos);
    }
}

TEST(ParseOptionsTest, NullValuesIgnored) {
    ProcessingOptions options = ParseProcessingOptions(
        {{"language", nullptr}, {"engine", nullptr}, {"qualityThreshold", nullptr}}, ProcessingOptions{});
    EXPECT_EQ(options.language, "eng");
    EXPECT_FALSE(options.qualityThreshold.has_value());
}

// ==================== ServiceConfig 测试 ====================

TEST(ServiceConfigTest, DefaultsWhenEmpty) {
    ServiceConfig config = ServiceConfig::FromJson(json::object());
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.registry.engines.size(), 3u);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_TRUE(config.enablePostProcessor);
    EXPECT_EQ(config.defaults.language, "eng");
}

TEST(ServiceConfigTest, ReadsSections) {
    json j = {
        {"logging", {{"level", "debug"}, {"console", false}}},
        {"registry", {
            {"concurrency", 3},
            {"probeTimeoutMs", 800},
            {"engines", {
                {{"id", "tesseract"}, {"workers", 2}},
                {{"id", "easyocr"}, {"command", {"python3", "bridges/easyocr_bridge.py", "--gpu"}}},
                {{"id", "paddleocr"}, {"enabled", false}}
            }}
        }},
        {"tesseract", {{"pageSegMode", 6}}},
        {"orchestrator", {{"backoffBaseMs", 250}}},
        {"cache", {{"capacity", 16}}},
        {"server", {{"port", 9090}, {"threads", 8}}},
        {"postProcessor", false},
        {"defaults", {{"engine", "easyocr"}, {"maxRetries", 1}}}
    };
    ServiceConfig config = ServiceConfig::FromJson(j);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.enableConsole);
    EXPECT_EQ(config.registry.concurrency, 3u);
    EXPECT_EQ(config.registry.probeTimeoutMs, 800);
    ASSERT_EQ(config.registry.engines.size(), 3u);

    const EngineSettings& tesseract = config.registry.engines[0];
    EXPECT_EQ(tesseract.id, EngineId::Tesseract);
    EXPECT_EQ(tesseract.workers, 2u);
    EXPECT_TRUE(tesseract.command.executable.empty());

    const EngineSettings& easyocr = config.registry.engines[1];
    EXPECT_EQ(easyocr.command.executable, "python3");
    EXPECT_EQ(easyocr.command.args, (std::vector<std::string>{"bridges/easyocr_bridge.py", "--gpu"}));
    EXPECT_FALSE(config.registry.engines[2].enabled);

    EXPECT_EQ(config.tesseract.pageSegMode, 6);
    EXPECT_EQ(config.orchestrator.backoffBaseMs, 250);
    EXPECT_EQ(config.cache.capacity, 16u);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 8);
    EXPECT_FALSE(config.enablePostProcessor);
    EXPECT_EQ(std::get<EngineId>(config.defaults.engine), EngineId::EasyOCR);
    EXPECT_EQ(config.defaults.maxRetries, 1);
}

TEST(ServiceConfigTest, BridgeDirRewritesDefaultCommands) {
    ServiceConfig config = ServiceConfig::FromJson({{"registry", {{"bridgeDir", "/opt/bridges"}}}});
    ASSERT_EQ(config.registry.engines.size(), 3u);
    EXPECT_EQ(config.registry.engines[1].command.args.front(), "/opt/bridges/easyocr_bridge.py");
}

TEST(ServiceConfigTest, MalformedSectionsRejected) {
    EXPECT_THROW(ServiceConfig::FromJson(json::array()), OCRError);
    EXPECT_THROW(ServiceConfig::FromJson({{"registry", {{"engines", "tesseract"}}}}), OCRError);
    EXPECT_THROW(ServiceConfig::FromJson(json::parse(R"({"registry": {"engines": [{"workers": 1}]}})")), OCRError);
    EXPECT_THROW(ServiceConfig::FromJson({{"server", {{"port", "http"}}}}), OCRError);
}

TEST(ServiceConfigTest, LoadMissingFile) {
    ServiceConfig config;
    std::string error_msg;
    EXPECT_FALSE(LoadServiceConfig("/nonexistent/multiocr.json", config, error_msg));
    EXPECT_NE(error_msg.find("cannot open"), std::string::npos);
}

TEST(ServiceConfigTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "multiocr_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"port": 7070}, "cache": {"enabled": false}})";
    }
    ServiceConfig config;
    std::string error_msg;
    ASSERT_TRUE(LoadServiceConfig(path, config, error_msg)) << error_msg;
    EXPECT_EQ(config.server.port, 7070);
    EXPECT_FALSE(config.cache.enabled);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(LoadServiceConfig(path, config, error_msg));
    EXPECT_NE(error_msg.find("invalid JSON"), std::string::npos);
    std::remove(path.c_str());
}
