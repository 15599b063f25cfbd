/**
 * @file test_ocr_integration.cpp
 * @brief OCRIntegrationService 测试: 请求校验、质量阈值、健康检查
 */

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "engine/engine_registry.h"
#include "pipeline/ocr_integration.h"
#include "pipeline/processing_orchestrator.h"
#include "../mocks/scripted_recognizer.h"
#include "../mocks/test_images.h"
#include <memory>
#include <string>

using namespace multiocr;
using multiocr::testing::RecognizerScript;
using multiocr::testing::nativeSettings;
using multiocr::testing::scriptedFactory;

namespace {

Document blankDocument() {
    Document document;
    document.documentId = "integration";
    document.bytes = multiocr::testing::blankPngBytes();
    return document;
}

} // namespace

// ==================== 请求校验测试 ====================

TEST(IntegrationValidateTest, AcceptsDefaults) {
    std::string error_msg;
    EXPECT_TRUE(OCRIntegrationService::Validate(blankDocument(), ProcessingOptions{}, error_msg));
    EXPECT_TRUE(error_msg.empty());
}

TEST(IntegrationValidateTest, RejectsEmptyDocument) {
    Document document;
    std::string error_msg;
    EXPECT_FALSE(OCRIntegrationService::Validate(document, ProcessingOptions{}, error_msg));
    EXPECT_NE(error_msg.find("empty"), std::string::npos);

    document.bytes = std::make_shared<const std::string>();
    EXPECT_FALSE(OCRIntegrationService::Validate(document, ProcessingOptions{}, error_msg));
}

/**
 * @brief 语言代码: 允许 "eng", "chi_sim", "eng+deu"; 拒绝空值与非法字符
 */
TEST(IntegrationValidateTest, LanguageCodes) {
    std::string error_msg;
    ProcessingOptions options;
    for (const char* ok : {"eng", "chi_sim", "eng+deu"}) {
        options.language = ok;
        EXPECT_TRUE(OCRIntegrationService::Validate(blankDocument(), options, error_msg)) << ok;
    }
    for (const char* bad : {"", "e", "eng;rm", "eng+", "../eng"}) {
        options.language = bad;
        EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg)) << bad;
    }
}

TEST(IntegrationValidateTest, NumericRanges) {
    std::string error_msg;
    ProcessingOptions options;

    options.timeoutMs = 0;
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
    options = ProcessingOptions{};
    options.maxRetries = 0;
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
    options = ProcessingOptions{};
    options.maxRetries = 11;
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
    options = ProcessingOptions{};
    options.confidenceThreshold = 1.5;
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
    options = ProcessingOptions{};
    options.qualityThreshold = -0.1;
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
}

TEST(IntegrationValidateTest, EngineLists) {
    std::string error_msg;
    ProcessingOptions options;

    options.engine = std::vector<EngineId>{};
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));

    options.engine = std::vector<EngineId>{EngineId::Tesseract, EngineId::Ensemble};
    EXPECT_FALSE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));

    options.engine = std::vector<EngineId>{EngineId::Tesseract, EngineId::EasyOCR};
    EXPECT_TRUE(OCRIntegrationService::Validate(blankDocument(), options, error_msg));
}

// ==================== 处理测试 ====================

class IntegrationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = std::make_shared<RecognizerScript>();
        script_->words = {
            RecognizerScript::word("RECEIPT", 0.92, 10),
            RecognizerScript::word("42", 0.88, 110),
        };

        RegistryConfig config;
        config.engines.push_back(nativeSettings(EngineId::Tesseract, 2));
        registry_ = std::make_unique<EngineRegistry>(
            config, std::map<EngineId, RecognizerFactory>{{EngineId::Tesseract, scriptedFactory(script_)}});
        ASSERT_EQ(registry_->initialize(), 1u);

        OrchestratorConfig orchestratorConfig;
        orchestratorConfig.backoffBaseMs = 1;
        orchestrator_ = std::make_unique<ProcessingOrchestrator>(*registry_, orchestratorConfig);
        service_ = std::make_unique<OCRIntegrationService>(*registry_, *orchestrator_);
    }

    std::shared_ptr<RecognizerScript> script_;
    std::unique_ptr<EngineRegistry> registry_;
    std::unique_ptr<ProcessingOrchestrator> orchestrator_;
    std::unique_ptr<OCRIntegrationService> service_;
};

TEST_F(IntegrationServiceTest, ProcessesDocument) {
    CompleteResult result = service_->processDocument(blankDocument(), ProcessingOptions{});
    EXPECT_EQ(result.ocrResult.text, "RECEIPT 42");
    EXPECT_EQ(result.engineUsed, EngineId::Tesseract);
    EXPECT_EQ(result.correlationId.rfind("ocr_", 0), 0u);
    EXPECT_EQ(script_->calls.load(), 1);
}

/**
 * @brief 校验失败时不调用任何引擎
 */
TEST_F(IntegrationServiceTest, RejectsBeforeEngineWork) {
    ProcessingOptions options;
    options.language = "not a language";
    try {
        service_->processDocument(blankDocument(), options);
        FAIL() << "expected ValidationError";
    } catch (const OCRError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
    EXPECT_EQ(script_->calls.load(), 0);
}

TEST_F(IntegrationServiceTest, UndecodableImageIsValidationError) {
    Document document;
    document.bytes = std::make_shared<const std::string>("%PDF-1.4 not really");
    try {
        service_->processDocument(document, ProcessingOptions{});
        FAIL() << "expected ValidationError";
    } catch (const OCRError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
}

TEST_F(IntegrationServiceTest, EngineFailureSurfacesAsAllEnginesFailed) {
    script_->failAlways = true;
    ProcessingOptions options;
    options.maxRetries = 1;
    try {
        service_->processDocument(blankDocument(), options);
        FAIL() << "expected AllEnginesFailed";
    } catch (const OCRError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AllEnginesFailed);
        ASSERT_NE(e.cause(), nullptr);
    }
}

/**
 * @brief 质量分低于 qualityThreshold 只产生高影响警告, 结果仍返回
 */
TEST_F(IntegrationServiceTest, QualityThresholdWarning) {
    ProcessingOptions options;
    options.qualityThreshold = 1.0;
    CompleteResult result = service_->processDocument(blankDocument(), options);

    ASSERT_LT(result.overallQuality, 1.0);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_EQ(result.warnings.back().stage, "quality");
    EXPECT_EQ(result.warnings.back().impact, "high");
}

TEST_F(IntegrationServiceTest, NoQualityWarningWithoutThreshold) {
    CompleteResult result = service_->processDocument(blankDocument(), ProcessingOptions{});
    for (const auto& warning : result.warnings) {
        EXPECT_NE(warning.stage, "quality");
    }
}

// ==================== 健康检查测试 ====================

TEST_F(IntegrationServiceTest, HealthCheck) {
    HealthStatus health = service_->healthCheck();
    EXPECT_TRUE(health.healthy);
    EXPECT_TRUE(health.engines.at(EngineId::Tesseract));
    EXPECT_GT(health.workerPoolSize, 0u);
    EXPECT_EQ(health.bridgeProcessCount, 0u);

    json j = health.toJson();
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_EQ(j["engines"]["tesseract"], true);
    EXPECT_EQ(j["bridgeProcessCount"], 0);
}

TEST(IntegrationHealthTest, NoEnginesIsUnhealthy) {
    EngineRegistry registry(RegistryConfig{});
    EXPECT_EQ(registry.initialize(), 0u);
    ProcessingOrchestrator orchestrator(registry);
    OCRIntegrationService service(registry, orchestrator);

    HealthStatus health = service.healthCheck();
    EXPECT_FALSE(health.healthy);
    EXPECT_EQ(health.toJson()["status"], "unhealthy");
}
