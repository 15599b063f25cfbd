#include "ocr_handler.h"
#include "common/base64.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "pipeline/service_config.h"
#include <memory>

namespace multiocr_server {

using multiocr::ErrorKind;
using multiocr::OCRError;

// ==================== OCRRequest ====================

OCRRequest OCRRequest::FromJson(const json& j, const multiocr::ProcessingOptions& defaults) {
    OCRRequest req;

    // 必填字段
    if (j.contains("file") && j["file"].is_string()) {
        req.file = j["file"].get<std::string>();
    }
    if (j.contains("documentId") && j["documentId"].is_string()) {
        req.documentId = j["documentId"].get<std::string>();
    }

    // 可选字段（使用默认值）
    req.options = multiocr::ParseProcessingOptions(j, defaults);
    return req;
}

bool OCRRequest::Validate(std::string& error_msg) const {
    if (file.empty()) {
        error_msg = "Missing required parameter: 'file'";
        return false;
    }
    if (file.find("http://") == 0 || file.find("https://") == 0) {
        error_msg = "'file' must be Base64 image data, URLs are not fetched";
        return false;
    }
    return true;
}

// ==================== OCRHandler ====================

OCRHandler::OCRHandler(multiocr::OCRIntegrationService& service)
    : service_(service) {
    LOG_INFO("OCRHandler initialized");
}

int OCRHandler::HandleRequest(const OCRRequest& request, json& response_json) {
    try {
        // 1. 验证请求参数
        std::string error_msg;
        if (!request.Validate(error_msg)) {
            LOG_WARN("Invalid request: {}", error_msg);
            response_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::INVALID_PARAMETER, error_msg);
            return 400;
        }

        // 2. Base64解码
        std::string bytes;
        if (!multiocr::Base64::decode(request.file, bytes)) {
            LOG_WARN("Failed to decode Base64 image ({} chars)", request.file.size());
            response_json = JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, "Failed to decode Base64 image");
            return 400;
        }

        multiocr::Document document;
        document.documentId = request.documentId;
        document.bytes = std::make_shared<const std::string>(std::move(bytes));

        // 3. 处理
        multiocr::CompleteResult result = service_.processDocument(document, request.options);
        response_json = JsonResponseBuilder::BuildSuccessResponse(result);
        return 200;

    } catch (const OCRError& e) {
        if (e.kind() == ErrorKind::ValidationError) {
            LOG_WARN("Rejected request: {}", e.what());
            response_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::INVALID_PARAMETER, e.what());
            return 400;
        }
        if (e.kind() == ErrorKind::AllEnginesFailed) {
            LOG_ERROR("All engines failed: {}", e.what());
            response_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::ENGINES_FAILED, e.what());
            return 502;
        }
        LOG_ERROR("OCR error in HandleRequest: {} ({})", e.what(), multiocr::toString(e.kind()));
        response_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        return 500;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception in HandleRequest: {}", e.what());
        response_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        return 500;
    }
}

int OCRHandler::HandleHealth(json& response_json) {
    multiocr::HealthStatus health = service_.healthCheck();
    response_json = JsonResponseBuilder::BuildHealthResponse(health);
    return health.healthy ? 200 : 503;
}

} // namespace multiocr_server
