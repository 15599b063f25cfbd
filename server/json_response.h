#pragma once

#include "common/types.hpp"
#include "pipeline/ocr_integration.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace multiocr_server {

/**
 * @brief JSON响应构建器
 *
 * Every response carries a logId, an errorCode (0 on success) and an errorMsg.
 */
class JsonResponseBuilder {
public:
    /**
     * @brief 生成UUID作为logId
     */
    static std::string GenerateUUID();

    /**
     * @brief 构建成功的OCR响应
     * @param result complete processing result, placed under "result"
     */
    static json BuildSuccessResponse(const multiocr::CompleteResult& result);

    /**
     * @brief 构建错误响应
     * @param error_code 错误码
     * @param error_msg 错误信息
     */
    static json BuildErrorResponse(int error_code, const std::string& error_msg);

    /**
     * @brief Health check body: status, engines, workerPoolSize, bridgeProcessCount
     */
    static json BuildHealthResponse(const multiocr::HealthStatus& health);
};

/**
 * @brief HTTP错误码定义
 */
namespace ErrorCode {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_PARAMETER = 400;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int ENGINES_FAILED = 502;
    constexpr int SERVICE_UNAVAILABLE = 503;
}

} // namespace multiocr_server
