#pragma once

#include "json_response.h"
#include "pipeline/ocr_integration.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace multiocr_server {

/**
 * @brief OCR请求参数结构
 */
struct OCRRequest {
    std::string file;                       // Base64编码的图像 (data: URI也可以)
    std::string documentId;                 // 可选, 用于去重和缓存
    multiocr::ProcessingOptions options;

    /**
     * @brief 从JSON解析请求参数, 未提供的选项使用 defaults
     * @throws multiocr::OCRError (ValidationError) for unknown engines or mistyped options
     */
    static OCRRequest FromJson(const json& j,
                               const multiocr::ProcessingOptions& defaults = multiocr::ProcessingOptions());

    /**
     * @brief 验证请求参数
     */
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief OCR请求处理器
 */
class OCRHandler {
public:
    explicit OCRHandler(multiocr::OCRIntegrationService& service);

    /**
     * @brief 处理OCR请求
     * @param request OCR请求参数
     * @param response_json 输出的JSON响应
     * @return HTTP状态码 (200, 400 invalid input, 502 all engines failed, 500)
     */
    int HandleRequest(const OCRRequest& request, json& response_json);

    /**
     * @brief 健康检查
     * @return 200 when at least one engine is available, else 503
     */
    int HandleHealth(json& response_json);

private:
    multiocr::OCRIntegrationService& service_;
};

} // namespace multiocr_server
