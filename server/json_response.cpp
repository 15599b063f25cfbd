#include "json_response.h"
#include "common/id_generator.h"

namespace multiocr_server {

std::string JsonResponseBuilder::GenerateUUID() {
    return multiocr::IdGenerator::uuid();
}

json JsonResponseBuilder::BuildSuccessResponse(const multiocr::CompleteResult& result) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = ErrorCode::SUCCESS;
    response["errorMsg"] = "Success";
    response["result"] = multiocr::toJson(result);
    return response;
}

json JsonResponseBuilder::BuildErrorResponse(int error_code, const std::string& error_msg) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = error_code;
    response["errorMsg"] = error_msg;
    return response;
}

json JsonResponseBuilder::BuildHealthResponse(const multiocr::HealthStatus& health) {
    json response = health.toJson();
    response["service"] = "MultiOCR Server";
    response["version"] = "1.0.0";
    return response;
}

} // namespace multiocr_server
