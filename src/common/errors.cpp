#include "common/errors.hpp"

namespace multiocr {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EngineTimeout:         return "EngineTimeout";
        case ErrorKind::EngineReportedFailure: return "EngineReportedFailure";
        case ErrorKind::BridgeProtocolError:   return "BridgeProtocolError";
        case ErrorKind::AllEnginesFailed:      return "AllEnginesFailed";
        case ErrorKind::ValidationError:       return "ValidationError";
        case ErrorKind::EngineUnavailable:     return "EngineUnavailable";
    }
    return "Unknown";
}

OCRError::OCRError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

OCRError::OCRError(ErrorKind kind, const std::string& message, std::optional<EngineId> engine)
    : std::runtime_error(message), kind_(kind), engine_(engine) {}

OCRError OCRError::allEnginesFailed(const std::string& message, const OCRError& last) {
    OCRError error(ErrorKind::AllEnginesFailed,
                   message + " (last error: " + last.what() + ")", last.engine());
    error.cause_ = std::make_shared<const OCRError>(last);
    return error;
}

} // namespace multiocr
