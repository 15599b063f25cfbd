#pragma once

#include "common/types.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace multiocr {

enum class ErrorKind {
    EngineTimeout,          // no complete response within the call timeout
    EngineReportedFailure,  // engine ran and answered success=false
    BridgeProtocolError,    // malformed response, or the worker went away
    AllEnginesFailed,       // every candidate of a fallback chain or ensemble failed
    ValidationError,        // bad input document or options
    EngineUnavailable       // engine not registered, failed its probe, or evicted
};

const char* toString(ErrorKind kind);

/**
 * @brief Exception raised by the coordination layer
 *
 * AllEnginesFailed carries the last per-engine error as the cause.
 */
class OCRError : public std::runtime_error {
public:
    OCRError(ErrorKind kind, const std::string& message);
    OCRError(ErrorKind kind, const std::string& message, std::optional<EngineId> engine);

    ErrorKind kind() const { return kind_; }
    std::optional<EngineId> engine() const { return engine_; }

    /**
     * @brief Last underlying engine error (AllEnginesFailed only)
     */
    const OCRError* cause() const { return cause_.get(); }

    static OCRError allEnginesFailed(const std::string& message, const OCRError& last);

    /**
     * @brief Kinds the single-engine attempt loop may try again
     */
    bool isRetryable() const {
        return kind_ == ErrorKind::EngineTimeout || kind_ == ErrorKind::EngineReportedFailure ||
               kind_ == ErrorKind::BridgeProtocolError;
    }

private:
    ErrorKind kind_;
    std::optional<EngineId> engine_;
    std::shared_ptr<const OCRError> cause_;
};

} // namespace multiocr
