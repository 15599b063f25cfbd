#pragma once

#include <string>

namespace multiocr {

/**
 * @brief Identifiers for correlation ids, processing ids and log ids
 */
class IdGenerator {
public:
    /**
     * @brief Random UUID string (libuuid), e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427"
     */
    static std::string uuid();

    /**
     * @brief "<prefix>_<uuid>"
     */
    static std::string prefixed(const std::string& prefix);
};

} // namespace multiocr
