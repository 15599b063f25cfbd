#pragma once

#include <string>

namespace multiocr {

/**
 * @brief Base64 codec for image payloads (HTTP input, bridge requests)
 */
class Base64 {
public:
    static std::string encode(const std::string& bytes);

    /**
     * @brief Decode standard base64. Whitespace is skipped and a
     *        "data:<mime>;base64," prefix is accepted.
     * @return false on an invalid character or truncated input
     */
    static bool decode(const std::string& encoded, std::string& bytes);
};

} // namespace multiocr
