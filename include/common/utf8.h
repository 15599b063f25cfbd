#pragma once

#include <string>

namespace multiocr {

/**
 * @brief Code point helpers for recognized text
 */
class Utf8 {
public:
    /**
     * @brief Decode UTF-8 into code points. Invalid bytes are passed through
     *        as-is so that counts stay defined for garbage input.
     */
    static std::u32string decode(const std::string& text);

    /// Lower-case ASCII letters, trim surrounding whitespace
    static std::u32string normalizeForComparison(const std::string& text);

    static bool isSpace(char32_t c);
};

} // namespace multiocr
