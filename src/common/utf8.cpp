#include "common/utf8.h"

namespace multiocr {

std::u32string Utf8::decode(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        char32_t cp = c;
        if (c >= 0xF0 && c <= 0xF7) { extra = 3; cp = c & 0x07; }
        else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0F; }
        else if (c >= 0xC0 && c <= 0xDF) { extra = 1; cp = c & 0x1F; }

        if (extra == 0 || i + extra >= text.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (next & 0x3F);
        }
        if (!valid) {
            out.push_back(c);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

bool Utf8::isSpace(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v' ||
           c == 0x00A0 || c == 0x2028 || c == 0x2029 || c == 0x3000 || c == 0xFEFF;
}

std::u32string Utf8::normalizeForComparison(const std::string& text) {
    std::u32string decoded = decode(text);
    size_t begin = 0;
    size_t end = decoded.size();
    while (begin < end && isSpace(decoded[begin])) ++begin;
    while (end > begin && isSpace(decoded[end - 1])) --end;

    std::u32string out = decoded.substr(begin, end - begin);
    for (auto& c : out) {
        if (c >= U'A' && c <= U'Z') c = c - U'A' + U'a';
    }
    return out;
}

} // namespace multiocr
