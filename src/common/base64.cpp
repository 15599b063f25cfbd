#include "common/base64.h"
#include <cctype>

namespace multiocr {

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

std::string Base64::encode(const std::string& bytes) {
    std::string ret;
    ret.reserve(((bytes.size() + 2) / 3) * 4);

    unsigned char in[3];
    size_t i = 0;
    for (unsigned char c : bytes) {
        in[i++] = c;
        if (i == 3) {
            ret += kBase64Chars[(in[0] & 0xfc) >> 2];
            ret += kBase64Chars[((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)];
            ret += kBase64Chars[((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6)];
            ret += kBase64Chars[in[2] & 0x3f];
            i = 0;
        }
    }

    if (i) {
        for (size_t j = i; j < 3; j++) in[j] = '\0';

        unsigned char out[4];
        out[0] = (in[0] & 0xfc) >> 2;
        out[1] = ((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4);
        out[2] = ((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6);

        for (size_t j = 0; j < i + 1; j++) ret += kBase64Chars[out[j]];
        while (i++ < 3) ret += '=';
    }

    return ret;
}

bool Base64::decode(const std::string& encoded, std::string& bytes) {
    bytes.clear();

    size_t start = 0;
    if (encoded.compare(0, 5, "data:") == 0) {
        size_t comma = encoded.find(',');
        if (comma == std::string::npos) return false;
        start = comma + 1;
    }

    unsigned int buffer = 0;
    int bits = 0;
    size_t padding = 0;
    size_t symbols = 0;
    for (size_t pos = start; pos < encoded.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(encoded[pos]);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return false;  // data after padding

        int value = decodeChar(c);
        if (value < 0) return false;
        ++symbols;

        buffer = (buffer << 6) | static_cast<unsigned int>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes += static_cast<char>((buffer >> bits) & 0xff);
        }
    }

    if (padding > 2 || symbols % 4 == 1) return false;
    return true;
}

} // namespace multiocr
