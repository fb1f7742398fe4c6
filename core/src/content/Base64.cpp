// Base64 codec for upload payloads, download blobs and access tokens.
#include "remotefs/Base64.hpp"
#include <cctype>

namespace remotefs {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int valueOf(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string encodeBase64(const unsigned char* data, std::size_t size) {
    std::string res;
    res.reserve(((size + 2) / 3) * 4);
    for (std::size_t i = 0; i < size; i += 3) {
        const std::size_t left = size - i;
        const unsigned b0 = data[i];
        const unsigned b1 = left > 1 ? data[i + 1] : 0;
        const unsigned b2 = left > 2 ? data[i + 2] : 0;
        res += kAlphabet[b0 >> 2];
        res += kAlphabet[((b0 & 0x03) << 4) | (b1 >> 4)];
        res += left > 1 ? kAlphabet[((b1 & 0x0f) << 2) | (b2 >> 6)] : '=';
        res += left > 2 ? kAlphabet[b2 & 0x3f] : '=';
    }
    return res;
}

std::string encodeBase64(const ByteBuffer& data) {
    return encodeBase64(data.data(), data.size());
}

bool decodeBase64(const std::string& text, ByteBuffer& out) {
    out.clear();
    out.reserve((text.size() / 4) * 3);

    unsigned accum = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        // Data after padding is malformed.
        if (padding > 0) return false;
        const int v = valueOf(c);
        if (v < 0) return false;
        accum = (accum << 6) | static_cast<unsigned>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>((accum >> bits) & 0xFF));
        }
    }
    const std::size_t tail = symbols % 4;
    // Padding, when present, must complete the last quantum exactly.
    if (tail == 1 || (padding > 0 && (tail == 0 || padding != 4 - tail))) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace remotefs
