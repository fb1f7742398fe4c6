// Content classification: charset detection (ICU) + strict verification decode.
#include "remotefs/ContentClassifier.hpp"
#include "remotefs/TextEncoding.hpp"
#include "remotefs/Log.hpp"

#include <unicode/ucsdet.h>

#include <climits>
#include <cstring>
#include <stdexcept>

namespace remotefs {

namespace {

// ICU only needs a prefix to score candidates.
constexpr std::size_t kDetectionSampleSize = 64 * 1024;

struct Bom {
    const char*   name;
    unsigned char bytes[4];
    std::size_t   length;
};

// UTF-32LE must be tested before UTF-16LE: its BOM starts with FF FE.
const Bom kBoms[] = {
    {"utf-32le", {0xFF, 0xFE, 0x00, 0x00}, 4},
    {"utf-32be", {0x00, 0x00, 0xFE, 0xFF}, 4},
    {"utf-8",    {0xEF, 0xBB, 0xBF, 0x00}, 3},
    {"utf-16le", {0xFF, 0xFE, 0x00, 0x00}, 2},
    {"utf-16be", {0xFE, 0xFF, 0x00, 0x00}, 2},
};

// 7-bit bytes without NUL. Zero bytes point at BOM-less UTF-16/32, which
// only the detector can tell apart.
bool isPlainAscii(const unsigned char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        if (data[i] == 0x00 || (data[i] & 0x80)) return false;
    }
    return true;
}

bool hasForbiddenControl(const std::string& utf8) {
    for (unsigned char c : utf8) {
        if (c >= 0x20) continue;
        if (c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r' || c == 0x1B) continue;
        return true;
    }
    return false;
}

EncodingGuess icuDetect(const unsigned char* data, std::size_t size) {
    EncodingGuess guess;
    UErrorCode status = U_ZERO_ERROR;
    icu::LocalUCharsetDetectorPointer detector(ucsdet_open(&status));
    if (U_FAILURE(status)) {
        LOGE("ucsdet_open failed: %s", u_errorName(status));
        return guess;
    }

    const std::size_t sample = size < kDetectionSampleSize ? size : kDetectionSampleSize;
    ucsdet_setText(detector.getAlias(), reinterpret_cast<const char*>(data),
                   static_cast<int32_t>(sample), &status);
    const UCharsetMatch* match = ucsdet_detect(detector.getAlias(), &status);
    if (U_FAILURE(status) || !match) {
        LOGD("charset detection found no match (%s)", u_errorName(status));
        return guess;
    }

    const char* name = ucsdet_getName(match, &status);
    const int32_t confidence = ucsdet_getConfidence(match, &status);
    if (U_FAILURE(status) || !name) return guess;

    guess.name = canonicalEncodingName(name).value_or(name);
    guess.confidence = static_cast<double>(confidence) / 100.0;
    LOGD("charset detection: %s (confidence %d)", name, static_cast<int>(confidence));
    return guess;
}

} // namespace

EncodingGuess detectEncoding(const unsigned char* data, std::size_t size) {
    if (size == 0) return {"utf-8", 1.0, 0};

    for (const Bom& bom : kBoms) {
        if (size >= bom.length && std::memcmp(data, bom.bytes, bom.length) == 0) {
            return {bom.name, 1.0, bom.length};
        }
    }
    // ASCII is a strict subset of UTF-8; ICU would only score it weakly.
    if (isPlainAscii(data, size)) return {"utf-8", 1.0, 0};

    return icuDetect(data, size);
}

std::optional<std::string> strictDecode(const unsigned char* data,
                                        std::size_t size,
                                        const std::string& encoding) {
    if (encoding.empty()) return std::nullopt;
    if (size > static_cast<std::size_t>(INT32_MAX)) return std::nullopt;

    std::string text;
    std::string err;
    if (!convertStrict(encoding.c_str(), "UTF-8", reinterpret_cast<const char*>(data), size, text, err)) {
        LOGD("strict decode rejected: %s", err.c_str());
        return std::nullopt;
    }
    if (hasForbiddenControl(text)) {
        LOGD("strict decode rejected: control characters under %s", encoding.c_str());
        return std::nullopt;
    }
    return text;
}

bool acceptsConfidence(double confidence) {
    return confidence >= kTextConfidenceThreshold;
}

ClassificationResult classifyContent(const unsigned char* data, std::size_t size) {
    if (!data && size > 0) {
        throw std::invalid_argument("classifyContent: null buffer with non-zero size");
    }

    ClassificationResult result;
    if (size == 0) {
        result.isText = true;
        result.encodingName = "utf-8";
        result.decodedText = std::string();
        result.confidence = 1.0;
        return result;
    }

    const EncodingGuess guess = detectEncoding(data, size);
    result.confidence = guess.confidence;
    if (!acceptsConfidence(guess.confidence)) return result;

    auto text = strictDecode(data + guess.bomLength, size - guess.bomLength, guess.name);
    if (!text) return result;

    result.isText = true;
    result.encodingName = guess.name;
    result.decodedText = std::move(*text);
    return result;
}

ClassificationResult classifyContent(const ByteBuffer& bytes) {
    return classifyContent(bytes.data(), bytes.size());
}

} // namespace remotefs
