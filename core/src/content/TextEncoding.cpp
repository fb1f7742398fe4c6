// Strict charset conversion on top of ICU converters.
#include "remotefs/TextEncoding.hpp"
#include "remotefs/PathNormalizer.hpp"
#include "remotefs/Log.hpp"

#include <unicode/uclean.h>
#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>

#include <cctype>
#include <mutex>

namespace remotefs {

namespace {

std::once_flag g_icu_once;
UErrorCode g_icu_status = U_ZERO_ERROR;

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Opens a converter whose callbacks stop on the first bad sequence in either direction.
icu::LocalUConverterPointer openStrict(const char* name, std::string& err) {
    UErrorCode status = U_ZERO_ERROR;
    icu::LocalUConverterPointer cnv(ucnv_open(name, &status));
    if (U_FAILURE(status) || cnv.isNull()) {
        err = std::string("Unknown encoding: ") + name;
        return icu::LocalUConverterPointer();
    }
    ucnv_setToUCallBack(cnv.getAlias(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    ucnv_setFromUCallBack(cnv.getAlias(), UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status)) {
        err = std::string("Converter setup failed for ") + name + ": " + u_errorName(status);
        return icu::LocalUConverterPointer();
    }
    return cnv;
}

} // namespace

bool initEncodingSupport(std::string* err) {
    std::call_once(g_icu_once, [] {
        UErrorCode status = U_ZERO_ERROR;
        u_init(&status);
        g_icu_status = status;
        if (U_FAILURE(status)) {
            LOGE("ICU initialization failed: %s", u_errorName(status));
        } else {
            LOGD("ICU initialized (%d converters available)", static_cast<int>(ucnv_countAvailable()));
        }
    });
    if (U_FAILURE(g_icu_status)) {
        if (err) *err = std::string("ICU initialization failed: ") + u_errorName(g_icu_status);
        return false;
    }
    return true;
}

std::optional<std::string> canonicalEncodingName(const std::string& name) {
    if (isBlank(name)) return std::nullopt;
    UErrorCode status = U_ZERO_ERROR;
    icu::LocalUConverterPointer cnv(ucnv_open(name.c_str(), &status));
    if (U_FAILURE(status) || cnv.isNull()) return std::nullopt;

    const char* internal = ucnv_getName(cnv.getAlias(), &status);
    if (U_FAILURE(status) || !internal) return std::nullopt;

    // Prefer the MIME name ("windows-1252"), then IANA, then ICU's own.
    for (const char* standard : {"MIME", "IANA"}) {
        UErrorCode st = U_ZERO_ERROR;
        const char* std_name = ucnv_getStandardName(internal, standard, &st);
        if (U_SUCCESS(st) && std_name && *std_name) return toLower(std_name);
    }
    return toLower(internal);
}

bool convertStrict(const char* fromEncoding,
                   const char* toEncoding,
                   const char* data,
                   std::size_t size,
                   std::string& out,
                   std::string& err) {
    out.clear();
    auto source = openStrict(fromEncoding, err);
    if (source.isNull()) return false;
    auto target = openStrict(toEncoding, err);
    if (target.isNull()) return false;
    if (size == 0) return true;

    UChar pivot[1024];
    UChar* pivotSource = pivot;
    UChar* pivotTarget = pivot;
    char buf[8192];
    const char* src = data;
    const char* srcLimit = data + size;
    bool reset = true;

    for (;;) {
        char* dst = buf;
        UErrorCode status = U_ZERO_ERROR;
        ucnv_convertEx(target.getAlias(), source.getAlias(),
                       &dst, buf + sizeof(buf),
                       &src, srcLimit,
                       pivot, &pivotSource, &pivotTarget, pivot + 1024,
                       reset, /*flush=*/true, &status);
        reset = false;
        out.append(buf, static_cast<std::size_t>(dst - buf));
        if (status == U_BUFFER_OVERFLOW_ERROR) continue;
        if (U_FAILURE(status)) {
            err = std::string("Conversion ") + fromEncoding + " -> " + toEncoding +
                  " failed at byte " + std::to_string(src - data) + ": " + u_errorName(status);
            out.clear();
            return false;
        }
        return true;
    }
}

bool encodeText(const std::string& utf8Text,
                const std::string& encodingName,
                ByteBuffer& out,
                std::string& canonicalName,
                std::string& err) {
    out.clear();
    std::string target = isBlank(encodingName) ? std::string("utf-8") : encodingName;
    auto canonical = canonicalEncodingName(target);
    if (!canonical) {
        err = "Unknown encoding: " + encodingName;
        return false;
    }

    std::string encoded;
    if (!convertStrict("UTF-8", canonical->c_str(), utf8Text.data(), utf8Text.size(), encoded, err)) {
        return false;
    }
    out.assign(encoded.begin(), encoded.end());
    canonicalName = *canonical;
    return true;
}

} // namespace remotefs
