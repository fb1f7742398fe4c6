// Text-or-binary classification of downloaded file content.
//
// Two stages, each callable on its own:
//   1. detectEncoding: byte-order mark, 7-bit input without NUL, or ICU's
//      statistical charset detector -> candidate encoding + confidence.
//   2. strictDecode: ICU conversion that fails on any sequence needing a
//      substitution character.
// Content is text only when the candidate clears kTextConfidenceThreshold
// and the strict decode succeeds; everything else is reported as binary.
// The strict decode also refuses control characters (see strictDecode).
#pragma once
#include "RemoteTypes.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace remotefs {

constexpr double kTextConfidenceThreshold = 0.80;
constexpr const char* kBinaryEncodingName = "base64";

struct EncodingGuess {
    std::string name;        // canonical lower-case name, empty if nothing matched
    double      confidence = 0.0;
    std::size_t bomLength = 0;
};

struct ClassificationResult {
    bool                       isText = false;
    std::string                encodingName = kBinaryEncodingName;
    std::optional<std::string> decodedText;  // UTF-8, present only when isText
    double                     confidence = 0.0;
};

EncodingGuess detectEncoding(const unsigned char* data, std::size_t size);

// Decodes to UTF-8. Also rejects decoded control characters that never occur
// in text files (NUL, and C0 codes other than TAB/LF/VT/FF/CR/ESC).
std::optional<std::string> strictDecode(const unsigned char* data,
                                        std::size_t size,
                                        const std::string& encoding);

bool acceptsConfidence(double confidence);

// Text requires an accepted confidence and a successful strictDecode, so
// decoded NUL or C0 controls other than TAB/LF/VT/FF/CR/ESC (BEL, backspace
// overstrike) make the content binary.
// Total over all inputs. A null data pointer with a non-zero size is a
// caller bug and throws std::invalid_argument.
ClassificationResult classifyContent(const unsigned char* data, std::size_t size);
ClassificationResult classifyContent(const ByteBuffer& bytes);

} // namespace remotefs
