// ICU-backed charset conversion shared by the content classifier and the
// text-write path. Conversions are strict: no substitution characters.
#pragma once
#include "RemoteTypes.hpp"
#include <optional>
#include <string>

namespace remotefs {

// One-time, process-wide ICU setup. Idempotent and thread-safe; call it once
// from the entry point before classifying or encoding anything.
bool initEncodingSupport(std::string* err = nullptr);

// Canonical lower-case name for an encoding alias ("UTF8" -> "utf-8",
// "latin1" -> "iso-8859-1"); nullopt if ICU does not know the encoding.
std::optional<std::string> canonicalEncodingName(const std::string& name);

// Converts [data, data+size) from one charset to another. Any illegal,
// unmapped or truncated sequence makes the whole conversion fail.
bool convertStrict(const char* fromEncoding,
                   const char* toEncoding,
                   const char* data,
                   std::size_t size,
                   std::string& out,
                   std::string& err);

// UTF-8 text -> bytes in encodingName (blank name means UTF-8 without BOM).
// canonicalName receives the name actually used.
bool encodeText(const std::string& utf8Text,
                const std::string& encodingName,
                ByteBuffer& out,
                std::string& canonicalName,
                std::string& err);

} // namespace remotefs
