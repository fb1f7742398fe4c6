// Standard (RFC 4648) base64 for binary payloads.
#pragma once
#include "RemoteTypes.hpp"
#include <string>

namespace remotefs {

// Always padded with '='.
std::string encodeBase64(const unsigned char* data, std::size_t size);
std::string encodeBase64(const ByteBuffer& data);

// Whitespace is ignored and padding is optional, but padding that does not
// complete the final quantum ("=", "ABCD=", "Zg=") fails, as does any other
// character outside the alphabet or a dangling single character.
bool decodeBase64(const std::string& text, ByteBuffer& out);

} // namespace remotefs
