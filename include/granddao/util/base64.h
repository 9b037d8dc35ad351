#pragma once

#include <string>

namespace granddao::base64 {

// Standard alphabet (RFC 4648) with '=' padding.
std::string encode(const std::string& bytes);

// Decodes padded base64. ASCII whitespace is skipped so pasted text with line
// breaks still decodes. Returns false on any other malformed input.
bool decode(const std::string& text, std::string* out);

} // namespace granddao::base64
