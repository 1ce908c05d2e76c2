#pragma once

#include <string>

namespace grep {

// Invalid bytes decode to this, one per byte.
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

std::u32string decode_utf8(const std::string& text);
std::string encode_utf8(const std::u32string& chars);

}
