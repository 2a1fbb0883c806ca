#pragma once

#include <string>
#include <string_view>

namespace mr::core {

/// Copy of `input` with every NUL (U+0000) removed. In UTF-8 the byte 0x00
/// only ever encodes U+0000, so multi-byte sequences are left intact.
auto clean_string(std::string_view input) -> std::string;

void clean_string_in_place(std::string& value);

}  // namespace mr::core
