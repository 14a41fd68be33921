#pragma once
// StringField.hpp – Fixed-width, NUL-terminated, zero-padded UTF-8 fields.
//
// A field of width W holds at most W-1 payload bytes followed by at least one
// zero byte.  Decoding stops at the first zero byte (or the end of the field
// when a writer filled all W bytes).  Encoding never splits a code point.

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tdb {

// Strict UTF-8 check: rejects stray continuation bytes, truncated sequences,
// overlong forms, UTF-16 surrogates and code points above U+10FFFF.
[[nodiscard]] bool isValidUtf8(std::string_view s) noexcept;

// Length of the longest prefix of s that is at most max_bytes long and ends on
// a code point boundary.  s must be valid UTF-8.
[[nodiscard]] size_t utf8PrefixLength(std::string_view s, size_t max_bytes) noexcept;

// Decode one field.  Throws TdbError(InvalidEncoding) if the payload is not
// valid UTF-8; the caller adds record/field context.
[[nodiscard]] std::string decodeStringField(std::span<const uint8_t> field);

// Encode value into out (out.size() is the field width, ≥ 1).  out is fully
// overwritten.  Throws TdbError(InvalidEncoding) if value is not valid UTF-8.
void encodeStringField(std::string_view value, std::span<uint8_t> out);

// Convenience form returning a freshly allocated field of the given width.
[[nodiscard]] std::vector<uint8_t> encodeStringField(std::string_view value,
                                                     size_t width = kStringFieldSize);

} // namespace tdb
