// StringField.cpp – UTF-8 validation, boundary-safe truncation and the
// fixed-width field codec.

#include "TDBCodec/StringField.hpp"
#include "TDBCodec/Error.hpp"

#include <algorithm>
#include <cstring>

namespace tdb {

// ─────────────────────────────────────────────────────────────────────────────
//  UTF-8 helpers
// ─────────────────────────────────────────────────────────────────────────────

static bool isContinuation(unsigned char c) noexcept { return (c & 0xC0u) == 0x80u; }

bool isValidUtf8(std::string_view s) noexcept {
    const auto* p   = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n  = s.size();
    size_t       i  = 0;

    while (i < n) {
        const unsigned char c = p[i];
        if (c < 0x80u) { ++i; continue; }

        size_t   len = 0;
        uint32_t cp  = 0;
        uint32_t min = 0;
        if      ((c & 0xE0u) == 0xC0u) { len = 2; cp = c & 0x1Fu; min = 0x80;    }
        else if ((c & 0xF0u) == 0xE0u) { len = 3; cp = c & 0x0Fu; min = 0x800;   }
        else if ((c & 0xF8u) == 0xF0u) { len = 4; cp = c & 0x07u; min = 0x10000; }
        else return false; // continuation byte in lead position, or 0xF8..0xFF

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if (!isContinuation(p[i + k])) return false;
            cp = (cp << 6) | (p[i + k] & 0x3Fu);
        }

        if (cp < min)                      return false; // overlong
        if (cp > 0x10FFFFu)                return false;
        if (cp >= 0xD800u && cp <= 0xDFFFu) return false; // surrogate
        i += len;
    }
    return true;
}

size_t utf8PrefixLength(std::string_view s, size_t max_bytes) noexcept {
    if (s.size() <= max_bytes) return s.size();

    // Back off from the cut until the byte at the cut starts a code point.
    size_t cut = max_bytes;
    while (cut > 0 && isContinuation(static_cast<unsigned char>(s[cut])))
        --cut;
    return cut;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Field codec
// ─────────────────────────────────────────────────────────────────────────────

std::string decodeStringField(std::span<const uint8_t> field) {
    auto   nul = std::find(field.begin(), field.end(), uint8_t{0});
    size_t len = static_cast<size_t>(nul - field.begin());

    std::string out(reinterpret_cast<const char*>(field.data()), len);
    if (!isValidUtf8(out))
        throw TdbError(ErrorCode::InvalidEncoding, "string field is not valid UTF-8");
    return out;
}

void encodeStringField(std::string_view value, std::span<uint8_t> out) {
    if (out.empty())
        throw std::invalid_argument("encodeStringField: field width must be >= 1");

    // An embedded NUL ends the value, exactly as a reader would see it.
    if (auto nul = value.find('\0'); nul != std::string_view::npos)
        value = value.substr(0, nul);

    if (!isValidUtf8(value))
        throw TdbError(ErrorCode::InvalidEncoding,
                       "cannot encode invalid UTF-8 into a string field");

    const size_t len = utf8PrefixLength(value, out.size() - 1);
    std::fill(out.begin(), out.end(), uint8_t{0});
    if (len > 0)
        std::memcpy(out.data(), value.data(), len);
}

std::vector<uint8_t> encodeStringField(std::string_view value, size_t width) {
    std::vector<uint8_t> out(width, 0);
    encodeStringField(value, std::span<uint8_t>(out));
    return out;
}

} // namespace tdb
