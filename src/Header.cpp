// Header.cpp – TDB header decode / encode.

#include "TDBCodec/Header.hpp"
#include "TDBCodec/ByteStream.hpp"
#include "TDBCodec/Error.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace tdb {

bool hasMagic(std::span<const uint8_t> bytes) noexcept {
    return bytes.size() >= kMagic.size() &&
           std::equal(kMagic.begin(), kMagic.end(), bytes.begin());
}

Header Header::decode(std::span<const uint8_t> bytes) {
    if (bytes.size() >= kMagic.size() && !hasMagic(bytes)) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "expected 08 D5 19 87, found %02X %02X %02X %02X",
                      bytes[0], bytes[1], bytes[2], bytes[3]);
        throw TdbError(ErrorCode::BadMagic, msg, 0);
    }
    if (bytes.size() < kHeaderSize)
        throw TdbError(ErrorCode::Truncated,
                       "header needs " + std::to_string(kHeaderSize) + " bytes, got " +
                           std::to_string(bytes.size()),
                       bytes.size());

    ByteReader br{bytes};
    br.skip(kMagic.size());

    Header h;
    h.version      = br.readU32LE();
    h.record_count = br.readU32LE();
    return h;
}

std::array<uint8_t, kHeaderSize> Header::encode() const {
    std::array<uint8_t, kHeaderSize> out{};
    std::copy(kMagic.begin(), kMagic.end(), out.begin());
    storeU32LE(out, 4, version);
    storeU32LE(out, 8, record_count);
    return out;
}

} // namespace tdb
