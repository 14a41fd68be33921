#pragma once
// Header.hpp – 12-byte TDB file header and the section layout it implies.

#include "Types.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace tdb {

struct Header {
    uint32_t version{0};      // opaque regeneration counter, round-tripped as-is
    uint32_t record_count{0};

    // Throws TdbError(Truncated) if fewer than kHeaderSize bytes are given and
    // TdbError(BadMagic) if the first four bytes are not kMagic.
    [[nodiscard]] static Header decode(std::span<const uint8_t> bytes);

    [[nodiscard]] std::array<uint8_t, kHeaderSize> encode() const;

    // ── Derived section layout (64-bit so N × 96 cannot wrap) ────────────────
    [[nodiscard]] uint64_t indexOffset()   const noexcept { return kHeaderSize; }
    [[nodiscard]] uint64_t paddingOffset() const noexcept {
        return indexOffset() + uint64_t{record_count} * kIndexEntrySize;
    }
    [[nodiscard]] uint64_t recordsOffset() const noexcept { return paddingOffset() + kPaddingSize; }
    [[nodiscard]] uint64_t totalSize()     const noexcept {
        return recordsOffset() + uint64_t{record_count} * kRecordSize;
    }

    bool operator==(const Header&) const = default;
};

// True when bytes starts with the TDB magic (bytes may be shorter than a header).
[[nodiscard]] bool hasMagic(std::span<const uint8_t> bytes) noexcept;

} // namespace tdb
