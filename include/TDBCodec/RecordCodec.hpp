#pragma once
// RecordCodec.hpp – 96-byte record encode / decode.
//
// Record layout under OffsetPolicy::Offset32:
//   0  flarm_id      u32 LE
//   4  frequency     u32 LE (kHz)
//   8  reserved      8 bytes, zero
//   16 call_sign     16-byte string
//   32 pilot_name    16-byte string
//   48 airfield      16-byte string
//   64 plane_type    16-byte string
//   80 registration  16-byte string
//
// Under OffsetPolicy::Offset8 pilot_name takes bytes 8..16 and the 16-byte
// slot at 32 becomes unassigned (expected zero).

#include "Error.hpp"
#include "Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tdb {

// Byte offsets that depend on the OffsetPolicy.
struct RecordLayout {
    size_t call_sign{16};
    size_t pilot_name{32};
    size_t pilot_name_width{kStringFieldSize};
    size_t airfield{48};
    size_t plane_type{64};
    size_t registration{80};

    bool   has_reserved{true};   // bytes 8..16 are the reserved block
    size_t unassigned{0};        // start of an unused slot (0 = none)
    size_t unassigned_width{0};
};

[[nodiscard]] const RecordLayout& layoutFor(OffsetPolicy policy) noexcept;

class RecordCodec {
public:
    explicit RecordCodec(OffsetPolicy policy = OffsetPolicy::Offset32) noexcept;

    [[nodiscard]] OffsetPolicy        policy() const noexcept { return policy_; }
    [[nodiscard]] const RecordLayout& layout() const noexcept { return *layout_; }

    // ── Decode ───────────────────────────────────────────────────────────────
    // bytes must be exactly kRecordSize long.  record_pos and base_offset are
    // only used to label errors and warnings.
    // Throws TdbError(InvalidEncoding) naming the field and the record.
    // Nonzero reserved/unassigned bytes and ids above 24 bits are appended to
    // warnings rather than thrown.
    [[nodiscard]] Record decode(std::span<const uint8_t> bytes,
                                size_t record_pos,
                                size_t base_offset,
                                std::vector<Warning>& warnings) const;

    // Decode without position context; warnings are discarded.
    [[nodiscard]] Record decode(std::span<const uint8_t> bytes) const;

    // ── Encode ───────────────────────────────────────────────────────────────
    // Reserved and unassigned bytes are always written as zero; strings that
    // do not fit are truncated on a code point boundary.
    // Throws TdbError(InvalidFlarmId) for ids above 0xFFFFFF and
    // TdbError(InvalidEncoding) for strings that are not valid UTF-8.
    [[nodiscard]] std::array<uint8_t, kRecordSize> encode(const Record& rec) const;

    void encodeInto(const Record& rec, std::span<uint8_t> out) const;

private:
    OffsetPolicy        policy_;
    const RecordLayout* layout_;
};

} // namespace tdb
