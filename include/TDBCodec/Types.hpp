#pragma once
// Types.hpp – Wire-format constants and the value types of the TDB codec.
//
// File layout (all integers little-endian, unsigned):
//   [4B magic][4B version][4B count N][N × 4B flarm id][8B padding][N × 96B record]

#include "Logger.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tdb {

// ─── Wire-format constants ────────────────────────────────────────────────────
inline constexpr std::array<uint8_t, 4> kMagic{0x08, 0xD5, 0x19, 0x87};

inline constexpr size_t kHeaderSize      = 12;
inline constexpr size_t kIndexEntrySize  = 4;
inline constexpr size_t kPaddingSize     = 8;
inline constexpr size_t kRecordSize      = 96;
inline constexpr size_t kStringFieldSize = 16;
inline constexpr size_t kReservedSize    = 8;

// Largest id a FLARM transponder can transmit (24 bits).
inline constexpr uint32_t kMaxFlarmId = 0xFFFFFF;

// ─── Where pilot_name lives inside a record ───────────────────────────────────
// The public format description does not settle this, so the choice is made
// explicit instead of being baked into the record layout.
enum class OffsetPolicy {
    Offset32, // pilot_name = bytes 32..48, same 16-byte slot as the other strings
    Offset8,  // pilot_name = bytes 8..16 (the "reserved" slot, 7 payload bytes)
};

[[nodiscard]] const char* toString(OffsetPolicy policy) noexcept;

// ─── One aircraft entry ───────────────────────────────────────────────────────
struct Record {
    uint32_t flarm_id{0};
    uint32_t frequency{0};                 // kHz; 0 = unset
    std::array<uint8_t, kReservedSize> reserved{}; // as read; always written as zero

    std::string call_sign;
    std::string pilot_name;
    std::string airfield;
    std::string plane_type;
    std::string registration;

    bool operator==(const Record&) const = default;
};

// Display value of the radio frequency in MHz (0.0 when unset).
[[nodiscard]] inline double frequencyMHz(const Record& r) noexcept {
    return r.frequency / 1000.0;
}

// ─── Options controlling Database::parse / Database::build ────────────────────
struct ParseOptions {
    OffsetPolicy  pilot_name_offset{OffsetPolicy::Offset32};
    bool          strict{false};          // promote the first warning to a TdbError
    Logger::Level log_level{Logger::kError};
};

} // namespace tdb
