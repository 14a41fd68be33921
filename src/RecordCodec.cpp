// RecordCodec.cpp – Fixed 96-byte record encode / decode.

#include "TDBCodec/RecordCodec.hpp"
#include "TDBCodec/ByteStream.hpp"
#include "TDBCodec/StringField.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace tdb {

static constexpr size_t kFlarmIdOffset   = 0;
static constexpr size_t kFrequencyOffset = 4;
static constexpr size_t kReservedOffset  = 8;

const char* toString(OffsetPolicy policy) noexcept {
    switch (policy) {
    case OffsetPolicy::Offset32: return "Offset32";
    case OffsetPolicy::Offset8:  return "Offset8";
    }
    return "Unknown";
}

const RecordLayout& layoutFor(OffsetPolicy policy) noexcept {
    static const RecordLayout offset32{};

    static const RecordLayout offset8 = [] {
        RecordLayout l;
        l.pilot_name       = kReservedOffset;
        l.pilot_name_width = kReservedSize;
        l.has_reserved     = false;
        l.unassigned       = 32;
        l.unassigned_width = kStringFieldSize;
        return l;
    }();

    return policy == OffsetPolicy::Offset8 ? offset8 : offset32;
}

RecordCodec::RecordCodec(OffsetPolicy policy) noexcept
    : policy_(policy), layout_(&layoutFor(policy)) {}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

static bool allZero(std::span<const uint8_t> bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// Decode one string field, turning a bare InvalidEncoding into one that
// names the field and the record.  A field with no NUL cannot be written back
// unchanged, so it is reported.
static std::string decodeField(std::span<const uint8_t> rec, size_t at, size_t width,
                               const char* name, size_t record_pos, size_t base_offset,
                               std::vector<Warning>& warnings) {
    const auto field = rec.subspan(at, width);
    try {
        std::string value = decodeStringField(field);
        if (std::find(field.begin(), field.end(), uint8_t{0}) == field.end())
            warnings.push_back({ErrorCode::UnterminatedString, base_offset + at, record_pos,
                                std::string(name) + " fills all " + std::to_string(width) +
                                    " bytes with no terminator"});
        return value;
    } catch (const TdbError& e) {
        if (e.code() != ErrorCode::InvalidEncoding) throw;
        throw TdbError(ErrorCode::InvalidEncoding,
                       std::string("invalid UTF-8 in ") + name + " of record " +
                           std::to_string(record_pos),
                       base_offset + at, record_pos, name);
    }
}

Record RecordCodec::decode(std::span<const uint8_t> bytes,
                           size_t record_pos,
                           size_t base_offset,
                           std::vector<Warning>& warnings) const {
    if (bytes.size() != kRecordSize)
        throw TdbError(ErrorCode::Truncated,
                       "record needs " + std::to_string(kRecordSize) + " bytes, got " +
                           std::to_string(bytes.size()),
                       base_offset, record_pos);

    const RecordLayout& l = *layout_;
    Record rec;

    rec.flarm_id  = loadU32LE(bytes, kFlarmIdOffset);
    rec.frequency = loadU32LE(bytes, kFrequencyOffset);

    if (rec.flarm_id > kMaxFlarmId) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "flarm id 0x%08X exceeds 24 bits", rec.flarm_id);
        warnings.push_back({ErrorCode::InvalidFlarmId, base_offset + kFlarmIdOffset,
                            record_pos, msg});
    }

    if (l.has_reserved) {
        auto reserved = bytes.subspan(kReservedOffset, kReservedSize);
        std::copy(reserved.begin(), reserved.end(), rec.reserved.begin());
        if (!allZero(reserved))
            warnings.push_back({ErrorCode::NonzeroReserved, base_offset + kReservedOffset,
                                record_pos, "reserved bytes 8..16 are not zero"});
    }

    if (l.unassigned_width > 0 && !allZero(bytes.subspan(l.unassigned, l.unassigned_width)))
        warnings.push_back({ErrorCode::NonzeroReserved, base_offset + l.unassigned, record_pos,
                            "unassigned bytes " + std::to_string(l.unassigned) + ".." +
                                std::to_string(l.unassigned + l.unassigned_width) +
                                " are not zero"});

    rec.call_sign    = decodeField(bytes, l.call_sign, kStringFieldSize, "call_sign",
                                   record_pos, base_offset, warnings);
    rec.pilot_name   = decodeField(bytes, l.pilot_name, l.pilot_name_width, "pilot_name",
                                   record_pos, base_offset, warnings);
    rec.airfield     = decodeField(bytes, l.airfield, kStringFieldSize, "airfield",
                                   record_pos, base_offset, warnings);
    rec.plane_type   = decodeField(bytes, l.plane_type, kStringFieldSize, "plane_type",
                                   record_pos, base_offset, warnings);
    rec.registration = decodeField(bytes, l.registration, kStringFieldSize, "registration",
                                   record_pos, base_offset, warnings);
    return rec;
}

Record RecordCodec::decode(std::span<const uint8_t> bytes) const {
    std::vector<Warning> ignored;
    return decode(bytes, 0, 0, ignored);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

static void encodeField(std::string_view value, std::span<uint8_t> rec, size_t at,
                        size_t width, const char* name) {
    try {
        encodeStringField(value, rec.subspan(at, width));
    } catch (const TdbError& e) {
        if (e.code() != ErrorCode::InvalidEncoding) throw;
        throw TdbError(ErrorCode::InvalidEncoding,
                       std::string("cannot encode ") + name + ": not valid UTF-8",
                       at, std::nullopt, name);
    }
}

void RecordCodec::encodeInto(const Record& rec, std::span<uint8_t> out) const {
    if (out.size() != kRecordSize)
        throw std::invalid_argument("RecordCodec::encodeInto: output must be " +
                                    std::to_string(kRecordSize) + " bytes");
    if (rec.flarm_id > kMaxFlarmId) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "flarm id 0x%08X exceeds 24 bits", rec.flarm_id);
        throw TdbError(ErrorCode::InvalidFlarmId, msg);
    }

    const RecordLayout& l = *layout_;
    std::fill(out.begin(), out.end(), uint8_t{0});

    storeU32LE(out, kFlarmIdOffset, rec.flarm_id);
    storeU32LE(out, kFrequencyOffset, rec.frequency);
    // reserved (or the unassigned slot under Offset8) stays zero

    encodeField(rec.call_sign,    out, l.call_sign,    kStringFieldSize,   "call_sign");
    encodeField(rec.pilot_name,   out, l.pilot_name,   l.pilot_name_width, "pilot_name");
    encodeField(rec.airfield,     out, l.airfield,     kStringFieldSize,   "airfield");
    encodeField(rec.plane_type,   out, l.plane_type,   kStringFieldSize,   "plane_type");
    encodeField(rec.registration, out, l.registration, kStringFieldSize,   "registration");
}

std::array<uint8_t, kRecordSize> RecordCodec::encode(const Record& rec) const {
    std::array<uint8_t, kRecordSize> out{};
    encodeInto(rec, out);
    return out;
}

} // namespace tdb
