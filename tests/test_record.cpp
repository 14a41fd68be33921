// test_record.cpp – 96-byte record decode/encode under both pilot_name
// offset policies.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_record

#include "TDBCodec/ByteStream.hpp"
#include "TDBCodec/Error.hpp"
#include "TDBCodec/RecordCodec.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace tdb;

// ─── Utility ─────────────────────────────────────────────────────────────────

static void hexdump(std::span<const uint8_t> v, const std::string& label) {
    std::cout << label << " [" << v.size() << "B]: ";
    for (uint8_t b : v)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b << ' ';
    std::cout << std::dec << '\n';
}

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

using RecordBytes = std::array<uint8_t, kRecordSize>;

static void put(RecordBytes& r, size_t at, const char* s) {
    std::memcpy(r.data() + at, s, std::strlen(s));
}

// Hand-assembled record in the Offset32 layout.
static RecordBytes makeRecord(uint32_t id, uint32_t khz,
                              const char* call_sign, const char* pilot,
                              const char* airfield, const char* type, const char* reg) {
    RecordBytes r{};
    storeU32LE(r, 0, id);
    storeU32LE(r, 4, khz);
    put(r, 16, call_sign);
    put(r, 32, pilot);
    put(r, 48, airfield);
    put(r, 64, type);
    put(r, 80, reg);
    return r;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: decode with the default policy
// ─────────────────────────────────────────────────────────────────────────────
static void testDecodeOffset32() {
    std::cout << "\n=== Test: decode (Offset32) ===\n";

    auto bytes = makeRecord(0x3EE3C7, 123500, "SG", "John Doe", "EDKA", "LS6a", "D-0816");
    hexdump(bytes, "record");

    RecordCodec codec;
    CHECK(codec.policy() == OffsetPolicy::Offset32, "default policy is Offset32");

    std::vector<Warning> warnings;
    Record r = codec.decode(bytes, 0, 0, warnings);

    CHECK(warnings.empty(),            "no warnings");
    CHECK(r.flarm_id == 0x3EE3C7,      "flarm_id");
    CHECK(r.frequency == 123500,       "frequency kHz");
    CHECK(frequencyMHz(r) == 123.5,    "frequency MHz");
    CHECK(r.call_sign == "SG",         "call_sign @16");
    CHECK(r.pilot_name == "John Doe",  "pilot_name @32");
    CHECK(r.airfield == "EDKA",        "airfield @48");
    CHECK(r.plane_type == "LS6a",      "plane_type @64");
    CHECK(r.registration == "D-0816",  "registration @80");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: encode is the exact inverse of decode
// ─────────────────────────────────────────────────────────────────────────────
static void testEncodeInverse() {
    std::cout << "\n=== Test: encode inverse (Offset32) ===\n";

    auto bytes = makeRecord(0x000001, 0, "", "", "", "Paraglider", "");
    RecordCodec codec;
    Record r = codec.decode(bytes);

    CHECK(r.frequency == 0, "frequency 0 decodes as 0 (unset)");
    CHECK(codec.encode(r) == bytes, "re-encoded bytes identical");

    Record built;
    built.flarm_id     = 0xDDA5BA;
    built.frequency    = 118250;
    built.call_sign    = "XY";
    built.pilot_name   = "Jane Roe";
    built.airfield     = "EDTG";
    built.plane_type   = "Discus 2";
    built.registration = "D-KXYZ";

    auto enc = codec.encode(built);
    CHECK(loadU32LE(enc, 0) == 0xDDA5BA, "id written little-endian");
    CHECK(enc[0] == 0xBA && enc[1] == 0xA5 && enc[2] == 0xDD && enc[3] == 0x00,
          "id byte order");
    CHECK(codec.decode(enc) == built, "encode/decode yields the same record");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: reserved bytes – preserved on decode, zeroed on encode
// ─────────────────────────────────────────────────────────────────────────────
static void testReserved() {
    std::cout << "\n=== Test: reserved bytes ===\n";

    auto bytes = makeRecord(0x000042, 0, "A", "", "", "", "");
    bytes[9]  = 0x5A;
    bytes[15] = 0x01;

    RecordCodec codec;
    std::vector<Warning> warnings;
    Record r = codec.decode(bytes, 7, 1000, warnings);

    CHECK(r.reserved[1] == 0x5A && r.reserved[7] == 0x01, "reserved bytes preserved");
    CHECK(warnings.size() == 1, "one warning");
    if (!warnings.empty()) {
        CHECK(warnings[0].code == ErrorCode::NonzeroReserved, "NonzeroReserved");
        CHECK(warnings[0].offset == 1008,                     "offset = base + 8");
        CHECK(warnings[0].record == 7u,                       "record position");
    }

    auto enc = codec.encode(r);
    bool zero = true;
    for (size_t i = 8; i < 16; ++i) zero = zero && enc[i] == 0;
    CHECK(zero, "encode writes reserved as zero");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Offset8 policy
// ─────────────────────────────────────────────────────────────────────────────
static void testOffset8() {
    std::cout << "\n=== Test: Offset8 policy ===\n";

    const RecordLayout& l8 = layoutFor(OffsetPolicy::Offset8);
    CHECK(l8.pilot_name == 8 && l8.pilot_name_width == 8, "pilot_name @8, 8 bytes");
    CHECK(l8.call_sign == 16,                             "call_sign stays @16");
    CHECK(!l8.has_reserved,                               "no reserved block");

    RecordBytes bytes{};
    storeU32LE(bytes, 0, 0x123456);
    put(bytes, 8,  "Pilot");
    put(bytes, 16, "CS");
    put(bytes, 48, "EDDF");
    put(bytes, 64, "ASK 21");
    put(bytes, 80, "D-1234");

    RecordCodec codec8(OffsetPolicy::Offset8);
    std::vector<Warning> warnings;
    Record r = codec8.decode(bytes, 0, 0, warnings);

    CHECK(warnings.empty(),           "no warnings");
    CHECK(r.pilot_name == "Pilot",    "pilot_name read from bytes 8..16");
    CHECK(r.call_sign == "CS",        "call_sign");
    CHECK(r.airfield == "EDDF",       "airfield");
    CHECK(codec8.encode(r) == bytes,  "Offset8 encode is the inverse");

    // The same bytes read with Offset32 see the name as reserved garbage.
    std::vector<Warning> w32;
    Record r32 = RecordCodec{}.decode(bytes, 0, 0, w32);
    CHECK(r32.pilot_name.empty(),     "Offset32 reads an empty pilot_name @32");
    CHECK(w32.size() == 1 && w32[0].code == ErrorCode::NonzeroReserved,
          "Offset32 flags bytes 8..16");

    // Long names are cut to 7 bytes under Offset8.
    Record longName = r;
    longName.pilot_name = "Maximilian";
    CHECK(codec8.decode(codec8.encode(longName)).pilot_name == "Maximil", "7-byte pilot_name");

    // Data in the slot Offset8 leaves unassigned is reported.
    bytes[40] = 0x41;
    warnings.clear();
    (void)codec8.decode(bytes, 2, 0, warnings);
    CHECK(warnings.size() == 1 && warnings[0].code == ErrorCode::NonzeroReserved &&
              warnings[0].offset == 32,
          "unassigned bytes 32..48 flagged");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: error reporting
// ─────────────────────────────────────────────────────────────────────────────
static void testErrors() {
    std::cout << "\n=== Test: errors ===\n";

    RecordCodec codec;

    auto bad = makeRecord(0x000001, 0, "", "", "", "", "");
    bad[16] = 0xFF;
    bad[17] = 0xFE;
    bool threw = false;
    try {
        std::vector<Warning> w;
        (void)codec.decode(bad, 4, 500, w);
    } catch (const TdbError& e) {
        threw = e.code() == ErrorCode::InvalidEncoding && e.field() == "call_sign" &&
                e.record() == 4u && e.offset() == 516;
        std::cout << "     " << e.what() << '\n';
    }
    CHECK(threw, "InvalidEncoding names field, record and offset");

    auto big = makeRecord(0x01000000, 0, "", "", "", "", "");
    std::vector<Warning> w;
    Record r = codec.decode(big, 0, 0, w);
    CHECK(w.size() == 1 && w[0].code == ErrorCode::InvalidFlarmId, "id > 24 bits is a warning on decode");

    threw = false;
    try {
        (void)codec.encode(r);
    } catch (const TdbError& e) {
        threw = e.code() == ErrorCode::InvalidFlarmId;
    }
    CHECK(threw, "id > 24 bits rejected on encode");

    Record invalid;
    invalid.registration = "\xC3";
    threw = false;
    try {
        (void)codec.encode(invalid);
    } catch (const TdbError& e) {
        threw = e.code() == ErrorCode::InvalidEncoding && e.field() == "registration";
    }
    CHECK(threw, "invalid UTF-8 rejected on encode");

    threw = false;
    try {
        std::vector<uint8_t> shortBuf(95, 0);
        (void)codec.decode(shortBuf);
    } catch (const TdbError& e) {
        threw = e.code() == ErrorCode::Truncated;
    }
    CHECK(threw, "95-byte record -> Truncated");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testDecodeOffset32();
    testEncodeInverse();
    testReserved();
    testOffset8();
    testErrors();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
