// Database.cpp – TDB file decode / validate / lookup / encode.
//
// Wire-format reminder:
//   File   = [magic 4B][version 4B][N 4B][N × id 4B][padding 8B][N × record 96B]
//   Record = [flarm_id 4B][frequency 4B][reserved 8B][5 × string 16B]
//
// All multi-byte integers on the wire are little-endian.

#include "TDBCodec/Database.hpp"
#include "TDBCodec/ByteStream.hpp"
#include "TDBCodec/Logger.hpp"
#include "TDBCodec/RecordCodec.hpp"
#include "TDBCodec/StringField.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <string>
#include <utility>

namespace tdb {

Database::Database(uint32_t version, OffsetPolicy policy, Index index,
                   std::vector<Record> records) noexcept
    : version_(version),
      policy_(policy),
      index_(std::move(index)),
      records_(std::move(records)) {}

// ─────────────────────────────────────────────────────────────────────────────
//  Assembly: records and index are ordered together, never separately
// ─────────────────────────────────────────────────────────────────────────────

Database Database::assemble(uint32_t version, OffsetPolicy policy,
                            std::vector<Record> records,
                            std::vector<size_t>& dropped) {
    std::vector<uint32_t> ids;
    ids.reserve(records.size());
    for (const auto& r : records) ids.push_back(r.flarm_id);

    const std::vector<size_t> order = Index::sortedOrder(ids, &dropped);

    std::vector<uint32_t> sorted_ids;
    std::vector<Record>   sorted;
    sorted_ids.reserve(order.size());
    sorted.reserve(order.size());
    for (size_t pos : order) {
        sorted_ids.push_back(ids[pos]);
        sorted.push_back(std::move(records[pos]));
    }

    return Database{version, policy, Index::fromSorted(std::move(sorted_ids), kHeaderSize),
                    std::move(sorted)};
}

BuildResult Database::build(uint32_t version, std::vector<Record> records,
                            OffsetPolicy policy) {
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].flarm_id > kMaxFlarmId) {
            char msg[64];
            std::snprintf(msg, sizeof(msg), "record %zu has flarm id 0x%08X (above 24 bits)",
                          i, records[i].flarm_id);
            throw TdbError(ErrorCode::InvalidFlarmId, msg, 0, i);
        }
    }

    std::vector<uint32_t> ids;
    ids.reserve(records.size());
    for (const auto& r : records) ids.push_back(r.flarm_id);

    BuildResult out;
    std::vector<size_t> dropped;
    out.database = assemble(version, policy, std::move(records), dropped);
    out.dropped  = dropped.size();
    for (size_t pos : dropped) {
        char msg[80];
        std::snprintf(msg, sizeof(msg), "record %zu repeats flarm id 0x%06X; first one kept",
                      pos, ids[pos]);
        out.warnings.push_back({ErrorCode::DuplicateId, 0, pos, msg});
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Public decode
// ─────────────────────────────────────────────────────────────────────────────

ParseResult Database::parse(std::span<const uint8_t> buf, const ParseOptions& options) {
    const Logger logger(options.log_level);

    // ── Step 1: header and declared size ─────────────────────────────────────
    const Header header = Header::decode(buf);
    if (header.totalSize() > buf.size())
        throw TdbError(ErrorCode::Truncated,
                       std::to_string(header.record_count) + " records need " +
                           std::to_string(header.totalSize()) + " bytes, buffer has " +
                           std::to_string(buf.size()),
                       buf.size());

    const size_t n = header.record_count;
    std::vector<Warning> warnings;

    ByteReader br{buf};
    br.skip(kHeaderSize);

    // ── Step 2: index ────────────────────────────────────────────────────────
    std::vector<uint32_t> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i) ids.push_back(br.readU32LE());

    // ── Step 3: padding ──────────────────────────────────────────────────────
    const size_t padding_at = br.position();
    auto padding = br.readBytes(kPaddingSize);
    if (std::any_of(padding.begin(), padding.end(), [](uint8_t b) { return b != 0; }))
        warnings.push_back({ErrorCode::NonzeroPadding, padding_at, std::nullopt,
                            "padding between index and records is not zero"});

    // ── Step 4: records, each cross-checked against its index entry ──────────
    const RecordCodec codec(options.pilot_name_offset);
    std::vector<Record> records;
    records.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const size_t at = br.position();
        Record rec = codec.decode(br.readBytes(kRecordSize), i, at, warnings);
        if (rec.flarm_id != ids[i]) {
            char msg[96];
            std::snprintf(msg, sizeof(msg),
                          "index[%zu] = 0x%06X but record %zu has flarm id 0x%06X",
                          i, ids[i], i, rec.flarm_id);
            throw TdbError(ErrorCode::IndexMismatch, msg, at, i);
        }
        records.push_back(std::move(rec));
    }

    if (br.available() > 0)
        warnings.push_back({ErrorCode::TrailingData, br.position(), std::nullopt,
                            std::to_string(br.available()) + " byte(s) after the last record"});

    // ── Step 5: index ordering (soft) ────────────────────────────────────────
    for (auto& w : Index::check(ids, kHeaderSize)) warnings.push_back(std::move(w));

    std::stable_sort(warnings.begin(), warnings.end(),
                     [](const Warning& a, const Warning& b) { return a.offset < b.offset; });

    for (const auto& w : warnings) logger.warn("%s", describe(w).c_str());

    if (options.strict && !warnings.empty()) {
        const Warning& w = warnings.front();
        throw TdbError(w.code, w.message, w.offset, w.record);
    }

    std::vector<size_t> dropped;
    ParseResult out;
    out.database = assemble(header.version, options.pilot_name_offset, std::move(records),
                            dropped);
    out.warnings = std::move(warnings);

    logger.info("parsed %zu record(s), version %u, pilot_name %s, %zu warning(s), %zu dropped",
                out.database.size(), header.version, toString(options.pilot_name_offset),
                out.warnings.size(), dropped.size());
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Lookup
// ─────────────────────────────────────────────────────────────────────────────

const Record* Database::find(uint32_t flarm_id) const noexcept {
    const auto pos = index_.lookup(flarm_id);
    return pos ? &records_[*pos] : nullptr;
}

const Record& Database::at(uint32_t flarm_id) const {
    if (const Record* r = find(flarm_id)) return *r;
    char msg[48];
    std::snprintf(msg, sizeof(msg), "flarm id 0x%06X not in database", flarm_id);
    throw TdbError(ErrorCode::NotFound, msg);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Validation
// ─────────────────────────────────────────────────────────────────────────────
// Offsets refer to the position each element would have in serialize().

std::vector<Warning> Database::validate() const {
    std::vector<Warning> out = Index::check(index_.ids(), kHeaderSize);
    const uint64_t      records_at = header().recordsOffset();
    const RecordLayout& l          = layoutFor(policy_);

    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& r  = records_[i];
        const size_t  at = static_cast<size_t>(records_at + i * kRecordSize);

        if (i >= index_.size() || index_[i] != r.flarm_id)
            out.push_back({ErrorCode::IndexMismatch, at, i,
                           "index entry does not mirror the record's flarm id"});

        if (r.flarm_id > kMaxFlarmId)
            out.push_back({ErrorCode::InvalidFlarmId, at, i, "flarm id exceeds 24 bits"});

        if (std::any_of(r.reserved.begin(), r.reserved.end(), [](uint8_t b) { return b != 0; }))
            out.push_back({ErrorCode::NonzeroReserved, at + 8, i,
                           "reserved bytes were nonzero when read; serialize writes zero"});

        struct FieldRef {
            const char*        name;
            const std::string* value;
            size_t             at;
            size_t             width;
        };
        const std::array<FieldRef, 5> fields{{
            {"call_sign",    &r.call_sign,    l.call_sign,    kStringFieldSize},
            {"pilot_name",   &r.pilot_name,   l.pilot_name,   l.pilot_name_width},
            {"airfield",     &r.airfield,     l.airfield,     kStringFieldSize},
            {"plane_type",   &r.plane_type,   l.plane_type,   kStringFieldSize},
            {"registration", &r.registration, l.registration, kStringFieldSize},
        }};
        for (const auto& f : fields) {
            if (!isValidUtf8(*f.value))
                out.push_back({ErrorCode::InvalidEncoding, at + f.at, i,
                               std::string(f.name) + " is not valid UTF-8"});
            // serialize keeps at most width-1 bytes
            if (f.value->size() >= f.width)
                out.push_back({ErrorCode::UnterminatedString, at + f.at, i,
                               std::string(f.name) + " is " + std::to_string(f.value->size()) +
                                   " bytes; only " + std::to_string(f.width - 1) +
                                   " fit before the terminator"});
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Public encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Database::serialize() const {
    const Header      h = header();
    const RecordCodec codec(policy_);

    ByteWriter bw;
    bw.reserve(static_cast<size_t>(h.totalSize()));

    const auto head = h.encode();
    bw.writeBytes(head);

    // index_ mirrors records_ by construction, so it is written as-is.
    for (uint32_t id : index_.ids()) bw.writeU32LE(id);

    bw.writeZeros(kPaddingSize);

    std::array<uint8_t, kRecordSize> rec_bytes{};
    for (const auto& r : records_) {
        codec.encodeInto(r, rec_bytes);
        bw.writeBytes(rec_bytes);
    }
    return bw.take();
}

} // namespace tdb
