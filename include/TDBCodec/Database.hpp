#pragma once
// Database.hpp – Public TDB decode / lookup / encode API.
//
// Usage example:
//   auto parsed = tdb::Database::parse(bytes);
//   for (const auto& w : parsed.warnings)
//       std::cerr << tdb::describe(w) << '\n';
//
//   if (const tdb::Record* r = parsed.database.find(0x3EE3C7))
//       std::cout << r->call_sign << ' ' << tdb::frequencyMHz(*r) << '\n';
//
//   std::vector<uint8_t> out = parsed.database.serialize();
//
// A Database is immutable once built.  Its records are kept in ascending
// flarm_id order with no duplicates, and index()[i] == records()[i].flarm_id
// for every i.  Edits go through build(): copy records(), change them, build
// a new Database.

#include "Error.hpp"
#include "Header.hpp"
#include "Index.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tdb {

struct ParseResult;
struct BuildResult;

class Database {
public:
    Database() = default;

    // ── Decode ───────────────────────────────────────────────────────────────
    // Hard failures throw TdbError: BadMagic, Truncated, IndexMismatch,
    // InvalidEncoding.  Everything else is returned as warnings; with
    // options.strict the first warning is thrown instead.
    // An index that is unsorted or repeats ids still loads: the records are
    // reordered (first-seen id wins) so lookups stay correct.
    [[nodiscard]] static ParseResult parse(std::span<const uint8_t> buf,
                                           const ParseOptions& options = {});

    // ── Build from structured records ────────────────────────────────────────
    // Sorts the records by flarm_id and drops later duplicates.
    // Throws TdbError(InvalidFlarmId) for ids above 0xFFFFFF.
    [[nodiscard]] static BuildResult build(uint32_t version,
                                           std::vector<Record> records,
                                           OffsetPolicy policy = OffsetPolicy::Offset32);

    // ── Lookup ───────────────────────────────────────────────────────────────
    // O(log N) binary search in the index, then direct access to the record
    // at the same position.  find() returns nullptr when absent; at() throws
    // TdbError(NotFound).
    [[nodiscard]] const Record* find(uint32_t flarm_id) const noexcept;
    [[nodiscard]] const Record& at(uint32_t flarm_id) const;

    // Re-checks the invariants on the in-memory model.  A Database produced
    // by parse() or build() only reports preserved soft issues here
    // (nonzero reserved bytes, ids above 24 bits, strings too long for their
    // field).
    [[nodiscard]] std::vector<Warning> validate() const;

    // ── Encode ───────────────────────────────────────────────────────────────
    // Header + index + 8 zero bytes + records, with this Database's offset
    // policy.  Reserved bytes are written as zero.  Byte-exact for any input
    // that satisfied every invariant.
    // Throws TdbError(InvalidFlarmId) if a record id does not fit in 24 bits.
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    [[nodiscard]] Header header() const noexcept {
        return Header{version_, static_cast<uint32_t>(records_.size())};
    }
    [[nodiscard]] uint32_t     version() const noexcept { return version_; }
    [[nodiscard]] OffsetPolicy policy()  const noexcept { return policy_; }
    [[nodiscard]] size_t       size()    const noexcept { return records_.size(); }
    [[nodiscard]] bool         empty()   const noexcept { return records_.empty(); }
    [[nodiscard]] const Index& index()   const noexcept { return index_; }
    [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }

    bool operator==(const Database&) const = default;

private:
    Database(uint32_t version, OffsetPolicy policy, Index index,
             std::vector<Record> records) noexcept;

    // Sort (id, record) pairs together and drop later duplicates.
    static Database assemble(uint32_t version, OffsetPolicy policy,
                             std::vector<Record> records,
                             std::vector<size_t>& dropped);

    uint32_t            version_{0};
    OffsetPolicy        policy_{OffsetPolicy::Offset32};
    Index               index_;
    std::vector<Record> records_;
};

struct ParseResult {
    Database             database;
    std::vector<Warning> warnings;
};

struct BuildResult {
    Database             database;
    std::vector<Warning> warnings; // one DuplicateId per dropped record
    size_t               dropped{0};
};

} // namespace tdb
