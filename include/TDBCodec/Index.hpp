#pragma once
// Index.hpp – Sorted flarm-id index with binary-search lookup.
//
// On the wire the index is N little-endian u32 ids in strictly ascending
// order.  Entry i mirrors records[i].flarm_id, so a lookup position is also a
// position in the record section.

#include "Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tdb {

// Result of Index::build.
struct IndexBuild;

class Index {
public:
    Index() = default;

    // Adopt an already ordered sequence.  Throws TdbError(NotSorted) on a
    // descending step and TdbError(DuplicateId) on equal neighbours, with the
    // offending entry reported at base_offset + 4*i.
    [[nodiscard]] static Index fromSorted(std::vector<uint32_t> ids, size_t base_offset = 0);

    // Sort and de-duplicate an arbitrary sequence.  Among equal ids the one
    // that appears first in the input is kept.
    [[nodiscard]] static IndexBuild build(std::span<const uint32_t> ids);

    // Positions of the entries Index::build keeps, in ascending id order.
    // Positions that lose to an earlier equal id are appended to dropped (if
    // given), in input order.  Used to reorder a parallel record sequence.
    [[nodiscard]] static std::vector<size_t> sortedOrder(std::span<const uint32_t> ids,
                                                         std::vector<size_t>* dropped = nullptr);

    // Ordering problems as warnings, without failing.  base_offset is the
    // byte offset of ids[0] in the file; entry i is reported at
    // base_offset + 4*i.
    [[nodiscard]] static std::vector<Warning> check(std::span<const uint32_t> ids,
                                                    size_t base_offset = 0);

    // Binary search.  Returns the position of target, or nullopt.
    [[nodiscard]] std::optional<size_t> lookup(uint32_t target) const noexcept;

    // Same, reporting the number of id comparisons performed
    // (at most floor(log2(N)) + 1).
    [[nodiscard]] std::optional<size_t> lookup(uint32_t target,
                                               size_t& comparisons) const noexcept;

    [[nodiscard]] size_t   size()  const noexcept { return ids_.size(); }
    [[nodiscard]] bool     empty() const noexcept { return ids_.empty(); }
    [[nodiscard]] uint32_t operator[](size_t i) const { return ids_[i]; }
    [[nodiscard]] const std::vector<uint32_t>& ids() const noexcept { return ids_; }

    bool operator==(const Index&) const = default;

private:
    explicit Index(std::vector<uint32_t> ids) noexcept : ids_(std::move(ids)) {}

    std::vector<uint32_t> ids_;
};

struct IndexBuild {
    Index  index;
    size_t dropped{0}; // duplicate ids removed
};

} // namespace tdb
