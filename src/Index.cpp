// Index.cpp – Ordering checks, sort/de-dup and binary search over flarm ids.

#include "TDBCodec/Index.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>
#include <string>

namespace tdb {

static std::string hexId(uint32_t id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%06X", id);
    return buf;
}

Index Index::fromSorted(std::vector<uint32_t> ids, size_t base_offset) {
    for (size_t i = 1; i < ids.size(); ++i) {
        if (ids[i] == ids[i - 1])
            throw TdbError(ErrorCode::DuplicateId,
                           "id " + hexId(ids[i]) + " repeated at position " + std::to_string(i),
                           base_offset + i * 4);
        if (ids[i] < ids[i - 1])
            throw TdbError(ErrorCode::NotSorted,
                           "id " + hexId(ids[i]) + " at position " + std::to_string(i) +
                               " is smaller than its predecessor " + hexId(ids[i - 1]),
                           base_offset + i * 4);
    }
    return Index{std::move(ids)};
}

std::vector<size_t> Index::sortedOrder(std::span<const uint32_t> ids,
                                       std::vector<size_t>* dropped) {
    std::vector<size_t> order(ids.size());
    std::iota(order.begin(), order.end(), size_t{0});

    // Stable: equal ids keep input order, so the first-seen one leads its run.
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return ids[a] < ids[b]; });

    std::vector<size_t> kept;
    kept.reserve(order.size());
    std::vector<size_t> lost;
    for (size_t pos : order) {
        if (!kept.empty() && ids[kept.back()] == ids[pos])
            lost.push_back(pos);
        else
            kept.push_back(pos);
    }

    if (dropped) {
        std::sort(lost.begin(), lost.end());
        dropped->insert(dropped->end(), lost.begin(), lost.end());
    }
    return kept;
}

IndexBuild Index::build(std::span<const uint32_t> ids) {
    std::vector<size_t> dropped;
    std::vector<size_t> order = sortedOrder(ids, &dropped);

    std::vector<uint32_t> sorted;
    sorted.reserve(order.size());
    for (size_t pos : order) sorted.push_back(ids[pos]);

    return IndexBuild{Index{std::move(sorted)}, dropped.size()};
}

std::vector<Warning> Index::check(std::span<const uint32_t> ids, size_t base_offset) {
    std::vector<Warning> out;
    std::vector<bool>    flagged(ids.size(), false);
    for (size_t i = 1; i < ids.size(); ++i) {
        const size_t at = base_offset + i * 4;
        if (ids[i] == ids[i - 1]) {
            flagged[i] = true;
            out.push_back({ErrorCode::DuplicateId, at, i,
                           "index repeats id " + hexId(ids[i])});
        } else if (ids[i] < ids[i - 1]) {
            out.push_back({ErrorCode::NotSorted, at, i,
                           "index id " + hexId(ids[i]) + " follows larger id " +
                               hexId(ids[i - 1])});
        }
    }
    // Non-adjacent repeats (e.g. A B A) only show up once the order is known.
    std::vector<size_t> dropped;
    (void)sortedOrder(ids, &dropped);
    for (size_t pos : dropped) {
        if (!flagged[pos])
            out.push_back({ErrorCode::DuplicateId, base_offset + pos * 4, pos,
                           "index repeats id " + hexId(ids[pos])});
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Lookup
// ─────────────────────────────────────────────────────────────────────────────
// Classic half-open narrowing over [lo, hi): each step compares against the
// midpoint and discards half of the remaining range.

std::optional<size_t> Index::lookup(uint32_t target, size_t& comparisons) const noexcept {
    comparisons = 0;
    size_t lo = 0;
    size_t hi = ids_.size();
    while (lo < hi) {
        const size_t mid = lo + (hi - lo) / 2;
        const uint32_t v = ids_[mid];
        ++comparisons;
        if (v == target) return mid;
        if (v < target) lo = mid + 1;
        else            hi = mid;
    }
    return std::nullopt;
}

std::optional<size_t> Index::lookup(uint32_t target) const noexcept {
    size_t ignored = 0;
    return lookup(target, ignored);
}

} // namespace tdb
