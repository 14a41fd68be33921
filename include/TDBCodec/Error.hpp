#pragma once
// Error.hpp – Error codes, the TdbError exception and soft-failure warnings.
//
// Hard failures (the buffer cannot be turned into a consistent Database) are
// thrown as TdbError.  Soft inconsistencies are collected as Warning values
// and returned next to a best-effort result.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tdb {

enum class ErrorCode {
    BadMagic,         // first 4 bytes are not 08 D5 19 87
    Truncated,        // buffer shorter than the declared layout
    IndexMismatch,    // index[i] != records[i].flarm_id
    InvalidEncoding,  // string field is not valid UTF-8
    NotSorted,        // index not ascending
    DuplicateId,      // the same flarm id appears twice
    NotFound,         // lookup miss
    NonzeroReserved,  // reserved / unassigned record bytes are not zero
    NonzeroPadding,   // 8 bytes between index and records are not zero
    InvalidFlarmId,   // id does not fit in 24 bits, or unparsable id text
    InvalidFrequency, // unparsable or out-of-range frequency text
    TrailingData,     // bytes after the last record
    UnterminatedString, // string field fills its width with no NUL
};

[[nodiscard]] const char* toString(ErrorCode code) noexcept;

// ─── Hard failure ─────────────────────────────────────────────────────────────
class TdbError : public std::runtime_error {
public:
    TdbError(ErrorCode code, const std::string& what,
             size_t offset = 0,
             std::optional<size_t> record = std::nullopt,
             std::string field = {});

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    // Byte offset into the buffer being decoded (0 when not applicable).
    [[nodiscard]] size_t offset() const noexcept { return offset_; }

    // Record position, when the failure belongs to one record.
    [[nodiscard]] std::optional<size_t> record() const noexcept { return record_; }

    // Field name for per-field failures ("call_sign", …); empty otherwise.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    ErrorCode             code_;
    size_t                offset_{0};
    std::optional<size_t> record_;
    std::string           field_;
};

// ─── Soft failure ─────────────────────────────────────────────────────────────
struct Warning {
    ErrorCode             code{ErrorCode::NotSorted};
    size_t                offset{0};
    std::optional<size_t> record;
    std::string           message;
};

// Human-readable one-liner, e.g. "DuplicateId @ 0x10 (record 3): …"
[[nodiscard]] std::string describe(const Warning& w);

} // namespace tdb
