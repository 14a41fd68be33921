// Error.cpp – ErrorCode names and TdbError / Warning formatting.

#include "TDBCodec/Error.hpp"

#include <cstdio>
#include <utility>

namespace tdb {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::BadMagic:         return "BadMagic";
    case ErrorCode::Truncated:        return "Truncated";
    case ErrorCode::IndexMismatch:    return "IndexMismatch";
    case ErrorCode::InvalidEncoding:  return "InvalidEncoding";
    case ErrorCode::NotSorted:        return "NotSorted";
    case ErrorCode::DuplicateId:      return "DuplicateId";
    case ErrorCode::NotFound:         return "NotFound";
    case ErrorCode::NonzeroReserved:  return "NonzeroReserved";
    case ErrorCode::NonzeroPadding:   return "NonzeroPadding";
    case ErrorCode::InvalidFlarmId:   return "InvalidFlarmId";
    case ErrorCode::InvalidFrequency: return "InvalidFrequency";
    case ErrorCode::TrailingData:     return "TrailingData";
    case ErrorCode::UnterminatedString: return "UnterminatedString";
    }
    return "Unknown";
}

TdbError::TdbError(ErrorCode code, const std::string& what,
                   size_t offset, std::optional<size_t> record,
                   std::string field)
    : std::runtime_error(std::string(toString(code)) + ": " + what),
      code_(code),
      offset_(offset),
      record_(record),
      field_(std::move(field)) {}

std::string describe(const Warning& w) {
    char at[32];
    std::snprintf(at, sizeof(at), " @ 0x%zx", w.offset);

    std::string out = toString(w.code);
    out += at;
    if (w.record)
        out += " (record " + std::to_string(*w.record) + ")";
    if (!w.message.empty()) {
        out += ": ";
        out += w.message;
    }
    return out;
}

} // namespace tdb
