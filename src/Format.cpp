// Format.cpp – Flarm id and frequency text conversions.

#include "TDBCodec/Format.hpp"
#include "TDBCodec/Error.hpp"
#include "TDBCodec/Types.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tdb {

std::string formatFlarmId(uint32_t id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%06X", id);
    return buf;
}

uint32_t parseFlarmId(std::string_view text) {
    uint32_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v, 16);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        throw TdbError(ErrorCode::InvalidFlarmId,
                       "cannot parse flarm id '" + std::string(text) + "'");
    if (v > kMaxFlarmId)
        throw TdbError(ErrorCode::InvalidFlarmId,
                       "flarm id '" + std::string(text) + "' exceeds 24 bits");
    return v;
}

std::string formatFrequency(uint32_t khz) {
    if (khz == 0) return {};
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%u.%03u", khz / 1000, khz % 1000);
    return buf;
}

uint32_t parseFrequency(std::string_view mhz) {
    if (mhz.empty()) return 0;

    const std::string s(mhz);
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v))
        throw TdbError(ErrorCode::InvalidFrequency, "cannot parse frequency '" + s + "'");

    const double khz = std::round(v * 1000.0);
    if (khz < 0.0 || khz > 4294967295.0)
        throw TdbError(ErrorCode::InvalidFrequency, "frequency '" + s + "' out of range");
    return static_cast<uint32_t>(khz);
}

} // namespace tdb
