#pragma once
// Format.hpp – Text forms of flarm ids and radio frequencies as FlarmNet
// tooling shows them ("3EE3C7", "123.500").

#include <cstdint>
#include <string>
#include <string_view>

namespace tdb {

// Six upper-case hex digits, zero-padded.
[[nodiscard]] std::string formatFlarmId(uint32_t id);

// Hex digits only (no "0x" prefix, no sign), either case.
// Throws TdbError(InvalidFlarmId) on anything else or a value above 0xFFFFFF.
[[nodiscard]] uint32_t parseFlarmId(std::string_view text);

// "123.500" for 123500 kHz; empty for 0 (unset).
[[nodiscard]] std::string formatFrequency(uint32_t khz);

// MHz text to kHz, rounded to the nearest kHz.  Empty text is 0 (unset).
// Throws TdbError(InvalidFrequency) for non-numeric, negative or too large input.
[[nodiscard]] uint32_t parseFrequency(std::string_view mhz);

} // namespace tdb
