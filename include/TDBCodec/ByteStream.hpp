#pragma once
// ByteStream.hpp – Little-endian byte-level I/O for TDB buffers.
//
// TDB wire format rules:
//   • Every multi-byte integer is an unsigned little-endian value.
//   • All sections are byte-aligned; there is no bit packing.

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tdb {

// ── Fixed-position helpers (records are encoded into fixed-size arrays) ──────

[[nodiscard]] inline uint32_t loadU32LE(std::span<const uint8_t> buf, size_t at) {
    if (at + 4 > buf.size())
        throw std::out_of_range("loadU32LE – out of bounds");
    return static_cast<uint32_t>(buf[at])
         | static_cast<uint32_t>(buf[at + 1]) << 8
         | static_cast<uint32_t>(buf[at + 2]) << 16
         | static_cast<uint32_t>(buf[at + 3]) << 24;
}

inline void storeU32LE(std::span<uint8_t> buf, size_t at, uint32_t v) {
    if (at + 4 > buf.size())
        throw std::out_of_range("storeU32LE – out of bounds");
    buf[at]     = static_cast<uint8_t>(v & 0xFFu);
    buf[at + 1] = static_cast<uint8_t>((v >> 8) & 0xFFu);
    buf[at + 2] = static_cast<uint8_t>((v >> 16) & 0xFFu);
    buf[at + 3] = static_cast<uint8_t>((v >> 24) & 0xFFu);
}

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads sequentially from a read-only byte span.
// Position is a byte offset from the start of the buffer, so it doubles as
// the offset reported in errors and warnings.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> buf) noexcept
        : buf_(buf), pos_(0) {}

    [[nodiscard]] size_t position()  const noexcept { return pos_; }
    [[nodiscard]] size_t available() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool   canRead(size_t n) const noexcept { return available() >= n; }

    [[nodiscard]] uint32_t readU32LE() {
        boundsCheck(4, "readU32LE");
        const uint32_t v = loadU32LE(buf_, pos_);
        pos_ += 4;
        return v;
    }

    // Returns a view into the underlying buffer; no copy is made.
    [[nodiscard]] std::span<const uint8_t> readBytes(size_t n) {
        boundsCheck(n, "readBytes");
        auto out = buf_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    void skip(size_t n) {
        boundsCheck(n, "skip");
        pos_ += n;
    }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};

    void boundsCheck(size_t n, const char* where) const {
        if (!canRead(n))
            throw std::out_of_range(std::string("ByteReader::") + where +
                                    " – read past end of buffer");
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  ByteWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends into an internal byte buffer that grows as needed.
class ByteWriter {
public:
    ByteWriter() = default;

    void reserve(size_t n) { buf_.reserve(n); }

    void writeU32LE(uint32_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFFu));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFFu));
        buf_.push_back(static_cast<uint8_t>((v >> 16) & 0xFFu));
        buf_.push_back(static_cast<uint8_t>((v >> 24) & 0xFFu));
    }

    void writeBytes(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void writeZeros(size_t n) { buf_.insert(buf_.end(), n, uint8_t{0}); }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] const std::vector<uint8_t>& buffer() const noexcept { return buf_; }
    [[nodiscard]] std::vector<uint8_t>        take()         noexcept { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

} // namespace tdb
