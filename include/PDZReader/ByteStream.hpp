#pragma once
// ByteStream.hpp – Little-endian byte-level reader for PDZ buffers.
//
// PDZ wire format rules:
//   • All multi-byte integers are little-endian (x86 instrument firmware).
//   • Floats are IEEE-754 binary32 / binary64, little-endian.
//   • Text is UTF-16LE (Windows wchar_t), never BOM-prefixed.
//   • Fields are byte-aligned; there is no padding between them.

#include <bit>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace pdz {

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads values sequentially from a read-only byte span.  The cursor may be
// placed anywhere in [0, size]; reads past the end throw std::out_of_range, so
// callers that must not throw test canRead() first.
//
// Example – reading a block header:
//   ByteReader br{file};
//   uint16_t type = br.readLE<uint16_t>();
//   uint32_t len  = br.readLE<uint32_t>();
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> buf, size_t pos = 0) noexcept
        : buf_(buf), pos_(pos < buf.size() ? pos : buf.size()) {}

    // ── Position queries ─────────────────────────────────────────────────────

    [[nodiscard]] size_t position()  const noexcept { return pos_; }
    [[nodiscard]] size_t size()      const noexcept { return buf_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool   atEnd()     const noexcept { return pos_ >= buf_.size(); }
    [[nodiscard]] bool   canRead(uint64_t n) const noexcept { return n <= remaining(); }

    // True when `count` items of `width` bytes fit in the remaining bytes.
    // Guards the multiplication against counts read from untrusted fields.
    [[nodiscard]] bool canReadArray(uint64_t count, uint64_t width) const noexcept {
        return width == 0 || count <= remaining() / width;
    }

    // ── Fundamental read operations ──────────────────────────────────────────

    // Read one little-endian integer or IEEE float of sizeof(T) bytes.
    template <typename T>
    [[nodiscard]] T readLE() {
        static_assert(std::is_arithmetic_v<T>, "readLE requires an arithmetic type");
        boundsCheck(sizeof(T));
        if constexpr (std::is_same_v<T, float>) {
            return std::bit_cast<float>(readUnsigned<uint32_t>());
        } else if constexpr (std::is_same_v<T, double>) {
            return std::bit_cast<double>(readUnsigned<uint64_t>());
        } else {
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(readUnsigned<U>());
        }
    }

    // Return a view over the next n bytes and advance past them.
    [[nodiscard]] std::span<const uint8_t> readBytes(uint64_t n) {
        boundsCheck(n);
        auto out = buf_.subspan(pos_, static_cast<size_t>(n));
        pos_ += static_cast<size_t>(n);
        return out;
    }

    // Skip n bytes.
    void skip(uint64_t n) {
        boundsCheck(n);
        pos_ += static_cast<size_t>(n);
    }

    // Everything from the cursor to the end of the buffer.
    [[nodiscard]] std::span<const uint8_t> rest() const noexcept {
        return buf_.subspan(pos_);
    }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};

    template <typename U>
    U readUnsigned() noexcept {
        U result = 0;
        for (size_t i = 0; i < sizeof(U); ++i)
            result |= static_cast<U>(static_cast<U>(buf_[pos_ + i]) << (8 * i));
        pos_ += sizeof(U);
        return result;
    }

    void boundsCheck(uint64_t n) const {
        if (!canRead(n))
            throw std::out_of_range("ByteReader: read past end of buffer");
    }
};

} // namespace pdz
