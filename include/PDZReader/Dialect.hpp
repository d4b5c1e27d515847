#pragma once
// Dialect.hpp – Version-code table and dialect detection.
//
// The first two bytes of every PDZ file are a little-endian version code.
// In pdz25 files they double as the type of the leading File Header block.

#include "Types.hpp"

#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>

namespace pdz {

// Thrown when the version code matches no known dialect.  Fatal: the whole
// decode is aborted.
class DialectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr uint16_t kPdz24Version = 257;
inline constexpr uint16_t kPdz25Version = 25;

[[nodiscard]] std::optional<Dialect> dialectFromVersion(uint16_t version) noexcept;
[[nodiscard]] std::optional<Dialect> dialectFromId(std::string_view id) noexcept;

[[nodiscard]] uint16_t    versionOf(Dialect d) noexcept;
[[nodiscard]] const char* toString(Dialect d) noexcept; // "pdz24" / "pdz25"

// Reads the version code from the start of `buf`.
// Throws DialectError for unknown codes or buffers shorter than two bytes.
[[nodiscard]] Dialect detectDialect(std::span<const uint8_t> buf);

} // namespace pdz
