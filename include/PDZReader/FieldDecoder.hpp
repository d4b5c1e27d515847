#pragma once
// FieldDecoder.hpp – Field-level decode primitives.
//
// Every decoder takes the record's byte view, the offset of the field and the
// fields already decoded at the same level (siblings), which parameterise
// dynamic lengths, sample counts and repeat counts.  Decoders never throw on
// malformed input: bounds failures come back as DecodeError::InsufficientBytes
// with nothing consumed.

#include "Types.hpp"

#include <optional>
#include <span>
#include <string>

namespace pdz {

inline constexpr size_t kSystemTimeSize = 16; // eight uint16 words
inline constexpr size_t kWideCharSize   = 2;  // UTF-16 code unit
inline constexpr size_t kSampleSize     = 4;  // one channel / float sample

// Result of decoding one field.  `value` is empty for Skip fields, for groups
// whose repeat count resolved to zero, and on failure.
struct FieldResult {
    std::optional<Value> value;
    size_t               consumed{0};
    DecodeError          error{DecodeError::None};

    [[nodiscard]] bool ok() const noexcept { return error == DecodeError::None; }
};

// Result of decoding a repeatable group.  On failure `items` holds the
// iterations completed before the failing sub-field and `consumed` every byte
// read, including those of the abandoned iteration.
struct GroupResult {
    std::vector<DecodedFields> items;
    size_t                     consumed{0};
    DecodeError                error{DecodeError::None};

    [[nodiscard]] bool ok() const noexcept { return error == DecodeError::None; }
};

// Decode any field kind, groups included.
[[nodiscard]] FieldResult decodeField(const FieldDef& def,
                                      std::span<const uint8_t> buf,
                                      size_t offset,
                                      const DecodedFields& siblings);

// Run def.fields def.repeat times, each iteration with its own sibling scope.
[[nodiscard]] GroupResult decodeGroup(const FieldDef& def,
                                      std::span<const uint8_t> buf,
                                      size_t offset,
                                      const DecodedFields& siblings);

// Literal count, or the named sibling coerced with toCount() (0 if absent).
[[nodiscard]] uint64_t resolveRepeat(const RepeatSpec& spec, const DecodedFields& siblings);

// UTF-16LE → UTF-8, trailing NUL code units removed.  Unpaired surrogates are
// replaced with U+FFFD; a dangling odd byte is ignored.
[[nodiscard]] std::string decodeWideText(std::span<const uint8_t> raw);

// SYSTEMTIME words → "YYYY-MM-DD HH:MM:SS".  Day-of-week and milliseconds are
// not rendered.
[[nodiscard]] std::string formatSystemTime(uint16_t year, uint16_t month, uint16_t day,
                                           uint16_t hour, uint16_t minute, uint16_t second);

} // namespace pdz
