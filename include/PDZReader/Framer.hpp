#pragma once
// Framer.hpp – Splits a PDZ file into typed record slices.
//
// pdz24: positional.  Bytes [0, 6) are record 0 (File Header), the rest is
//        record 1 (XRF Spectrum).
// pdz25: block stream.  Each block = [type u16][length u32][payload…], the
//        first block starting at offset 0.

#include "Types.hpp"

#include <span>
#include <vector>

namespace pdz {

inline constexpr size_t   kBlockHeaderSize    = 6; // pdz25 type + data length
inline constexpr size_t   kPdz24HeaderSize    = 6; // pdz24 File Header record
inline constexpr uint16_t kPdz24HeaderType    = 0;
inline constexpr uint16_t kPdz24SpectrumType  = 1;

// Framing never fails hard: `error` records why framing stopped early
// (None when the whole buffer was consumed) and `records` keeps every block
// framed before that point.
struct FrameResult {
    std::vector<RawRecord> records;
    DecodeError            error{DecodeError::None};
    size_t                 bytes_framed{0}; // headers + payloads accepted
};

// Record names come from `schema`; unknown types get a synthesized name.
[[nodiscard]] FrameResult frameFixed(std::span<const uint8_t> file, const DialectDef& schema);
[[nodiscard]] FrameResult frameBlocks(std::span<const uint8_t> file, const DialectDef& schema);

// Dispatch on schema.dialect.
[[nodiscard]] FrameResult frameRecords(std::span<const uint8_t> file, const DialectDef& schema);

} // namespace pdz
