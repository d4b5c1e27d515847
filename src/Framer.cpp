// Framer.cpp – Container framing for both PDZ dialects.

#include "PDZReader/Framer.hpp"
#include "PDZReader/ByteStream.hpp"
#include "PDZReader/Log.hpp"

namespace pdz {

// ─────────────────────────────────────────────────────────────────────────────
//  pdz24 – fixed two-record framing
// ─────────────────────────────────────────────────────────────────────────────

FrameResult frameFixed(std::span<const uint8_t> file, const DialectDef& schema) {
    FrameResult out;

    if (file.size() < kPdz24HeaderSize) {
        PDZ_LOG_WARN("File too short for a pdz24 header: %zu bytes (need %zu)",
                     file.size(), kPdz24HeaderSize);
        out.error = DecodeError::InsufficientBytes;
        return out;
    }

    out.records.push_back({kPdz24HeaderType, schema.recordName(kPdz24HeaderType),
                           file.first(kPdz24HeaderSize)});

    if (file.size() > kPdz24HeaderSize) {
        out.records.push_back({kPdz24SpectrumType, schema.recordName(kPdz24SpectrumType),
                               file.subspan(kPdz24HeaderSize)});
    }

    out.bytes_framed = file.size();
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  pdz25 – self-describing block stream
// ─────────────────────────────────────────────────────────────────────────────

FrameResult frameBlocks(std::span<const uint8_t> file, const DialectDef& schema) {
    FrameResult out;
    ByteReader  br{file};
    const size_t total = file.size();

    while (!br.atEnd()) {
        const size_t block_offset = br.position();

        if (!br.canRead(kBlockHeaderSize)) {
            PDZ_LOG_WARN("Insufficient bytes for reading block header at offset %zu (%zu left)",
                         block_offset, br.remaining());
            out.error = DecodeError::InsufficientBytes;
            break;
        }

        const uint16_t type = br.readLE<uint16_t>();
        const uint32_t len  = br.readLE<uint32_t>();

        PDZ_LOG_DEBUG("Found block - Type: %u, Size: %u, Offset: %zu",
                      unsigned{type}, len, block_offset);

        if (len == 0 || len > total) {
            PDZ_LOG_WARN("Invalid block size detected: %u for block type %u",
                         len, unsigned{type});
            out.error = DecodeError::MalformedLength;
            break;
        }

        if (!br.canRead(len)) {
            PDZ_LOG_WARN("Insufficient bytes for block %u: required %u, available %zu",
                         unsigned{type}, len, br.remaining());
            out.error = DecodeError::InsufficientBytes;
            break;
        }

        out.records.push_back({type, schema.recordName(type), br.readBytes(len)});
        out.bytes_framed = br.position();
    }

    return out;
}

FrameResult frameRecords(std::span<const uint8_t> file, const DialectDef& schema) {
    switch (schema.dialect) {
    case Dialect::PDZ24: return frameFixed(file, schema);
    case Dialect::PDZ25: return frameBlocks(file, schema);
    }
    FrameResult out;
    out.error = DecodeError::UnrecognizedDialect;
    return out;
}

} // namespace pdz
