#pragma once
// Decoder.hpp – Public PDZ decode API.
//
// Usage example:
//   auto decoder = Decoder::withBuiltinSchemas();
//
//   // Decode a whole file:
//   ParsedDocument doc = decoder.decodeFile("sample.pdz");
//
//   // Access fields:
//   const auto& header = doc.fields("File Header");
//   for (const auto& phase : doc.occurrences("XRF Spectrum"))
//       auto& counts = phase.get<std::vector<uint32_t>>("spectrum_data");

#include "Framer.hpp"
#include "Types.hpp"

#include <filesystem>
#include <map>
#include <span>

namespace pdz {

class Decoder {
public:
    // A decoder with the shipped pdz24 and pdz25 schemas registered.
    [[nodiscard]] static Decoder withBuiltinSchemas();

    // Register a dialect schema (loaded via loadSchema() or builtinSchema()).
    // A schema for an already registered dialect replaces it.
    void registerDialect(DialectDef def);

    // Return a registered dialect schema (throws std::out_of_range if absent).
    [[nodiscard]] const DialectDef& dialect(Dialect d) const;
    [[nodiscard]] bool              hasDialect(Dialect d) const noexcept;

    // ── Framing ──────────────────────────────────────────────────────────────
    // Detect the dialect and split the buffer into raw records.  The records
    // view `buf`, which must outlive the result.
    // Throws DialectError for unknown version codes.
    [[nodiscard]] FrameResult frame(std::span<const uint8_t> buf) const;

    // ── Decode ───────────────────────────────────────────────────────────────
    // Detect, frame and decode every record.  Truncated or malformed data
    // never throws: decoding stops where the data ends and what was decoded
    // up to that point is returned.
    // Throws DialectError for unknown version codes, std::out_of_range when
    // the detected dialect has no registered schema.
    [[nodiscard]] ParsedDocument decode(std::span<const uint8_t> buf) const;

    // readFile() followed by decode().  Also throws FileReadError.
    [[nodiscard]] ParsedDocument decodeFile(const std::filesystem::path& path) const;

    // Decode one framed record against `def`.  Record types without a schema
    // decode to an empty field map.
    [[nodiscard]] DecodedFields decodeRecord(const RawRecord& raw, const DialectDef& def) const;

private:
    std::map<Dialect, DialectDef> dialects_;
};

} // namespace pdz
