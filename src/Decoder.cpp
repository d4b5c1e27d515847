// Decoder.cpp – PDZ decode engine for registered dialect schemas.
//
// Pipeline:
//   bytes → detectDialect → frameRecords → decodeRecord (per record) → document
//
// Every failure below the dialect check is soft: a record stops at the first
// field that cannot be decoded and keeps what it has.

#include "PDZReader/Decoder.hpp"
#include "PDZReader/Dialect.hpp"
#include "PDZReader/FieldDecoder.hpp"
#include "PDZReader/FileReader.hpp"
#include "PDZReader/Log.hpp"
#include "PDZReader/SchemaLoader.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pdz {

// ─────────────────────────────────────────────────────────────────────────────
//  Dialect registry
// ─────────────────────────────────────────────────────────────────────────────

Decoder Decoder::withBuiltinSchemas() {
    Decoder d;
    d.registerDialect(builtinSchema(Dialect::PDZ24));
    d.registerDialect(builtinSchema(Dialect::PDZ25));
    return d;
}

void Decoder::registerDialect(DialectDef def) {
    const Dialect key = def.dialect;
    dialects_[key]    = std::move(def);
}

const DialectDef& Decoder::dialect(Dialect d) const {
    auto it = dialects_.find(d);
    if (it == dialects_.end())
        throw std::out_of_range(std::string("Dialect ") + toString(d) + " not registered");
    return it->second;
}

bool Decoder::hasDialect(Dialect d) const noexcept {
    return dialects_.find(d) != dialects_.end();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record-level decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedFields Decoder::decodeRecord(const RawRecord& raw, const DialectDef& def) const {
    DecodedFields out;

    const RecordDef* rec = def.find(raw.type);
    if (!rec) {
        PDZ_LOG_DEBUG("No schema for record type %u (%zu bytes), left undecoded",
                      unsigned{raw.type}, raw.bytes.size());
        return out;
    }

    size_t offset = 0;
    for (const FieldDef& field : rec->fields) {
        if (offset >= raw.bytes.size()) {
            PDZ_LOG_DEBUG("Reached end of %s before field '%s'",
                          rec->name.c_str(), field.name.c_str());
            break;
        }

        FieldResult r = decodeField(field, raw.bytes, offset, out);

        // A truncated group still contributes its completed iterations.
        if (r.value)
            out.set(field.name, std::move(*r.value));
        offset += r.consumed;

        if (!r.ok()) {
            PDZ_LOG_DEBUG("Stopped decoding %s at field '%s' offset %zu: %s",
                          rec->name.c_str(),
                          field.name.empty() ? "<skip>" : field.name.c_str(),
                          offset, toString(r.error));
            break;
        }
    }

    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  File-level decode
// ─────────────────────────────────────────────────────────────────────────────

FrameResult Decoder::frame(std::span<const uint8_t> buf) const {
    const DialectDef& def = dialect(detectDialect(buf));
    return frameRecords(buf, def);
}

ParsedDocument Decoder::decode(std::span<const uint8_t> buf) const {
    const Dialect     d   = detectDialect(buf);
    const DialectDef& def = dialect(d);

    PDZ_LOG_INFO("Decoding %zu bytes as %s", buf.size(), toString(d));

    FrameResult framed = frameRecords(buf, def);
    if (framed.error != DecodeError::None)
        PDZ_LOG_INFO("Framing stopped after %zu of %zu bytes: %s",
                     framed.bytes_framed, buf.size(), toString(framed.error));

    ParsedDocument doc{d};
    for (const RawRecord& raw : framed.records) {
        PDZ_LOG_INFO("Parsing record type %u: %s", unsigned{raw.type}, raw.name.c_str());
        doc.add(raw.name, decodeRecord(raw, def));
    }
    return doc;
}

ParsedDocument Decoder::decodeFile(const std::filesystem::path& path) const {
    const std::vector<uint8_t> bytes = readFile(path);
    return decode(bytes);
}

} // namespace pdz
