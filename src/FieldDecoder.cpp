// FieldDecoder.cpp – Schema-driven field and repeatable-group decoding.
//
// Dynamic lengths are looked up by name among the siblings decoded so far:
//   Text / Blob without a fixed size  → sibling "{name}_length"
//   Samples                           → sibling named by the schema
//                                       ("channels", "num_channels", …)
//   Group with a field-ref repeat     → sibling named by the schema
// Missing siblings resolve to 0, which yields an empty value rather than an
// error.

#include "PDZReader/FieldDecoder.hpp"
#include "PDZReader/ByteStream.hpp"
#include "PDZReader/Log.hpp"

#include <cstdio>
#include <utility>

namespace pdz {

// ─────────────────────────────────────────────────────────────────────────────
//  Small helpers
// ─────────────────────────────────────────────────────────────────────────────

static FieldResult insufficient(const FieldDef& def, uint64_t required, const ByteReader& br) {
    PDZ_LOG_DEBUG("Insufficient bytes for field '%s': required %llu, available %zu",
                  def.name.empty() ? "<skip>" : def.name.c_str(),
                  static_cast<unsigned long long>(required), br.remaining());
    FieldResult r;
    r.error = DecodeError::InsufficientBytes;
    return r;
}

static FieldResult decoded(Value v, size_t n) {
    FieldResult r;
    r.value    = std::move(v);
    r.consumed = n;
    return r;
}

static size_t scalarWidth(ScalarType t) noexcept {
    switch (t) {
    case ScalarType::Int8:
    case ScalarType::UInt8:   return 1;
    case ScalarType::Int16:
    case ScalarType::UInt16:  return 2;
    case ScalarType::Int32:
    case ScalarType::UInt32:
    case ScalarType::Float32: return 4;
    case ScalarType::Int64:
    case ScalarType::UInt64:
    case ScalarType::Float64: return 8;
    }
    return 0;
}

// Precondition: br.canRead(scalarWidth(t)).
static Value readScalar(ScalarType t, ByteReader& br) {
    switch (t) {
    case ScalarType::Int8:    return int64_t{br.readLE<int8_t>()};
    case ScalarType::UInt8:   return uint64_t{br.readLE<uint8_t>()};
    case ScalarType::Int16:   return int64_t{br.readLE<int16_t>()};
    case ScalarType::UInt16:  return uint64_t{br.readLE<uint16_t>()};
    case ScalarType::Int32:   return int64_t{br.readLE<int32_t>()};
    case ScalarType::UInt32:  return uint64_t{br.readLE<uint32_t>()};
    case ScalarType::Int64:   return br.readLE<int64_t>();
    case ScalarType::UInt64:  return br.readLE<uint64_t>();
    case ScalarType::Float32: return br.readLE<float>();
    case ScalarType::Float64: return br.readLE<double>();
    }
    return uint64_t{0};
}

static void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string decodeWideText(std::span<const uint8_t> raw) {
    auto unitAt = [&](size_t i) -> uint16_t {
        return static_cast<uint16_t>(raw[2 * i] | (raw[2 * i + 1] << 8));
    };

    size_t units = raw.size() / kWideCharSize;
    while (units > 0 && unitAt(units - 1) == 0)
        --units;

    std::string out;
    out.reserve(units);
    for (size_t i = 0; i < units; ++i) {
        uint32_t cp = unitAt(i);
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            const uint16_t lo = (i + 1 < units) ? unitAt(i + 1) : 0;
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00u);
                ++i;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }
        appendUtf8(out, cp);
    }
    return out;
}

std::string formatSystemTime(uint16_t year, uint16_t month, uint16_t day,
                             uint16_t hour, uint16_t minute, uint16_t second) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u",
                  unsigned{year}, unsigned{month}, unsigned{day},
                  unsigned{hour}, unsigned{minute}, unsigned{second});
    return buf;
}

uint64_t resolveRepeat(const RepeatSpec& spec, const DecodedFields& siblings) {
    if (spec.mode == RepeatSpec::Mode::Fixed)
        return spec.count;
    return siblings.countOf(spec.field);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Per-kind decoders
// ─────────────────────────────────────────────────────────────────────────────

static FieldResult decodeSamples(const FieldDef& def, ByteReader& br, uint64_t count) {
    if (!br.canReadArray(count, kSampleSize))
        return insufficient(def, count * kSampleSize, br);

    const auto n = static_cast<size_t>(count);
    switch (def.sample_type) {
    case SampleType::UInt32: {
        std::vector<uint32_t> v;
        v.reserve(n);
        for (size_t i = 0; i < n; ++i) v.push_back(br.readLE<uint32_t>());
        return decoded(std::move(v), n * kSampleSize);
    }
    case SampleType::Int32: {
        std::vector<int32_t> v;
        v.reserve(n);
        for (size_t i = 0; i < n; ++i) v.push_back(br.readLE<int32_t>());
        return decoded(std::move(v), n * kSampleSize);
    }
    case SampleType::Float32: {
        // Declared as interleaved x/y pairs; kept as the flat sequence of n floats.
        std::vector<float> v;
        v.reserve(n);
        for (size_t i = 0; i < n; ++i) v.push_back(br.readLE<float>());
        return decoded(std::move(v), n * kSampleSize);
    }
    }
    return insufficient(def, count * kSampleSize, br);
}

FieldResult decodeField(const FieldDef& def,
                        std::span<const uint8_t> buf,
                        size_t offset,
                        const DecodedFields& siblings) {
    // An offset past the end clamps to it: only zero-length fields succeed.
    ByteReader br{buf, offset};

    switch (def.kind) {

    // ── Fixed-width scalar ────────────────────────────────────────────────
    case FieldKind::Scalar: {
        const size_t width = scalarWidth(def.scalar);
        if (!br.canRead(width))
            return insufficient(def, width, br);
        return decoded(readScalar(def.scalar, br), width);
    }

    // ── Reserved region ───────────────────────────────────────────────────
    case FieldKind::Skip: {
        if (!br.canRead(def.size))
            return insufficient(def, def.size, br);
        FieldResult r;
        r.consumed = def.size;
        return r;
    }

    // ── UTF-16LE text, fixed or {name}_length code units ─────────────────
    case FieldKind::Text: {
        const uint64_t chars = def.size != 0 ? def.size : siblings.countOf(def.length_field);
        if (!br.canReadArray(chars, kWideCharSize))
            return insufficient(def, chars * kWideCharSize, br);
        const auto n = static_cast<size_t>(chars) * kWideCharSize;
        return decoded(decodeWideText(br.readBytes(n)), n);
    }

    // ── SYSTEMTIME ────────────────────────────────────────────────────────
    case FieldKind::Timestamp: {
        if (!br.canRead(kSystemTimeSize))
            return insufficient(def, kSystemTimeSize, br);
        const uint16_t year   = br.readLE<uint16_t>();
        const uint16_t month  = br.readLE<uint16_t>();
        br.skip(2); // day of week
        const uint16_t day    = br.readLE<uint16_t>();
        const uint16_t hour   = br.readLE<uint16_t>();
        const uint16_t minute = br.readLE<uint16_t>();
        const uint16_t second = br.readLE<uint16_t>();
        br.skip(2); // milliseconds
        return decoded(Timestamp{formatSystemTime(year, month, day, hour, minute, second)},
                        kSystemTimeSize);
    }

    // ── Raw bytes, fixed or {name}_length ─────────────────────────────────
    case FieldKind::Blob: {
        const uint64_t n = def.size != 0 ? def.size : siblings.countOf(def.length_field);
        if (!br.canRead(n))
            return insufficient(def, n, br);
        auto raw = br.readBytes(n);
        return decoded(Bytes(raw.begin(), raw.end()), raw.size());
    }

    // ── 32-bit sample array ───────────────────────────────────────────────
    case FieldKind::Samples:
        return decodeSamples(def, br, siblings.countOf(def.length_field));

    // ── Repeatable group ──────────────────────────────────────────────────
    case FieldKind::Group: {
        GroupResult g = decodeGroup(def, buf, offset, siblings);
        FieldResult r;
        r.consumed = g.consumed;
        r.error    = g.error;
        if (!g.items.empty())
            r.value = std::move(g.items);
        return r;
    }
    }

    return insufficient(def, 0, br);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Repeatable groups
// ─────────────────────────────────────────────────────────────────────────────

GroupResult decodeGroup(const FieldDef& def,
                        std::span<const uint8_t> buf,
                        size_t offset,
                        const DecodedFields& siblings) {
    GroupResult out;

    const uint64_t count = resolveRepeat(def.repeat, siblings);
    if (count == 0) {
        PDZ_LOG_DEBUG("Skipping repeatable block %s with 0 repeats", def.name.c_str());
        return out;
    }

    size_t pos = offset;
    for (uint64_t i = 0; i < count; ++i) {
        const size_t iter_start = pos;
        DecodedFields item;

        for (const FieldDef& sub : def.fields) {
            FieldResult r = decodeField(sub, buf, pos, item);
            pos += r.consumed;
            if (!r.ok()) {
                PDZ_LOG_DEBUG("Group %s stopped in iteration %llu of %llu at field '%s' (%s)",
                              def.name.c_str(),
                              static_cast<unsigned long long>(i + 1),
                              static_cast<unsigned long long>(count),
                              sub.name.c_str(), toString(r.error));
                out.consumed = pos - offset;
                out.error    = r.error;
                return out;
            }
            if (r.value)
                item.set(sub.name, std::move(*r.value));
        }
        out.items.push_back(std::move(item));

        // Iterations that read nothing cannot exhaust the slice, so a count
        // larger than the slice itself is treated as corrupt.  The iteration
        // just completed is kept like any other.
        if (pos == iter_start && count > buf.size()) {
            PDZ_LOG_DEBUG("Group %s: %llu empty iterations exceed slice size %zu",
                          def.name.c_str(), static_cast<unsigned long long>(count), buf.size());
            out.consumed = pos - offset;
            out.error    = DecodeError::InsufficientBytes;
            return out;
        }
    }

    out.consumed = pos - offset;
    return out;
}

} // namespace pdz
