#pragma once
// Types.hpp – Schema metadata and decoded-value types for the PDZ reader.
// All PDZ data flows through these structures.

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pdz {

// ─── Container dialects (selected by the leading version code) ────────────────
enum class Dialect {
    PDZ24, // version 257: fixed two-record framing
    PDZ25, // version 25:  self-describing block stream
};

// ─── Recoverable decode failure kinds ─────────────────────────────────────────
enum class DecodeError {
    None,
    InsufficientBytes,   // a field or header needs more bytes than remain
    MalformedLength,     // a block declares a zero or oversized data length
    UnrecognizedDialect, // version code not in the version table
};

[[nodiscard]] const char* toString(DecodeError e) noexcept;

// ─── Field kinds describe how raw bytes are interpreted ───────────────────────
enum class FieldKind {
    Scalar,    // fixed-width little-endian integer or IEEE float
    Skip,      // reserved bytes; consumed, no decoded output
    Text,      // UTF-16LE text, fixed length or from a {name}_length sibling
    Timestamp, // 16-byte SYSTEMTIME rendered as "YYYY-MM-DD HH:MM:SS"
    Blob,      // raw bytes, fixed length or from a {name}_length sibling
    Samples,   // array of 32-bit samples, count taken from a sibling
    Group,     // repeatable sub-schema
};

enum class ScalarType { Int8, UInt8, Int16, UInt16, Int32, UInt32, Int64, UInt64, Float32, Float64 };

enum class SampleType { UInt32, Int32, Float32 };

// ─── Repeat count of a Group: literal or a previously decoded sibling ─────────
struct RepeatSpec {
    enum class Mode { Fixed, FieldRef };

    Mode        mode{Mode::Fixed};
    uint32_t    count{0}; // Fixed
    std::string field;    // FieldRef
};

// ─── A single field declaration inside a record or group ──────────────────────
struct FieldDef {
    std::string name;  // Empty for Skip.
    FieldKind   kind{FieldKind::Scalar};

    ScalarType  scalar{ScalarType::UInt32};

    // Skip and fixed Blob: byte count.  Fixed Text: UTF-16 code units.
    // Zero on Text / Blob means the length comes from length_field.
    uint32_t    size{0};

    // Sibling holding the length (Text, Blob) or sample count (Samples).
    std::string length_field;
    SampleType  sample_type{SampleType::UInt32};

    // Group only
    RepeatSpec            repeat;
    std::vector<FieldDef> fields;
};

// ─── One record type of a dialect ─────────────────────────────────────────────
struct RecordDef {
    uint16_t              type{0};
    std::string           name;
    std::vector<FieldDef> fields;
};

// ─── Full schema table of one dialect (built from one XML schema file) ────────
struct DialectDef {
    Dialect     dialect{Dialect::PDZ25};
    uint16_t    version{0};
    std::string id;   // "pdz25"
    std::string name; // Human-readable title

    std::map<uint16_t, RecordDef> records;

    [[nodiscard]] const RecordDef* find(uint16_t type) const noexcept;

    // Schema name, or "Unknown Record Type N" for types absent from the table.
    [[nodiscard]] std::string recordName(uint16_t type) const;
};

// ─── Decoded values ───────────────────────────────────────────────────────────

// Acquisition time, already rendered as text.
struct Timestamp {
    std::string text;

    bool operator==(const Timestamp&) const = default;
};

using Bytes = std::vector<uint8_t>;

class DecodedFields;

using Value = std::variant<int64_t,                     // signed integers
                           uint64_t,                    // unsigned integers
                           float,
                           double,
                           std::string,                 // UTF-8 text
                           Timestamp,
                           Bytes,                       // raw blob
                           std::vector<uint32_t>,       // pdz25 channel counts
                           std::vector<int32_t>,        // pdz24 channel counts
                           std::vector<float>,          // LIBS x/y samples (flat)
                           std::vector<DecodedFields>>; // repeatable group

// Non-negative integer view of a value, used for sibling lengths and repeat
// counts.  Negative, non-finite and non-numeric values count as 0.
[[nodiscard]] uint64_t toCount(const Value& v);

// ─── Insertion-ordered field name → value map of one record or group entry ────
class DecodedFields {
public:
    using Entry = std::pair<std::string, Value>;

    // Insert or replace (replacement keeps the original position).
    void set(std::string name, Value value);

    [[nodiscard]] bool         contains(std::string_view name) const noexcept;
    [[nodiscard]] const Value* find(std::string_view name) const noexcept;
    [[nodiscard]] const Value& at(std::string_view name) const; // throws std::out_of_range

    template <typename T>
    [[nodiscard]] const T* getIf(std::string_view name) const noexcept {
        const Value* v = find(name);
        return v ? std::get_if<T>(v) : nullptr;
    }

    template <typename T>
    [[nodiscard]] const T& get(std::string_view name) const {
        return std::get<T>(at(name));
    }

    // Sibling lookup: the named value as a count, 0 when absent.
    [[nodiscard]] uint64_t countOf(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size()  const noexcept { return entries_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

// ─── One framed record before decoding ────────────────────────────────────────
// The byte view points into the caller's file buffer.
struct RawRecord {
    uint16_t                 type{0};
    std::string              name;
    std::span<const uint8_t> bytes;
};

// ─── A decoded file ───────────────────────────────────────────────────────────
// One occurrence of a record name is stored as a bare DecodedFields; a name
// framed N > 1 times (multi-phase data) holds the N decodes in framing order.
using RecordValue = std::variant<DecodedFields, std::vector<DecodedFields>>;

class ParsedDocument {
public:
    explicit ParsedDocument(Dialect dialect = Dialect::PDZ25) noexcept : dialect_(dialect) {}

    [[nodiscard]] Dialect dialect() const noexcept { return dialect_; }

    // Append one decoded occurrence of `name`, promoting to a sequence on the
    // second occurrence.
    void add(const std::string& name, DecodedFields fields);

    [[nodiscard]] bool               contains(std::string_view name) const noexcept;
    [[nodiscard]] const RecordValue& at(std::string_view name) const; // throws std::out_of_range
    [[nodiscard]] bool               isMultiPhase(std::string_view name) const;

    // The single occurrence of `name`; throws std::logic_error for multi-phase
    // records.
    [[nodiscard]] const DecodedFields& fields(std::string_view name) const;

    // Every occurrence of `name` in framing order (size 1 for single records).
    [[nodiscard]] std::span<const DecodedFields> occurrences(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size()  const noexcept { return records_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return records_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return records_.end(); }

private:
    Dialect dialect_;
    std::vector<std::pair<std::string, RecordValue>> records_;
};

} // namespace pdz
