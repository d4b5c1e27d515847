// SchemaLoader.cpp – Parses the PDZ record-schema XML into a DialectDef.
// Uses pugixml for robust, zero-copy XML parsing.

#include "PDZReader/SchemaLoader.hpp"
#include "PDZReader/Dialect.hpp"
#include "BuiltinSchemas.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstring>
#include <string>

namespace pdz {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static uint64_t parseU64(const char* s, const char* ctx) {
    uint64_t v = 0;
    const char* end = s + std::strlen(s);
    auto [ptr, ec] = std::from_chars(s, end, v);
    if (ec != std::errc{} || ptr != end || ptr == s)
        throw SchemaLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static uint32_t parseU32(const char* s, const char* ctx) {
    const uint64_t v = parseU64(s, ctx);
    if (v > UINT32_MAX)
        throw SchemaLoadError(std::string(ctx) + ": value '" + s + "' out of range");
    return static_cast<uint32_t>(v);
}

static bool isDecimal(const char* s) {
    if (!s || *s == '\0') return false;
    for (; *s; ++s)
        if (*s < '0' || *s > '9') return false;
    return true;
}

static ScalarType parseScalarType(const char* s, const std::string& field) {
    if (strcmp(s, "i8")  == 0) return ScalarType::Int8;
    if (strcmp(s, "u8")  == 0) return ScalarType::UInt8;
    if (strcmp(s, "i16") == 0) return ScalarType::Int16;
    if (strcmp(s, "u16") == 0) return ScalarType::UInt16;
    if (strcmp(s, "i32") == 0) return ScalarType::Int32;
    if (strcmp(s, "u32") == 0) return ScalarType::UInt32;
    if (strcmp(s, "i64") == 0) return ScalarType::Int64;
    if (strcmp(s, "u64") == 0) return ScalarType::UInt64;
    if (strcmp(s, "f32") == 0) return ScalarType::Float32;
    if (strcmp(s, "f64") == 0) return ScalarType::Float64;
    throw SchemaLoadError("Field '" + field + "': unknown scalar type '" + s + "'");
}

static SampleType parseSampleType(const char* s, const std::string& field) {
    if (strcmp(s, "u32") == 0) return SampleType::UInt32;
    if (strcmp(s, "i32") == 0) return SampleType::Int32;
    if (strcmp(s, "f32") == 0) return SampleType::Float32;
    throw SchemaLoadError("Samples '" + field + "': unknown sample type '" + s + "'");
}

static std::string requireName(pugi::xml_node node) {
    std::string name = node.attribute("name").as_string("");
    if (name.empty())
        throw SchemaLoadError(std::string("<") + node.name() + "> missing 'name' attribute");
    return name;
}

// ─── Parse one field declaration node into a FieldDef ─────────────────────────

static FieldDef parseFieldNode(pugi::xml_node node);

static void parseChildren(pugi::xml_node parent, std::vector<FieldDef>& out) {
    for (auto child : parent.children()) {
        if (child.type() != pugi::node_element) continue;
        out.push_back(parseFieldNode(child));
    }
}

static FieldDef parseFieldNode(pugi::xml_node node) {
    FieldDef f;
    const char* tag = node.name();

    // <Skip bytes="20"/>
    if (strcmp(tag, "Skip") == 0) {
        f.kind = FieldKind::Skip;
        f.size = parseU32(node.attribute("bytes").as_string(""), "Skip.bytes");
        if (f.size == 0)
            throw SchemaLoadError("<Skip> has bytes=0");
        return f;
    }

    f.name = requireName(node);

    // <Field name="raw_counts" type="u32"/>
    if (strcmp(tag, "Field") == 0) {
        f.kind   = FieldKind::Scalar;
        f.scalar = parseScalarType(node.attribute("type").as_string(""), f.name);
    }
    // <Text name="file_type_id" chars="5"/>  or  <Text name="serial_number"/>
    else if (strcmp(tag, "Text") == 0) {
        f.kind = FieldKind::Text;
        if (auto a = node.attribute("chars"); a) {
            f.size = parseU32(a.as_string(), "Text.chars");
            if (f.size == 0)
                throw SchemaLoadError("Text '" + f.name + "' has chars=0");
        } else {
            f.length_field = f.name + "_length";
        }
    }
    // <Timestamp name="acquisition_date_time"/>
    else if (strcmp(tag, "Timestamp") == 0) {
        f.kind = FieldKind::Timestamp;
    }
    // <Blob name="image"/>  or  <Blob name="xilinx_vars" bytes="58"/>
    else if (strcmp(tag, "Blob") == 0) {
        f.kind = FieldKind::Blob;
        if (auto a = node.attribute("bytes"); a) {
            f.size = parseU32(a.as_string(), "Blob.bytes");
            if (f.size == 0)
                throw SchemaLoadError("Blob '" + f.name + "' has bytes=0");
        } else {
            f.length_field = f.name + "_length";
        }
    }
    // <Samples name="spectrum_data" type="u32" count="channels"/>
    else if (strcmp(tag, "Samples") == 0) {
        f.kind         = FieldKind::Samples;
        f.sample_type  = parseSampleType(node.attribute("type").as_string(""), f.name);
        f.length_field = node.attribute("count").as_string("");
        if (f.length_field.empty())
            f.length_field = f.name + "_length";
    }
    // <Group name="filters" repeat="3"> … </Group>
    // <Group name="grade_libraries" repeat="num_grade_libs"> … </Group>
    else if (strcmp(tag, "Group") == 0) {
        f.kind = FieldKind::Group;
        const char* repeat = node.attribute("repeat").as_string("");
        if (*repeat == '\0')
            throw SchemaLoadError("Group '" + f.name + "' missing 'repeat' attribute");

        if (isDecimal(repeat)) {
            f.repeat.mode  = RepeatSpec::Mode::Fixed;
            f.repeat.count = parseU32(repeat, "Group.repeat");
        } else {
            f.repeat.mode  = RepeatSpec::Mode::FieldRef;
            f.repeat.field = repeat;
        }

        parseChildren(node, f.fields);
        if (f.fields.empty())
            throw SchemaLoadError("Group '" + f.name + "' has no sub-fields");
    }
    else {
        throw SchemaLoadError(std::string("Unknown field element <") + tag + ">");
    }

    return f;
}

// ─── Parse one <Record> node ──────────────────────────────────────────────────

static RecordDef parseRecord(pugi::xml_node node) {
    RecordDef rec;

    const char* type = node.attribute("type").as_string("");
    if (*type == '\0')
        throw SchemaLoadError("<Record> missing 'type' attribute");
    const uint64_t t = parseU64(type, "Record.type");
    if (t > UINT16_MAX)
        throw SchemaLoadError(std::string("Record type '") + type + "' exceeds 16 bits");
    rec.type = static_cast<uint16_t>(t);

    rec.name = node.attribute("name").as_string("");
    if (rec.name.empty())
        throw SchemaLoadError("Record " + std::to_string(rec.type) + " missing 'name'");

    parseChildren(node, rec.fields);
    return rec;
}

// ─── Parse the <Schema> root ──────────────────────────────────────────────────

static DialectDef parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("Schema");
    if (!root)
        throw SchemaLoadError("XML root element must be <Schema>");

    DialectDef def;
    def.id   = root.attribute("dialect").as_string("");
    def.name = root.attribute("name").as_string("");

    auto dialect = dialectFromId(def.id);
    if (!dialect)
        throw SchemaLoadError("<Schema dialect=\"" + def.id + "\"> is not a known dialect");
    def.dialect = *dialect;

    const uint64_t version = parseU64(root.attribute("version").as_string(""), "Schema.version");
    if (version != versionOf(def.dialect))
        throw SchemaLoadError("Schema '" + def.id + "' declares version " + std::to_string(version) +
                              ", expected " + std::to_string(versionOf(def.dialect)));
    def.version = static_cast<uint16_t>(version);

    for (auto rec_node : root.children("Record")) {
        RecordDef rec = parseRecord(rec_node);
        const uint16_t type = rec.type;
        if (!def.records.emplace(type, std::move(rec)).second)
            throw SchemaLoadError("Duplicate record type " + std::to_string(type) +
                                  " in schema '" + def.id + "'");
    }

    if (def.records.empty())
        throw SchemaLoadError("Schema '" + def.id + "' has no <Record> elements");

    return def;
}

// ─── Public entry points ──────────────────────────────────────────────────────

DialectDef loadSchema(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw SchemaLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return parseDocument(doc);
}

DialectDef loadSchemaFromString(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw SchemaLoadError(std::string("Failed to parse schema XML: ") + result.description());
    return parseDocument(doc);
}

const DialectDef& builtinSchema(Dialect dialect) {
    switch (dialect) {
    case Dialect::PDZ24: {
        static const DialectDef def = loadSchemaFromString(detail::builtinSchemaXml(Dialect::PDZ24));
        return def;
    }
    case Dialect::PDZ25: {
        static const DialectDef def = loadSchemaFromString(detail::builtinSchemaXml(Dialect::PDZ25));
        return def;
    }
    }
    throw std::invalid_argument("builtinSchema: unknown dialect");
}

} // namespace pdz
