#pragma once
// SchemaLoader.hpp – Parses a PDZ record-schema XML file into a DialectDef.

#include "Types.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pdz {

// Thrown when the XML is structurally invalid or violates the schema rules.
class SchemaLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads a dialect schema from the given XML file path.
// Throws SchemaLoadError on any parse or validation failure.
DialectDef loadSchema(const std::filesystem::path& xml_path);

// Same, from an in-memory XML document.
DialectDef loadSchemaFromString(std::string_view xml);

// The schema tables shipped with the library (specs/PDZ24.xml and
// specs/PDZ25.xml, embedded at build time).  Parsed once on first use and
// shared read-only afterwards.
const DialectDef& builtinSchema(Dialect dialect);

} // namespace pdz
