#pragma once
// BuiltinSchemas.hpp – Access to the schema XML embedded at build time.
// The definition is generated by CMake from src/BuiltinSchemas.cpp.in.

#include "PDZReader/Types.hpp"

#include <string_view>

namespace pdz::detail {

[[nodiscard]] std::string_view builtinSchemaXml(Dialect dialect) noexcept;

} // namespace pdz::detail
