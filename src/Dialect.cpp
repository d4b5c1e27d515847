// Dialect.cpp – Closed mapping of version codes to container dialects.

#include "PDZReader/Dialect.hpp"
#include "PDZReader/ByteStream.hpp"

#include <array>
#include <string>

namespace pdz {

namespace {

struct VersionEntry {
    uint16_t    version;
    Dialect     dialect;
    const char* id;
};

constexpr std::array<VersionEntry, 2> kVersionTable{{
    {kPdz25Version, Dialect::PDZ25, "pdz25"},
    {kPdz24Version, Dialect::PDZ24, "pdz24"},
}};

} // namespace

std::optional<Dialect> dialectFromVersion(uint16_t version) noexcept {
    for (const auto& e : kVersionTable)
        if (e.version == version) return e.dialect;
    return std::nullopt;
}

std::optional<Dialect> dialectFromId(std::string_view id) noexcept {
    for (const auto& e : kVersionTable)
        if (id == e.id) return e.dialect;
    return std::nullopt;
}

uint16_t versionOf(Dialect d) noexcept {
    for (const auto& e : kVersionTable)
        if (e.dialect == d) return e.version;
    return 0;
}

const char* toString(Dialect d) noexcept {
    for (const auto& e : kVersionTable)
        if (e.dialect == d) return e.id;
    return "?";
}

Dialect detectDialect(std::span<const uint8_t> buf) {
    ByteReader br{buf};
    if (!br.canRead(2))
        throw DialectError("Insufficient bytes for PDZ version (need 2, have " +
                           std::to_string(buf.size()) + ")");

    const uint16_t version = br.readLE<uint16_t>();
    if (auto d = dialectFromVersion(version))
        return *d;
    throw DialectError("Unknown PDZ version: " + std::to_string(version));
}

} // namespace pdz
