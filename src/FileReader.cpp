// FileReader.cpp – Whole-file reads for the decoder facade.

#include "PDZReader/FileReader.hpp"
#include "PDZReader/Log.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace pdz {

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw FileReadError("PDZ file not found: " + path.string());

    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
        throw FileReadError("Cannot stat '" + path.string() + "': " + ec.message());

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw FileReadError("Cannot open '" + path.string() + "'");

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (!bytes.empty() &&
        !in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
        throw FileReadError("Short read on '" + path.string() + "'");

    PDZ_LOG_DEBUG("Read %zu bytes from %s", bytes.size(), path.string().c_str());
    return bytes;
}

} // namespace pdz
