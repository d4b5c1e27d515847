#pragma once
// FileReader.hpp – Loads a whole PDZ file into memory.

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace pdz {

// Thrown when the file is missing, not a regular file, or cannot be read.
class FileReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::vector<uint8_t> readFile(const std::filesystem::path& path);

} // namespace pdz
