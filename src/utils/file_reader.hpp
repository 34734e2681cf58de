#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

// Reads the whole file. Throws std::runtime_error if it cannot be opened or read.
std::vector<uint8_t> readFile(const std::filesystem::path& path);

// Writes data to path, truncating an existing file. Throws std::runtime_error on failure.
void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data);
