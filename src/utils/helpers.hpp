#pragma once
#include <cstdint>
#include <vector>
#include <string>

//
// Little-endian readers
//
 uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset);
 uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);
 uint64_t read_le64(const std::vector<uint8_t>& blob, size_t offset);

//
// UTF-16LE string reader, stops at the first NUL code unit
//
 std::string read_utf16le(const std::vector<uint8_t>& blob, size_t offset, size_t maxBytes);

std::string to_hex(uint64_t value);

// Last component of a "/" or "\" separated path, "" when the path ends in a separator.
std::string finalSegment(const std::string& path);

// Final segment with control and reserved characters replaced by '_'.
// Returns "" when nothing usable is left (empty, "." or "..").
std::string sanitizeFileName(const std::string& path);
