#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return dir; }
    fs::path operator/(const std::string& name) const { return dir / name; }

private:
    fs::path dir;
};

void writeBytes(const fs::path& path, const std::vector<uint8_t>& data);
void writeText(const fs::path& path, const std::string& text);
std::string readText(const fs::path& path);
std::vector<std::string> listDir(const fs::path& dir);

// Uncompressed ZIP with entries in the given order and names taken verbatim.
struct ZipMember {
    std::string name;
    std::string data;
    bool badCrc = false;
};
std::vector<uint8_t> buildStoredZip(const std::vector<ZipMember>& members);

// Compound file, version 3 (512-byte sectors) unless version is set to 4
// (4096-byte sectors). Siblings are linked as a right-leaning chain in
// insertion order. Streams under 4096 bytes go to the mini stream. With
// fatInDifatSector the FAT location is only recorded in a DIFAT sector.
class OleBuilder {
public:
    static constexpr uint32_t ROOT = 0;

    uint16_t version = 3;
    bool fatInDifatSector = false;

    uint32_t addStorage(const std::string& name, uint32_t parent = ROOT);
    uint32_t addStream(const std::string& name, const std::string& data, uint32_t parent = ROOT);

    std::vector<uint8_t> build();

    // Byte offset of a directory entry in the last built file.
    size_t dirEntryOffset(uint32_t id) const;

private:
    struct Node {
        std::string name;
        bool storage;
        uint32_t parent;
        std::string data;
    };

    std::vector<Node> nodes;
    uint32_t dirStart = 0;
    uint32_t sectorSize = 512;
};

void putLe16(std::vector<uint8_t>& buf, size_t off, uint16_t v);
void putLe32(std::vector<uint8_t>& buf, size_t off, uint32_t v);
