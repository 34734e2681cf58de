#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Compound File Binary Format (OLE2 structured storage), read-only.

constexpr uint8_t CFB_MAGIC[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
constexpr size_t CFB_MIN_FILE_SIZE = 1536;

constexpr uint32_t CFB_DIFSECT    = 0xFFFFFFFC;
constexpr uint32_t CFB_FATSECT    = 0xFFFFFFFD;
constexpr uint32_t CFB_ENDOFCHAIN = 0xFFFFFFFE;
constexpr uint32_t CFB_FREESECT   = 0xFFFFFFFF;
constexpr uint32_t CFB_NOSTREAM   = 0xFFFFFFFF;

enum class CfbObjectType : uint8_t {
    Empty   = 0,
    Storage = 1,
    Stream  = 2,
    Root    = 5
};

struct CfbDirEntry {
    std::string name;           // UTF-8
    CfbObjectType type;
    uint32_t left;
    uint32_t right;
    uint32_t child;
    uint32_t startSector;
    uint64_t size;
};

struct CfbStream {
    uint32_t id;                        // directory entry id
    std::vector<std::string> path;      // storage names then stream name, root excluded
    uint64_t size;
};

// Parses header, FAT and directory up front; throws std::runtime_error when
// they are malformed. The mini stream is loaded on the first small stream read.
class CompoundFile {
public:
    explicit CompoundFile(std::vector<uint8_t> data);

    // Streams depth first, the children of each storage sorted by name.
    // Streams with an empty name component are left out. Throws on a broken directory tree.
    std::vector<CfbStream> listStreams() const;

    // Throws std::runtime_error on a broken sector chain or truncated stream.
    std::vector<uint8_t> readStream(uint32_t id);

    const CfbDirEntry& entry(uint32_t id) const;
    uint16_t majorVersion() const { return major; }
    uint32_t sectorSize() const { return sectorSz; }

private:
    void parseHeader();
    void loadFat();
    void loadDirectory();
    void loadMiniStream();

    std::vector<uint8_t> readSector(uint32_t sid) const;
    std::vector<uint32_t> chain(uint32_t start, const std::vector<uint32_t>& table) const;
    std::vector<uint8_t> readChain(uint32_t start) const;
    void collectStreams(uint32_t storage, std::vector<std::string>& prefix,
                        std::vector<bool>& visited, std::vector<CfbStream>& out) const;

    std::vector<uint8_t> blob;
    uint16_t major = 0;
    uint32_t sectorSz = 512;
    uint32_t miniSectorSz = 64;
    uint32_t miniStreamCutoff = 4096;
    uint32_t numFatSectors = 0;
    uint32_t firstDirSector = CFB_ENDOFCHAIN;
    uint32_t firstMiniFatSector = CFB_ENDOFCHAIN;
    uint32_t numMiniFatSectors = 0;
    uint32_t firstDifatSector = CFB_ENDOFCHAIN;
    uint32_t numDifatSectors = 0;

    std::vector<uint32_t> fat;
    std::vector<CfbDirEntry> entries;
    std::optional<std::vector<uint32_t>> miniFat;
    std::vector<uint8_t> miniStream;
};
