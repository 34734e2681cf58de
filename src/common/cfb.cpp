#include "cfb.hpp"
#include "helpers.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

// Header layout (all little-endian):
//  0x00 : magic D0 CF 11 E0 A1 B1 1A E1
//  0x18 : minor version (u16)
//  0x1A : major version (u16), 3 or 4
//  0x1C : byte order mark (u16), FFFE
//  0x1E : sector shift (u16), 9 for v3 and 12 for v4
//  0x20 : mini sector shift (u16), 6
//  0x2C : number of FAT sectors (u32)
//  0x30 : first directory sector (u32)
//  0x38 : mini stream cutoff (u32)
//  0x3C : first mini FAT sector (u32)
//  0x40 : number of mini FAT sectors (u32)
//  0x44 : first DIFAT sector (u32)
//  0x48 : number of DIFAT sectors (u32)
//  0x4C : first 109 DIFAT entries
static constexpr size_t HEADER_SIZE = 512;
static constexpr size_t HEADER_DIFAT_OFFSET = 0x4C;
static constexpr size_t HEADER_DIFAT_ENTRIES = 109;
static constexpr size_t DIR_ENTRY_SIZE = 128;
static constexpr size_t MAX_STORAGE_DEPTH = 256;

CompoundFile::CompoundFile(std::vector<uint8_t> data) : blob(std::move(data)) {
    parseHeader();
    loadFat();
    loadDirectory();
}

void CompoundFile::parseHeader() {
    if (blob.size() < HEADER_SIZE)
        throw std::runtime_error("Truncated compound file header");
    if (!std::equal(std::begin(CFB_MAGIC), std::end(CFB_MAGIC), blob.begin()))
        throw std::runtime_error("Missing compound file signature");
    if (read_le16(blob, 0x1C) != 0xFFFE)
        throw std::runtime_error("Invalid byte order mark");

    major = read_le16(blob, 0x1A);
    uint16_t sectorShift = read_le16(blob, 0x1E);
    uint16_t miniSectorShift = read_le16(blob, 0x20);
    if (major != 3 && major != 4)
        throw std::runtime_error("Unsupported compound file version " + std::to_string(major));
    if (sectorShift != 9 && sectorShift != 12)
        throw std::runtime_error("Unsupported sector shift " + std::to_string(sectorShift));
    if (miniSectorShift != 6)
        throw std::runtime_error("Unsupported mini sector shift " + std::to_string(miniSectorShift));

    sectorSz = 1u << sectorShift;
    miniSectorSz = 1u << miniSectorShift;
    numFatSectors = read_le32(blob, 0x2C);
    firstDirSector = read_le32(blob, 0x30);
    miniStreamCutoff = read_le32(blob, 0x38);
    firstMiniFatSector = read_le32(blob, 0x3C);
    numMiniFatSectors = read_le32(blob, 0x40);
    firstDifatSector = read_le32(blob, 0x44);
    numDifatSectors = read_le32(blob, 0x48);

    if (blob.size() < sectorSz)
        throw std::runtime_error("Truncated compound file header");
}

std::vector<uint8_t> CompoundFile::readSector(uint32_t sid) const {
    uint64_t offset = (static_cast<uint64_t>(sid) + 1) * sectorSz;
    if (offset >= blob.size())
        throw std::runtime_error("Sector 0x" + to_hex(sid) + " beyond end of file");

    // A short last sector is zero padded.
    std::vector<uint8_t> sector(sectorSz, 0);
    size_t available = std::min<uint64_t>(sectorSz, blob.size() - offset);
    std::copy_n(blob.begin() + offset, available, sector.begin());
    return sector;
}

void CompoundFile::loadFat() {
    uint64_t numSectors = (blob.size() - sectorSz + sectorSz - 1) / sectorSz;
    if (numFatSectors == 0 || numFatSectors > numSectors)
        throw std::runtime_error("Invalid FAT sector count " + std::to_string(numFatSectors));

    std::vector<uint32_t> fatSectors;
    for (size_t i = 0; i < HEADER_DIFAT_ENTRIES && fatSectors.size() < numFatSectors; ++i) {
        uint32_t sid = read_le32(blob, HEADER_DIFAT_OFFSET + i * 4);
        if (sid == CFB_FREESECT || sid == CFB_ENDOFCHAIN)
            break;
        if (sid == CFB_FATSECT || sid == CFB_DIFSECT)
            throw std::runtime_error("Invalid FAT sector location 0x" + to_hex(sid));
        fatSectors.push_back(sid);
    }

    uint32_t difat = firstDifatSector;
    uint32_t perSector = sectorSz / 4 - 1;
    uint64_t hops = 0;
    while (fatSectors.size() < numFatSectors && difat != CFB_ENDOFCHAIN && difat != CFB_FREESECT) {
        if (++hops > numSectors)
            throw std::runtime_error("DIFAT chain loop");
        std::vector<uint8_t> sector = readSector(difat);
        for (uint32_t j = 0; j < perSector && fatSectors.size() < numFatSectors; ++j) {
            uint32_t sid = read_le32(sector, j * 4);
            if (sid == CFB_FREESECT)
                continue;
            if (sid == CFB_FATSECT || sid == CFB_DIFSECT)
                throw std::runtime_error("Invalid FAT sector location 0x" + to_hex(sid));
            fatSectors.push_back(sid);
        }
        difat = read_le32(sector, perSector * 4);
    }

    if (fatSectors.size() < numFatSectors)
        throw std::runtime_error("FAT sector list is truncated");

    fat.clear();
    fat.reserve(fatSectors.size() * (sectorSz / 4));
    for (uint32_t sid : fatSectors) {
        std::vector<uint8_t> sector = readSector(sid);
        for (size_t off = 0; off < sector.size(); off += 4)
            fat.push_back(read_le32(sector, off));
    }
}

std::vector<uint32_t> CompoundFile::chain(uint32_t start, const std::vector<uint32_t>& table) const {
    std::vector<uint32_t> sids;
    uint32_t sid = start;
    while (sid != CFB_ENDOFCHAIN) {
        if (sid >= table.size())
            throw std::runtime_error("Sector 0x" + to_hex(sid) + " outside allocation table");
        if (sids.size() >= table.size())
            throw std::runtime_error("Sector chain loop at 0x" + to_hex(sid));
        sids.push_back(sid);
        sid = table[sid];
    }
    return sids;
}

std::vector<uint8_t> CompoundFile::readChain(uint32_t start) const {
    std::vector<uint8_t> data;
    for (uint32_t sid : chain(start, fat)) {
        std::vector<uint8_t> sector = readSector(sid);
        data.insert(data.end(), sector.begin(), sector.end());
    }
    return data;
}

void CompoundFile::loadDirectory() {
    std::vector<uint8_t> dir = readChain(firstDirSector);
    size_t count = dir.size() / DIR_ENTRY_SIZE;
    if (count == 0)
        throw std::runtime_error("Empty directory stream");

    entries.clear();
    entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        size_t off = i * DIR_ENTRY_SIZE;
        CfbDirEntry e;
        uint16_t nameLen = read_le16(dir, off + 64);
        e.name = read_utf16le(dir, off, std::min<uint16_t>(nameLen, 64));
        e.type = static_cast<CfbObjectType>(dir[off + 66]);
        e.left = read_le32(dir, off + 68);
        e.right = read_le32(dir, off + 72);
        e.child = read_le32(dir, off + 76);
        e.startSector = read_le32(dir, off + 116);
        e.size = read_le64(dir, off + 120);
        // v3 writers may leave garbage in the high dword
        if (major == 3)
            e.size &= 0xFFFFFFFF;
        entries.push_back(std::move(e));
    }

    if (entries[0].type != CfbObjectType::Root)
        throw std::runtime_error("First directory entry is not the root storage");
}

void CompoundFile::loadMiniStream() {
    const CfbDirEntry& root = entries[0];
    miniStream.clear();
    if (root.size > 0) {
        miniStream = readChain(root.startSector);
        if (miniStream.size() > root.size)
            miniStream.resize(root.size);
    }

    std::vector<uint32_t> table;
    if (firstMiniFatSector != CFB_ENDOFCHAIN && numMiniFatSectors > 0) {
        std::vector<uint8_t> data = readChain(firstMiniFatSector);
        for (size_t off = 0; off + 4 <= data.size(); off += 4)
            table.push_back(read_le32(data, off));
    }
    miniFat = std::move(table);
}

const CfbDirEntry& CompoundFile::entry(uint32_t id) const {
    if (id >= entries.size())
        throw std::runtime_error("Directory entry " + std::to_string(id) + " out of range");
    return entries[id];
}

std::vector<uint8_t> CompoundFile::readStream(uint32_t id) {
    const CfbDirEntry& e = entry(id);
    if (e.type != CfbObjectType::Stream)
        throw std::runtime_error("Directory entry " + std::to_string(id) + " is not a stream");
    if (e.size == 0)
        return {};

    std::vector<uint8_t> data;
    if (e.size < miniStreamCutoff) {
        if (!miniFat)
            loadMiniStream();
        for (uint32_t sid : chain(e.startSector, *miniFat)) {
            uint64_t off = static_cast<uint64_t>(sid) * miniSectorSz;
            if (off >= miniStream.size())
                throw std::runtime_error("Mini sector 0x" + to_hex(sid) + " beyond mini stream");
            size_t len = std::min<uint64_t>(miniSectorSz, miniStream.size() - off);
            data.insert(data.end(), miniStream.begin() + off, miniStream.begin() + off + len);
        }
    } else {
        data = readChain(e.startSector);
    }

    if (data.size() < e.size)
        throw std::runtime_error("Stream '" + e.name + "' is truncated (" + std::to_string(data.size()) +
                                 " of " + std::to_string(e.size) + " bytes)");
    data.resize(e.size);
    return data;
}

void CompoundFile::collectStreams(uint32_t storage, std::vector<std::string>& prefix,
                                  std::vector<bool>& visited, std::vector<CfbStream>& out) const {
    if (prefix.size() > MAX_STORAGE_DEPTH)
        throw std::runtime_error("Storage nesting too deep");

    // Walk the sibling tree to gather the children of this storage.
    std::vector<uint32_t> children;
    std::vector<uint32_t> pending;
    if (entries[storage].child != CFB_NOSTREAM)
        pending.push_back(entries[storage].child);
    while (!pending.empty()) {
        uint32_t node = pending.back();
        pending.pop_back();
        if (node >= entries.size())
            throw std::runtime_error("Directory entry " + std::to_string(node) + " out of range");
        if (visited[node])
            throw std::runtime_error("Directory tree loop at entry " + std::to_string(node));
        visited[node] = true;
        children.push_back(node);
        if (entries[node].left != CFB_NOSTREAM)
            pending.push_back(entries[node].left);
        if (entries[node].right != CFB_NOSTREAM)
            pending.push_back(entries[node].right);
    }

    // Children are listed by name, byte-wise (code point order for UTF-8).
    std::stable_sort(children.begin(), children.end(), [this](uint32_t a, uint32_t b) {
        return entries[a].name < entries[b].name;
    });

    for (uint32_t node : children) {
        const CfbDirEntry& e = entries[node];
        if (e.type == CfbObjectType::Stream) {
            bool named = !e.name.empty() &&
                         std::none_of(prefix.begin(), prefix.end(),
                                      [](const std::string& s) { return s.empty(); });
            if (named) {
                CfbStream s;
                s.id = node;
                s.path = prefix;
                s.path.push_back(e.name);
                s.size = e.size;
                out.push_back(std::move(s));
            }
        } else if (e.type == CfbObjectType::Storage) {
            prefix.push_back(e.name);
            collectStreams(node, prefix, visited, out);
            prefix.pop_back();
        }
    }
}

std::vector<CfbStream> CompoundFile::listStreams() const {
    std::vector<CfbStream> out;
    std::vector<bool> visited(entries.size(), false);
    std::vector<std::string> prefix;
    visited[0] = true;
    collectStreams(0, prefix, visited, out);
    return out;
}
