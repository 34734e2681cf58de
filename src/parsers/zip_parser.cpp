#include "parser_registration.hpp"
#include "helpers.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ZIP family (ZIP, JAR, APK, OOXML...) recognised by its End Of Central
// Directory record, the way zip readers locate an archive.
class ZIPParser : public BaseParser {
public:
    std::string name() const override { return "ZIP"; }
    ContainerFormat format() const override { return ContainerFormat::Zip; }
    bool match(const std::vector<uint8_t>& blob) override;

private:
    static constexpr size_t EOCD_SIZE = 22;
    static constexpr size_t MAX_COMMENT = 0xFFFF;

    bool hasSignature(const std::vector<uint8_t>& blob, size_t pos,
                      uint8_t b2, uint8_t b3) const;
    bool validateEndOfCentralDirectory(const std::vector<uint8_t>& blob, size_t eocd) const;
};

bool ZIPParser::hasSignature(const std::vector<uint8_t>& blob, size_t pos,
                             uint8_t b2, uint8_t b3) const {
    return pos + 4 <= blob.size() &&
           blob[pos] == 0x50 && blob[pos + 1] == 0x4B &&
           blob[pos + 2] == b2 && blob[pos + 3] == b3;
}

bool ZIPParser::match(const std::vector<uint8_t>& blob) {
    if (blob.size() < EOCD_SIZE)
        return false;

    // Backward search: the record sits at the end, followed only by its comment.
    size_t last = blob.size() - EOCD_SIZE;
    size_t first = last > MAX_COMMENT ? last - MAX_COMMENT : 0;
    for (size_t i = last + 1; i-- > first;) {
        if (hasSignature(blob, i, 0x05, 0x06) && validateEndOfCentralDirectory(blob, i))
            return true;
    }
    return false;
}

// EOCD layout:
//  0  : signature 50 4B 05 06
//  4  : number of this disk (u16)
//  6  : disk where CD starts (u16)
//  8  : CD records on this disk (u16)
//  10 : total CD records (u16)
//  12 : CD size (u32)
//  16 : CD offset (u32)
//  20 : comment length (u16)
bool ZIPParser::validateEndOfCentralDirectory(const std::vector<uint8_t>& blob, size_t eocd) const {
    uint16_t commentLen = read_le16(blob, eocd + 20);
    if (eocd + EOCD_SIZE + commentLen > blob.size())
        return false;

    uint16_t totalEntries = read_le16(blob, eocd + 10);
    uint32_t sizeCD = read_le32(blob, eocd + 12);
    uint32_t offCD = read_le32(blob, eocd + 16);

    // Empty archive: nothing but the record itself.
    if (totalEntries == 0 && sizeCD == 0)
        return true;

    // ZIP64 keeps the real values elsewhere; trust the locator preceding the record.
    if (sizeCD == 0xFFFFFFFF || offCD == 0xFFFFFFFF || totalEntries == 0xFFFF)
        return eocd >= 20 && hasSignature(blob, eocd - 20, 0x06, 0x07);

    if (sizeCD > eocd)
        return false;

    // Central directory at its declared offset, or right before the record
    // when data has been prepended to the archive (self-extractors).
    if (static_cast<size_t>(offCD) + sizeCD <= eocd && hasSignature(blob, offCD, 0x01, 0x02))
        return true;
    return hasSignature(blob, eocd - sizeCD, 0x01, 0x02);
}

REGISTER_PARSER(ZIPParser, 10)
