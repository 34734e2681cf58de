#include "parser_registration.hpp"
#include "cfb.hpp"

#include <cstdint>
#include <string>
#include <vector>

class OLEParser : public BaseParser {
public:
    std::string name() const override { return "OLE"; }
    ContainerFormat format() const override { return ContainerFormat::Ole; }

    bool match(const std::vector<uint8_t>& blob) override {
        // Header sector plus at least a FAT and a directory sector.
        if (blob.size() < CFB_MIN_FILE_SIZE)
            return false;
        for (size_t i = 0; i < sizeof(CFB_MAGIC); ++i) {
            if (blob[i] != CFB_MAGIC[i])
                return false;
        }
        return true;
    }
};

REGISTER_PARSER(OLEParser, 20)
