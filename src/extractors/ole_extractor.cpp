#include "base_extractor.hpp"
#include "extractor_registration.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "cfb.hpp"
#include "file_reader.hpp"
#include "media_type.hpp"

namespace fs = std::filesystem;

class OLEExtractor : public BaseExtractor {
public:
    std::string name() const override { return "OLE"; }

    void open(const fs::path& path) override {
        file.reset();
        try {
            file = std::make_unique<CompoundFile>(readFile(path));
        } catch (const std::runtime_error& e) {
            throw ContainerError(ErrorKind::CorruptContainer,
                                 path.string() + " is not a valid OLE file: " + e.what());
        }
    }

    std::vector<ContainerEntry> listEntries() override {
        requireOpen();

        std::vector<CfbStream> streams;
        try {
            streams = file->listStreams();
        } catch (const std::runtime_error& e) {
            throw ContainerError(ErrorKind::CorruptContainer, e.what());
        }

        std::vector<ContainerEntry> entries;
        for (const auto& stream : streams) {
            ContainerEntry entry;
            for (size_t i = 0; i < stream.path.size(); ++i) {
                if (i > 0)
                    entry.name += "/";
                entry.name += stream.path[i];
            }
            entry.size = stream.size;
            entry.mediaType = guessMediaType(entry.name);
            entry.index = stream.id;
            entry.format = ContainerFormat::Ole;
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<uint8_t> read(const ContainerEntry& entry) override {
        requireOpen();
        try {
            return file->readStream(static_cast<uint32_t>(entry.index));
        } catch (const std::runtime_error& e) {
            throw ContainerError(ErrorKind::EntryIOError, e.what());
        }
    }

private:
    void requireOpen() const {
        if (!file)
            throw ContainerError(ErrorKind::CorruptContainer, "OLE file is not open");
    }

    std::unique_ptr<CompoundFile> file;
};

REGISTER_EXTRACTOR(OLEExtractor, ContainerFormat::Ole)
