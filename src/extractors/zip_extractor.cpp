#include "base_extractor.hpp"
#include "extractor_registration.hpp"
#include <zip.h>
#include <vector>
#include <string>
#include <memory>
#include <stdexcept>
#include <filesystem>
#include "file_reader.hpp"
#include "media_type.hpp"

namespace fs = std::filesystem;

struct ZipArchiveDeleter {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};

class ZIPExtractor : public BaseExtractor {
public:
std::string name() const override { return "ZIP"; };

void open(const fs::path& path) override {
    archive.reset();
    try {
        blob = readFile(path);
    } catch (const std::runtime_error& e) {
        throw ContainerError(ErrorKind::CorruptContainer, e.what());
    }

    zip_error_t error;
    zip_error_init(&error);

    zip_source_t* src = zip_source_buffer_create(blob.data(), blob.size(), 0, &error);
    if (!src) {
        std::string msg = std::string("Failed to create zip source: ") + zip_error_strerror(&error);
        zip_error_fini(&error);
        throw ContainerError(ErrorKind::CorruptContainer, msg);
    }

    zip_t* za = zip_open_from_source(src, ZIP_RDONLY, &error);
    if (!za) {
        std::string msg = path.string() + " is not a valid ZIP archive: " + zip_error_strerror(&error);
        zip_source_free(src);
        zip_error_fini(&error);
        throw ContainerError(ErrorKind::CorruptContainer, msg);
    }

    zip_error_fini(&error);
    archive.reset(za);
}

std::vector<ContainerEntry> listEntries() override {
    requireOpen();

    std::vector<ContainerEntry> entries;
    zip_int64_t num_entries = zip_get_num_entries(archive.get(), 0);
    if (num_entries < 0)
        throw ContainerError(ErrorKind::CorruptContainer, zip_strerror(archive.get()));

    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(num_entries); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive.get(), i, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)) {
            throw ContainerError(ErrorKind::CorruptContainer,
                                 "Cannot read central directory record " + std::to_string(i) +
                                 ": " + zip_strerror(archive.get()));
        }

        ContainerEntry entry;
        entry.name = st.name;
        entry.size = (st.valid & ZIP_STAT_SIZE) ? st.size : 0;
        entry.mediaType = guessMediaType(entry.name);
        entry.index = i;
        entry.format = ContainerFormat::Zip;
        entries.push_back(entry);
    }
    return entries;
}

std::vector<uint8_t> read(const ContainerEntry& entry) override {
    requireOpen();

    zip_file_t* zf = zip_fopen_index(archive.get(), entry.index, 0);
    if (!zf)
        throw ContainerError(ErrorKind::EntryIOError, zip_strerror(archive.get()));

    std::vector<uint8_t> fileData;
    std::vector<uint8_t> buffer(64 * 1024);
    zip_int64_t n;
    while ((n = zip_fread(zf, buffer.data(), buffer.size())) > 0) {
        fileData.insert(fileData.end(), buffer.begin(), buffer.begin() + n);
    }
    if (n < 0) {
        std::string msg = zip_file_strerror(zf);
        zip_fclose(zf);
        throw ContainerError(ErrorKind::EntryIOError, msg);
    }

    if (zip_fclose(zf) != 0)
        throw ContainerError(ErrorKind::EntryIOError, zip_strerror(archive.get()));
    return fileData;
}

private:
void requireOpen() const {
    if (!archive)
        throw ContainerError(ErrorKind::CorruptContainer, "ZIP archive is not open");
}

// libzip reads from this buffer for the archive's whole lifetime.
std::vector<uint8_t> blob;
std::unique_ptr<zip_t, ZipArchiveDeleter> archive;

};

REGISTER_EXTRACTOR(ZIPExtractor, ContainerFormat::Zip)
