#pragma once
#include "parsers/base_parser.hpp"
#include "extractors/base_extractor.hpp"
#include "inspectresult.hpp"
#include "logger.hpp"
#include <vector>
#include <memory>
#include <string>
#include <unordered_map>
#include <filesystem>
namespace fs = std::filesystem;

// Name an entry is written under inside the output directory: the final
// path segment only, so nothing lands outside it. OLE paths get their "/"
// joins turned into "_" first. "" means the entry has no usable name.
std::string safeEntryName(const ContainerEntry& entry);

class Inspector {
public:
    explicit Inspector(Logger& log);

    // By content: ZIP structure, then OLE signature, then the 4-byte
    // local file header probe. Throws ContainerError(CorruptContainer)
    // when the file cannot be read.
    ContainerFormat detectFormat(const fs::path& path);

    // Throws ContainerError(CorruptContainer) if the container cannot be
    // opened or its directory is broken.
    std::vector<ContainerEntry> listEntries(const fs::path& path, ContainerFormat format);

    // Writes rawBytes to outputDir/safeEntryName(entry), replacing any
    // existing file. Never throws.
    ExtractionResult extractEntry(const ContainerEntry& entry,
                                  const std::vector<uint8_t>& rawBytes,
                                  const fs::path& outputDir);

    InspectReport process(const fs::path& path, const fs::path& outputDir, bool listOnly);

private:
    std::unique_ptr<BaseExtractor> openExtractor(const fs::path& path, ContainerFormat format);
    void fail(InspectReport& report, ErrorKind kind, const std::string& msg);

    Logger& log;
    std::vector<std::unique_ptr<BaseParser>> parsers;
    // safe name -> entry that last wrote it, per process() run
    std::unordered_map<std::string, std::string> written;
};
