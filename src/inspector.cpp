#include "inspector.hpp"
#include "parser_registry.hpp"
#include "extractor_registry.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

static const uint8_t ZIP_LOCAL_HEADER[4] = {0x50, 0x4B, 0x03, 0x04};

std::string safeEntryName(const ContainerEntry& entry) {
    std::string name = entry.name;
    if (entry.format == ContainerFormat::Ole)
        std::replace(name.begin(), name.end(), '/', '_');
    return sanitizeFileName(name);
}

Inspector::Inspector(Logger& log) : log(log) {
    parsers = ParserRegistry::instance().createAll();
}

ContainerFormat Inspector::detectFormat(const fs::path& path) {
    std::vector<uint8_t> blob;
    try {
        blob = readFile(path);
    } catch (const std::runtime_error& e) {
        throw ContainerError(ErrorKind::CorruptContainer, e.what());
    }

    for (const auto& parser : parsers) {
        if (parser->match(blob)) {
            log.debug("Detected " + parser->name() + " structure in " + path.string());
            return parser->format();
        }
    }

    log.warn("Unsupported file format: " + path.string() + ". Attempting to identify contents.");
    if (blob.size() >= 4 && std::equal(ZIP_LOCAL_HEADER, ZIP_LOCAL_HEADER + 4, blob.begin())) {
        log.info("Detected ZIP file header. Attempting ZIP extraction.");
        return ContainerFormat::Zip;
    }
    return ContainerFormat::Unknown;
}

std::unique_ptr<BaseExtractor> Inspector::openExtractor(const fs::path& path, ContainerFormat format) {
    auto extractor = ExtractorRegistry::instance().create(format);
    if (!extractor)
        throw ContainerError(ErrorKind::UnsupportedFormat, "No reader for " + formatName(format) + " containers");

    log.debug("Using " + extractor->name() + " extractor for " + path.string());
    extractor->open(path);
    return extractor;
}

std::vector<ContainerEntry> Inspector::listEntries(const fs::path& path, ContainerFormat format) {
    return openExtractor(path, format)->listEntries();
}

ExtractionResult Inspector::extractEntry(const ContainerEntry& entry,
                                         const std::vector<uint8_t>& rawBytes,
                                         const fs::path& outputDir) {
    ExtractionResult result;
    result.entryName = entry.name;

    std::string safeName = safeEntryName(entry);
    if (safeName.empty()) {
        result.error = ErrorKind::EntryIOError;
        result.message = "entry has no usable file name";
        return result;
    }

    auto previous = written.find(safeName);
    if (previous != written.end()) {
        log.warn("Entry " + entry.name + " overwrites " + previous->second + " as " + safeName);
    }

    fs::path outputPath = outputDir / safeName;
    try {
        writeFile(outputPath, rawBytes);
    } catch (const std::exception& e) {
        result.error = ErrorKind::EntryIOError;
        result.message = e.what();
        return result;
    }

    written[safeName] = entry.name;
    result.status = ExtractionResult::Status::Succeeded;
    result.outputPath = outputPath.string();
    return result;
}

void Inspector::fail(InspectReport& report, ErrorKind kind, const std::string& msg) {
    report.error = kind;
    report.message = msg;
    log.error(msg);
}

InspectReport Inspector::process(const fs::path& path, const fs::path& outputDir, bool listOnly) {
    InspectReport report;
    report.path = path.string();
    written.clear();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        fail(report, ErrorKind::NotFound, "File not found: " + path.string());
        return report;
    }
    if (!fs::is_regular_file(path, ec)) {
        fail(report, ErrorKind::UnsupportedFormat, "Not a regular file: " + path.string());
        return report;
    }

    std::unique_ptr<BaseExtractor> extractor;
    try {
        report.format = detectFormat(path);
        if (report.format == ContainerFormat::Unknown) {
            fail(report, ErrorKind::UnsupportedFormat, "Could not identify file type for: " + path.string());
            return report;
        }

        extractor = openExtractor(path, report.format);
        log.info("Processing " + formatName(report.format) + " container: " + path.string());
        report.entries = extractor->listEntries();
    } catch (const ContainerError& e) {
        fail(report, e.kind(), e.what());
        return report;
    }

    for (const auto& entry : report.entries) {
        log.info("Found embedded file: " + entry.name + ", Size: " + std::to_string(entry.size) +
                 ", Type: " + entry.mediaType);
        if (listOnly)
            continue;

        ExtractionResult result;
        try {
            result = extractEntry(entry, extractor->read(entry), outputDir);
        } catch (const ContainerError& e) {
            result.entryName = entry.name;
            result.error = e.kind();
            result.message = e.what();
        }

        if (result.succeeded()) {
            log.info("Extracted " + entry.name + " to " + result.outputPath);
        } else {
            log.error("Error extracting " + entry.name + ": " + result.message);
        }
        report.results.push_back(result);
    }

    log.debug(std::to_string(report.entries.size()) + " entries, " +
              std::to_string(std::count_if(report.results.begin(), report.results.end(),
                                           [](const ExtractionResult& r) { return !r.succeeded(); })) +
              " failed");
    return report;
}
