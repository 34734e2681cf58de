#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>

enum class ContainerFormat {
    Zip,
    Ole,
    Unknown
};

enum class ErrorKind {
    NotFound,
    UnsupportedFormat,
    CorruptContainer,
    EntryIOError
};

struct ContainerEntry {
    std::string name;       // path inside the container, "/" separated
    uint64_t size = 0;
    std::string mediaType = "application/octet-stream";
    uint64_t index = 0;     // ZIP central directory index / OLE directory id
    ContainerFormat format = ContainerFormat::Unknown;
};

struct ExtractionResult {
    enum class Status {
        Succeeded,
        Failed
    };

    std::string entryName;
    Status status = Status::Failed;
    std::optional<ErrorKind> error;     // set on failure
    std::string outputPath;
    std::string message;

    bool succeeded() const { return status == Status::Succeeded; }
};

struct InspectReport {
    std::string path;
    ContainerFormat format = ContainerFormat::Unknown;
    std::vector<ContainerEntry> entries;
    std::vector<ExtractionResult> results;
    std::optional<ErrorKind> error;
    std::string message;

    bool success() const { return !error.has_value(); }
};

class ContainerError : public std::runtime_error {
public:
    ContainerError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

std::string formatName(ContainerFormat format);
std::string errorKindName(ErrorKind kind);

// Process exit status for a finished run: 0 on success (per-entry failures
// included), 2 NotFound, 3 UnsupportedFormat, 4 CorruptContainer.
int exitCode(const InspectReport& report);
