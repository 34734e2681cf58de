#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "inspectresult.hpp"

#include <filesystem>
namespace fs = std::filesystem;


// Reads one container format. open() and listEntries() throw ContainerError
// with CorruptContainer; read() throws ContainerError with EntryIOError.
class BaseExtractor {
public:
    virtual ~BaseExtractor() = default;
    virtual std::string name() const = 0;
    virtual void open(const fs::path& path) = 0;
    virtual std::vector<ContainerEntry> listEntries() = 0;
    virtual std::vector<std::uint8_t> read(const ContainerEntry& entry) = 0;
};
