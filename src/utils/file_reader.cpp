#include "file_reader.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

static std::string lastSystemError() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("I/O error");
}

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot open " + path.string() + ": " + lastSystemError());

    std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad())
        throw std::runtime_error("Cannot read " + path.string() + ": " + lastSystemError());
    return blob;
}

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("Cannot open " + path.string() + " for writing: " + lastSystemError());

    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out)
        throw std::runtime_error("Cannot write " + path.string() + ": " + lastSystemError());
}
