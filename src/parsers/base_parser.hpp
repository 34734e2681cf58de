#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "inspectresult.hpp"


class BaseParser {
public:
    virtual ~BaseParser() = default;
    virtual std::string name() const = 0;
    virtual ContainerFormat format() const = 0;
    // Structural check on the whole file content, never on the file name.
    virtual bool match(const std::vector<std::uint8_t>& blob) = 0;

};
