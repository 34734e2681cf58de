// extractor_registry.hpp
#pragma once
#include "base_extractor.hpp"
#include "inspectresult.hpp"
#include <functional>
#include <map>
#include <memory>

class ExtractorRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseExtractor>()>;

    static ExtractorRegistry& instance() {
        static ExtractorRegistry registry;
        return registry;
    }

    void registerExtractor(ContainerFormat format, Creator creator) {
        creators[format] = std::move(creator);
    }

    // Fresh extractor for the format, nullptr if none is registered.
    std::unique_ptr<BaseExtractor> create(ContainerFormat format) const {
        auto it = creators.find(format);
        if (it == creators.end())
            return nullptr;
        return it->second();
    }

private:
    std::map<ContainerFormat, Creator> creators;
};
