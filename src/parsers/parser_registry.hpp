// parser_registry.hpp
#pragma once
#include "base_parser.hpp"
#include <algorithm>
#include <functional>
#include <vector>
#include <memory>

class ParserRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseParser>()>;

    static ParserRegistry& instance() {
        static ParserRegistry registry;
        return registry;
    }

    // Lower priority values are probed first. Static registration order
    // across translation units is unspecified, so detection precedence
    // comes from the priority alone.
    void registerParser(int priority, Creator creator) {
        creators.push_back({priority, std::move(creator)});
    }

    std::vector<std::unique_ptr<BaseParser>> createAll() const {
        std::vector<std::pair<int, Creator>> ordered = creators;
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<std::unique_ptr<BaseParser>> result;
        for (const auto& entry : ordered) {
            result.push_back(entry.second());
        }
        return result;
    }

private:
    std::vector<std::pair<int, Creator>> creators;
};
