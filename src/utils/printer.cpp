#include "printer.hpp"
#include "cJSON.h"
#include <fstream>
#include <stdexcept>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

static cJSON* build_json_entry(const ContainerEntry& e) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "name", e.name.c_str());
    cJSON_AddNumberToObject(item, "size", static_cast<double>(e.size));
    cJSON_AddStringToObject(item, "type", e.mediaType.c_str());
    return item;
}

static cJSON* build_json_result(const ExtractionResult& r) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "name", r.entryName.c_str());
    cJSON_AddStringToObject(item, "status", r.succeeded() ? "succeeded" : "failed");
    if (r.succeeded()) {
        cJSON_AddStringToObject(item, "output", r.outputPath.c_str());
    } else {
        cJSON_AddStringToObject(item, "error", errorKindName(r.error.value_or(ErrorKind::EntryIOError)).c_str());
        cJSON_AddStringToObject(item, "message", r.message.c_str());
    }
    return item;
}

std::string reportToJson(const InspectReport& report) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "path", report.path.c_str());
    cJSON_AddStringToObject(root, "format", formatName(report.format).c_str());
    if (report.error) {
        cJSON_AddStringToObject(root, "error", errorKindName(*report.error).c_str());
        cJSON_AddStringToObject(root, "message", report.message.c_str());
    } else {
        cJSON_AddNullToObject(root, "error");
    }

    cJSON* entries = cJSON_CreateArray();
    for (const auto& e : report.entries) {
        cJSON_AddItemToArray(entries, build_json_entry(e));
    }
    cJSON_AddItemToObject(root, "entries", entries);

    cJSON* results = cJSON_CreateArray();
    for (const auto& r : report.results) {
        cJSON_AddItemToArray(results, build_json_result(r));
    }
    cJSON_AddItemToObject(root, "results", results);

    char* jsonStr = cJSON_Print(root);
    std::string json = jsonStr ? jsonStr : "";
    cJSON_free(jsonStr);
    cJSON_Delete(root);
    return json;
}

void dumpJson(const InspectReport& report, const std::string& filename) {
    fs::path outputPath = fs::path(filename);
    std::ofstream outFile(outputPath, std::ios::binary);
    if (!outFile.is_open())
        throw std::runtime_error("Cannot open " + filename + " for writing");

    std::string json = reportToJson(report);
    outFile.write(json.data(), static_cast<std::streamsize>(json.size()));
    outFile.close();
    if (!outFile)
        throw std::runtime_error("Cannot write " + filename);
}

// Entry table on stdout, one line per entry with its extraction outcome.
void printReport(const InspectReport& report, std::ostream& out) {
    out << "* " << report.path << " [" << formatName(report.format) << "]\n";
    for (size_t i = 0; i < report.entries.size(); ++i) {
        const ContainerEntry& e = report.entries[i];
        bool last = i == report.entries.size() - 1;
        out << (last ? "└── " : "├── ") << e.name
            << " (size=" << e.size << ", type=" << e.mediaType << ")";

        // results line up with entries unless the run was list-only
        if (i < report.results.size()) {
            const ExtractionResult& r = report.results[i];
            out << (r.succeeded() ? " -> " + r.outputPath : " !! " + r.message);
        }
        out << "\n";
    }
}
