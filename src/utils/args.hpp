#pragma once
#include <string>
#include <unordered_map>
#include <vector>

struct Config {
    std::string inputFile;
    std::string outputDir = ".";
    bool listOnly = false;
    bool verbose = false;
    bool jsonOutput = false;
    std::string jsonFile;
    bool showHelp = false;
};


class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical);

    // Throws std::runtime_error when a value-taking option is last.
    void parse(int argc, const char* const argv[]);

    bool has(const std::string& canonical) const;
    std::string get(const std::string& canonical, const std::string& def = "") const;
};

// Throws std::runtime_error on unknown options, missing values or a
// missing input file. -h/--help only sets showHelp.
Config parseArgs(int argc, const char* const argv[]);
std::string usage(const std::string& program);
