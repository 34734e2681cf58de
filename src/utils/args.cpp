#include "args.hpp"
#include <stdexcept>

void ArgParser::addOption(const std::string& name, bool takesValue, const std::string& canonical) {
    optionDefs[name] = {takesValue, canonical};
}

void ArgParser::parse(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Is this a known option?
        if (optionDefs.count(arg)) {
            const auto& info = optionDefs[arg];

            if (info.takesValue) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for option: " + arg);
                }
                parsedOptions[info.canonicalName] = argv[++i];
            } else {
                parsedOptions[info.canonicalName] = "true";
            }
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        }
        else {
            // Not an option → positional argument
            positional.push_back(arg);
        }
    }
}

bool ArgParser::has(const std::string& canonical) const {
    return parsedOptions.count(canonical);
}

std::string ArgParser::get(const std::string& canonical, const std::string& def) const {
    auto it = parsedOptions.find(canonical);
    return it != parsedOptions.end() ? it->second : def;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [-o dir] [-l] [-v] [-O file] <filepath>\n"
           "  -o, --output DIR  Output directory for extracted files (default: current directory)\n"
           "  -l, --list        List embedded files without extracting\n"
           "  -v, --verbose     Enable verbose output (debug logging)\n"
           "  -O, --json FILE   Write a JSON report to FILE\n"
           "  -h, --help        Show this help message\n";
}

Config parseArgs(int argc, const char* const argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-o", true, "output");
    args.addOption("--output", true, "output");

    args.addOption("-l", false, "list");
    args.addOption("--list", false, "list");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-O", true, "json");
    args.addOption("--json", true, "json");

    args.parse(argc, argv);

    config.listOnly = args.has("list");
    config.verbose = args.has("verbose");
    config.outputDir = args.get("output", ".");

    if (args.has("json"))
    {
        config.jsonFile = args.get("json");
        config.jsonOutput = true;
    }

    if (args.has("help"))
    {
        config.showHelp = true;
        return config;
    }

    if (args.positional.empty())
        throw std::runtime_error("Missing input file");

    config.inputFile = args.positional.back();

    return config;
}
