#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "args.hpp"

static Config parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "boxdig");
    return parseArgs(static_cast<int>(argv.size()), argv.data());
}

TEST(ArgsTest, Defaults) {
    Config c = parse({"archive.zip"});
    EXPECT_EQ(c.inputFile, "archive.zip");
    EXPECT_EQ(c.outputDir, ".");
    EXPECT_FALSE(c.listOnly);
    EXPECT_FALSE(c.verbose);
    EXPECT_FALSE(c.jsonOutput);
    EXPECT_FALSE(c.showHelp);
}

TEST(ArgsTest, ShortOptions) {
    Config c = parse({"-o", "out/dir", "-l", "-v", "doc.ole"});
    EXPECT_EQ(c.inputFile, "doc.ole");
    EXPECT_EQ(c.outputDir, "out/dir");
    EXPECT_TRUE(c.listOnly);
    EXPECT_TRUE(c.verbose);
}

TEST(ArgsTest, LongOptions) {
    Config c = parse({"--list", "--output", "x", "--verbose", "--json", "report.json", "a.jar"});
    EXPECT_EQ(c.outputDir, "x");
    EXPECT_TRUE(c.listOnly);
    EXPECT_TRUE(c.verbose);
    EXPECT_TRUE(c.jsonOutput);
    EXPECT_EQ(c.jsonFile, "report.json");
    EXPECT_EQ(c.inputFile, "a.jar");
}

TEST(ArgsTest, LastPositionalWins) {
    Config c = parse({"first.zip", "second.zip"});
    EXPECT_EQ(c.inputFile, "second.zip");
}

TEST(ArgsTest, HelpNeedsNoInput) {
    Config c = parse({"--help"});
    EXPECT_TRUE(c.showHelp);
    EXPECT_TRUE(parse({"-h", "a.zip"}).showHelp);
}

TEST(ArgsTest, Errors) {
    EXPECT_THROW(parse({}), std::runtime_error);
    EXPECT_THROW(parse({"a.zip", "-o"}), std::runtime_error);
    EXPECT_THROW(parse({"--bogus", "a.zip"}), std::runtime_error);
}

TEST(ArgsTest, UsageNamesOptions) {
    std::string text = usage("boxdig");
    EXPECT_NE(text.find("--output"), std::string::npos);
    EXPECT_NE(text.find("--list"), std::string::npos);
    EXPECT_NE(text.find("--verbose"), std::string::npos);
}
