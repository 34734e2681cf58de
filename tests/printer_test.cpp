#include <gtest/gtest.h>
#include <sstream>
#include "cJSON.h"
#include "printer.hpp"
#include "test_support.hpp"

static InspectReport sampleReport() {
    InspectReport report;
    report.path = "archive.zip";
    report.format = ContainerFormat::Zip;

    ContainerEntry readme;
    readme.name = "readme.txt";
    readme.size = 11;
    readme.mediaType = "text/plain";
    ContainerEntry info;
    info.name = "data/info.json";
    info.size = 20;
    info.mediaType = "application/json";
    report.entries = {readme, info};

    ExtractionResult ok;
    ok.entryName = "readme.txt";
    ok.status = ExtractionResult::Status::Succeeded;
    ok.outputPath = "out/readme.txt";
    ExtractionResult bad;
    bad.entryName = "data/info.json";
    bad.error = ErrorKind::EntryIOError;
    bad.message = "CRC error";
    report.results = {ok, bad};
    return report;
}

TEST(PrinterTest, ReportToJsonCarriesEntriesAndResults) {
    std::string json = reportToJson(sampleReport());
    cJSON* root = cJSON_Parse(json.c_str());
    ASSERT_NE(root, nullptr);

    EXPECT_STREQ(cJSON_GetObjectItem(root, "path")->valuestring, "archive.zip");
    EXPECT_STREQ(cJSON_GetObjectItem(root, "format")->valuestring, "ZIP");
    EXPECT_TRUE(cJSON_IsNull(cJSON_GetObjectItem(root, "error")));

    cJSON* entries = cJSON_GetObjectItem(root, "entries");
    ASSERT_EQ(cJSON_GetArraySize(entries), 2);
    cJSON* second = cJSON_GetArrayItem(entries, 1);
    EXPECT_STREQ(cJSON_GetObjectItem(second, "name")->valuestring, "data/info.json");
    EXPECT_EQ(cJSON_GetObjectItem(second, "size")->valueint, 20);
    EXPECT_STREQ(cJSON_GetObjectItem(second, "type")->valuestring, "application/json");

    cJSON* results = cJSON_GetObjectItem(root, "results");
    ASSERT_EQ(cJSON_GetArraySize(results), 2);
    cJSON* ok = cJSON_GetArrayItem(results, 0);
    EXPECT_STREQ(cJSON_GetObjectItem(ok, "status")->valuestring, "succeeded");
    EXPECT_STREQ(cJSON_GetObjectItem(ok, "output")->valuestring, "out/readme.txt");
    cJSON* bad = cJSON_GetArrayItem(results, 1);
    EXPECT_STREQ(cJSON_GetObjectItem(bad, "status")->valuestring, "failed");
    EXPECT_STREQ(cJSON_GetObjectItem(bad, "message")->valuestring, "CRC error");
    EXPECT_STREQ(cJSON_GetObjectItem(bad, "error")->valuestring, "EntryIOError");
    EXPECT_EQ(cJSON_GetObjectItem(bad, "output"), nullptr);

    cJSON_Delete(root);
}

TEST(PrinterTest, FailedRunNamesErrorKind) {
    InspectReport report;
    report.path = "missing.zip";
    report.error = ErrorKind::NotFound;
    report.message = "File not found: missing.zip";

    cJSON* root = cJSON_Parse(reportToJson(report).c_str());
    ASSERT_NE(root, nullptr);
    EXPECT_STREQ(cJSON_GetObjectItem(root, "format")->valuestring, "UNKNOWN");
    EXPECT_STREQ(cJSON_GetObjectItem(root, "error")->valuestring, "NotFound");
    EXPECT_STREQ(cJSON_GetObjectItem(root, "message")->valuestring, "File not found: missing.zip");
    EXPECT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(root, "entries")), 0);
    cJSON_Delete(root);
}

TEST(PrinterTest, DumpJsonWritesFile) {
    TempDir tmp;
    fs::path file = tmp / "report.json";
    dumpJson(sampleReport(), file.string());

    cJSON* root = cJSON_Parse(readText(file).c_str());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(root, "entries")), 2);
    cJSON_Delete(root);
}

TEST(PrinterTest, DumpJsonThrowsOnBadPath) {
    TempDir tmp;
    EXPECT_THROW(dumpJson(sampleReport(), (tmp / "no" / "report.json").string()), std::runtime_error);
}

TEST(PrinterTest, PrintReportListsEveryEntry) {
    std::ostringstream out;
    printReport(sampleReport(), out);
    std::string text = out.str();

    EXPECT_NE(text.find("archive.zip [ZIP]"), std::string::npos);
    EXPECT_NE(text.find("readme.txt (size=11, type=text/plain) -> out/readme.txt"), std::string::npos);
    EXPECT_NE(text.find("data/info.json (size=20, type=application/json) !! CRC error"), std::string::npos);
}

TEST(PrinterTest, PrintReportWithoutResults) {
    InspectReport report = sampleReport();
    report.results.clear();
    std::ostringstream out;
    printReport(report, out);

    EXPECT_EQ(out.str().find("->"), std::string::npos);
    EXPECT_NE(out.str().find("data/info.json"), std::string::npos);
}
