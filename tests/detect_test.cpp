#include <gtest/gtest.h>
#include <sstream>
#include "inspector.hpp"
#include "test_support.hpp"

class DetectTest : public ::testing::Test {
protected:
    std::ostringstream out;
    Logger log{out, LogLevel::DEBUG};
    Inspector inspector{log};
    TempDir tmp;
};

TEST_F(DetectTest, ZipByCentralDirectory) {
    writeBytes(tmp / "a.bin", buildStoredZip({{"readme.txt", "hello world"}}));
    EXPECT_EQ(inspector.detectFormat(tmp / "a.bin"), ContainerFormat::Zip);
}

TEST_F(DetectTest, EmptyZipArchive) {
    writeBytes(tmp / "empty.zip", buildStoredZip({}));
    EXPECT_EQ(inspector.detectFormat(tmp / "empty.zip"), ContainerFormat::Zip);
}

TEST_F(DetectTest, ZipWithPrependedData) {
    std::vector<uint8_t> data(100, 'x');
    std::vector<uint8_t> zip = buildStoredZip({{"a.txt", "abc"}});
    data.insert(data.end(), zip.begin(), zip.end());
    writeBytes(tmp / "sfx.exe", data);
    EXPECT_EQ(inspector.detectFormat(tmp / "sfx.exe"), ContainerFormat::Zip);
}

TEST_F(DetectTest, ZipWithTrailingComment) {
    std::vector<uint8_t> zip = buildStoredZip({{"a.txt", "abc"}});
    std::string comment = "archive comment";
    putLe16(zip, zip.size() - 2, static_cast<uint16_t>(comment.size()));
    zip.insert(zip.end(), comment.begin(), comment.end());
    writeBytes(tmp / "c.zip", zip);
    EXPECT_EQ(inspector.detectFormat(tmp / "c.zip"), ContainerFormat::Zip);
}

TEST_F(DetectTest, OleBySignature) {
    OleBuilder ole;
    ole.addStream("WordDocument", "content");
    writeBytes(tmp / "doc.bin", ole.build());
    EXPECT_EQ(inspector.detectFormat(tmp / "doc.bin"), ContainerFormat::Ole);
}

TEST_F(DetectTest, ExtensionIsIgnored) {
    writeText(tmp / "fake.zip", "this is just text, not an archive");
    EXPECT_EQ(inspector.detectFormat(tmp / "fake.zip"), ContainerFormat::Unknown);

    OleBuilder ole;
    ole.addStream("Data", "x");
    writeBytes(tmp / "real.txt", ole.build());
    EXPECT_EQ(inspector.detectFormat(tmp / "real.txt"), ContainerFormat::Ole);
}

TEST_F(DetectTest, EmptyAndTinyFilesAreUnknown) {
    writeBytes(tmp / "empty", {});
    EXPECT_EQ(inspector.detectFormat(tmp / "empty"), ContainerFormat::Unknown);

    writeBytes(tmp / "two", {0x50, 0x4B});
    EXPECT_EQ(inspector.detectFormat(tmp / "two"), ContainerFormat::Unknown);
}

TEST_F(DetectTest, ShortOleSignatureIsUnknown) {
    std::vector<uint8_t> data = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
    data.resize(1024, 0);
    writeBytes(tmp / "short.ole", data);
    EXPECT_EQ(inspector.detectFormat(tmp / "short.ole"), ContainerFormat::Unknown);
}

TEST_F(DetectTest, LocalHeaderFallback) {
    std::vector<uint8_t> data = {0x50, 0x4B, 0x03, 0x04};
    data.resize(64, 0xAA);
    writeBytes(tmp / "truncated.zip", data);
    EXPECT_EQ(inspector.detectFormat(tmp / "truncated.zip"), ContainerFormat::Zip);
    EXPECT_NE(out.str().find("Detected ZIP file header"), std::string::npos);
}

TEST_F(DetectTest, ZipCheckedBeforeOle) {
    // A compound file with an empty end of central directory record appended
    // satisfies both probes.
    OleBuilder ole;
    ole.addStream("Data", "x");
    std::vector<uint8_t> data = ole.build();
    std::vector<uint8_t> eocd = buildStoredZip({});
    data.insert(data.end(), eocd.begin(), eocd.end());
    writeBytes(tmp / "both", data);

    EXPECT_EQ(inspector.detectFormat(tmp / "both"), ContainerFormat::Zip);
    EXPECT_EQ(inspector.detectFormat(tmp / "both"), ContainerFormat::Zip);
}

TEST_F(DetectTest, BrokenCentralDirectoryOffsetIsNotZip) {
    std::vector<uint8_t> zip = buildStoredZip({{"a.txt", "abc"}});
    // point the central directory past the record and shrink nothing else
    putLe32(zip, zip.size() - 6, 0x00FFFFF0);
    putLe32(zip, zip.size() - 10, 7);
    writeBytes(tmp / "bad.bin", zip);
    // falls through to the local header probe
    EXPECT_EQ(inspector.detectFormat(tmp / "bad.bin"), ContainerFormat::Zip);
    EXPECT_NE(out.str().find("Unsupported file format"), std::string::npos);
}
