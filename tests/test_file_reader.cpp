#include <gtest/gtest.h>

#include "io/file_reader.hpp"
#include "testing.hpp"

#include <cerrno>
#include <fstream>
#include <string>

namespace {

std::string WriteFile(const testutil::TemporaryDirectory& dir, const std::string& name, const std::string& data) {
    const std::string path = dir.Path() + "/" + name;
    std::ofstream os(path, std::ios::binary);
    os << data;
    return path;
}

TEST(FileReaderTest, ReadsWholeFileAndReportsSize) {
    testutil::TemporaryDirectory dir;
    const std::string path = WriteFile(dir, "input.bin", "0123456789abcdef");

    gzinspect::FileReader reader;
    auto r = gzinspect::FileReader::Open(path, reader);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(reader.Path(), path);
    ASSERT_TRUE(reader.TotalSize().has_value());
    EXPECT_EQ(*reader.TotalSize(), 16U);

    EXPECT_EQ(testutil::ReadAll(reader), "0123456789abcdef");
    EXPECT_EQ(reader.Tell(), 16U);
}

TEST(FileReaderTest, SeekMovesCursor) {
    testutil::TemporaryDirectory dir;
    const std::string path = WriteFile(dir, "input.bin", "0123456789");

    gzinspect::FileReader reader;
    ASSERT_TRUE(gzinspect::FileReader::Open(path, reader).ok);

    ASSERT_TRUE(reader.Seek(6).ok);
    EXPECT_EQ(reader.Tell(), 6U);
    std::uint8_t buf[2]{};
    EXPECT_EQ(reader.Read(buf), 2);
    EXPECT_EQ(buf[0], '6');
    EXPECT_EQ(buf[1], '7');
    EXPECT_EQ(reader.Tell(), 8U);

    ASSERT_TRUE(reader.Seek(0).ok);
    EXPECT_EQ(testutil::ReadAll(reader), "0123456789");
}

TEST(FileReaderTest, MissingFileFails) {
    testutil::TemporaryDirectory dir;
    gzinspect::FileReader reader;
    auto r = gzinspect::FileReader::Open(dir.Path() + "/nope.gz", reader);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_NE(r.msg.find("nope.gz"), std::string::npos);
}

TEST(FileReaderTest, DirectoryIsRejected) {
    testutil::TemporaryDirectory dir;
    gzinspect::FileReader reader;
    auto r = gzinspect::FileReader::Open(dir.Path(), reader);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, EINVAL);
}

} // namespace
