#include "gzinspect/json_report.hpp"

#include <gtest/gtest.h>

namespace gzinspect {
namespace {

ChunkInfo SampleChunk() {
    ChunkInfo c;
    c.chunk_number = 1;
    c.offset = 100;
    c.compressed_size = 50;
    c.uncompressed_size = 200;
    c.compression_ratio = 4.0;
    c.header.compression_method = "deflate";
    c.header.flags = {"EXTRA", "NAME"};
    c.header.mtime = "Not set";
    c.header.extra_flags = "max compression";
    c.header.os = "Unix";
    c.header.extra_fields = {ExtraSubfield{.id = 0x4150, .data = {1, 2}}};
    c.header.filename = "log.txt";
    c.header.header_size = 26;
    c.payload = std::vector<std::uint8_t>{'x'};
    return c;
}

TEST(JsonReportTest, ChunkFields) {
    const auto j = ChunkToJson(SampleChunk());
    EXPECT_EQ(j["chunk_number"], 1);
    EXPECT_EQ(j["offset"], 100);
    EXPECT_EQ(j["compressed_size"], 50);
    EXPECT_EQ(j["uncompressed_size"], 200);
    EXPECT_DOUBLE_EQ(j["compression_ratio"].get<double>(), 4.0);
    EXPECT_EQ(j["header_info"], "deflate|EXTRA|NAME|log.txt");
    EXPECT_FALSE(j.contains("payload"));

    const auto& h = j["header"];
    EXPECT_EQ(h["compression_method"], "deflate");
    EXPECT_EQ(h["flags"], nlohmann::json::array({"EXTRA", "NAME"}));
    EXPECT_EQ(h["os"], "Unix");
    EXPECT_EQ(h["filename"], "log.txt");
    EXPECT_TRUE(h["comment"].is_null());
    EXPECT_EQ(h["header_size"], 26);
    ASSERT_EQ(h["extra_fields"].size(), 1U);
    EXPECT_EQ(h["extra_fields"][0]["id"], 0x4150);
    EXPECT_EQ(h["extra_fields"][0]["data"], nlohmann::json::array({1, 2}));
}

TEST(JsonReportTest, Summary) {
    FileSummary s;
    s.total_chunks = 3;
    s.total_compressed_size = 10;
    s.total_uncompressed_size = 30;
    s.average_compression_ratio = 3.0;

    const auto j = SummaryToJson(s);
    EXPECT_EQ(j["total_chunks"], 3);
    EXPECT_EQ(j["total_compressed_size"], 10);
    EXPECT_EQ(j["total_uncompressed_size"], 30);
    EXPECT_DOUBLE_EQ(j["average_compression_ratio"].get<double>(), 3.0);
}

TEST(JsonReportTest, Error) {
    const auto j = ErrorToJson(ScanError{.kind = ScanErrorKind::BadMagic, .offset = 42, .message = "Invalid GZIP header: 00 00 00"});
    EXPECT_EQ(j["error"], "bad magic");
    EXPECT_EQ(j["offset"], 42);
    EXPECT_EQ(j["message"], "Invalid GZIP header: 00 00 00");
}

} // namespace
} // namespace gzinspect
