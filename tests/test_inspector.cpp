#include "gzinspect/inspector.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace gzinspect {
namespace {

using testutil::Bytes;

std::vector<nlohmann::json> JsonLines(const std::string& text) {
    std::vector<nlohmann::json> out;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

Bytes FourMembers() {
    return testutil::Concat({testutil::GzipMember("zero\n"), testutil::GzipMember("one\n"),
                             testutil::GzipMember("two\n"), testutil::GzipMember("three\n")});
}

class InspectorTest : public ::testing::Test {
  protected:
    void SetUp() override { ResetCancel(); }
    void TearDown() override { ResetCancel(); }
};

TEST_F(InspectorTest, JsonOutputHasOneLinePerChunkThenSummary) {
    testutil::MemoryReader src(FourMembers());
    std::ostringstream out;

    Inspector inspector(InspectOptions{.format = OutputFormat::Json}, out);
    InspectOutcome outcome = inspector.Run(src);
    ASSERT_TRUE(outcome.ok());

    auto lines = JsonLines(out.str());
    ASSERT_EQ(lines.size(), 5U);
    for (std::size_t i = 0; i < 4; ++i) EXPECT_EQ(lines[i]["chunk_number"], i);
    EXPECT_EQ(lines[4]["total_chunks"], 4);
    EXPECT_EQ(outcome.summary.total_chunks, 4U);
}

TEST_F(InspectorTest, ChunkFilterShowsHeadAndTail) {
    testutil::MemoryReader src(FourMembers());
    std::ostringstream out;

    InspectOptions opt;
    opt.format = OutputFormat::Json;
    opt.chunk_filter = ParseWindowSpec("1:1");
    InspectOutcome outcome = Inspector(opt, out).Run(src);
    ASSERT_TRUE(outcome.ok());

    auto lines = JsonLines(out.str());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0]["chunk_number"], 0);
    EXPECT_EQ(lines[1]["chunk_number"], 3);
    // Summary still covers every chunk.
    EXPECT_EQ(lines[2]["total_chunks"], 4);
}

TEST_F(InspectorTest, HumanChunkFilterMarksSkippedChunks) {
    testutil::MemoryReader src(FourMembers());
    std::ostringstream out;

    InspectOptions opt;
    opt.chunk_filter = ParseWindowSpec("1:1");
    ASSERT_TRUE(Inspector(opt, out).Run(src).ok());

    const std::string text = out.str();
    EXPECT_NE(text.find("📦 #0 "), std::string::npos);
    EXPECT_EQ(text.find("📦 #1 "), std::string::npos);
    EXPECT_EQ(text.find("📦 #2 "), std::string::npos);
    EXPECT_NE(text.find("          ...\n"), std::string::npos);
    EXPECT_NE(text.find("📦 #3 "), std::string::npos);
    EXPECT_NE(text.find("├─ 📦 Chunks: 4"), std::string::npos);
}

TEST_F(InspectorTest, HeadOnlyFilterHidesRest) {
    testutil::MemoryReader src(FourMembers());
    std::ostringstream out;

    InspectOptions opt;
    opt.format = OutputFormat::Json;
    opt.chunk_filter = ParseWindowSpec("2");
    ASSERT_TRUE(Inspector(opt, out).Run(src).ok());

    auto lines = JsonLines(out.str());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[1]["chunk_number"], 1);
}

TEST_F(InspectorTest, PreviewPrintsPayloadLines) {
    testutil::MemoryReader src(testutil::GzipMember("first line\nsecond line\nthird line\n"));
    std::ostringstream out;

    InspectOptions opt;
    opt.preview = ParseWindowSpec("1:1");
    ASSERT_TRUE(Inspector(opt, out).Run(src).ok());

    const std::string text = out.str();
    EXPECT_NE(text.find("        1 │ first line\n"), std::string::npos);
    EXPECT_EQ(text.find("second line"), std::string::npos);
    EXPECT_NE(text.find("        3 │ third line\n"), std::string::npos);
}

TEST_F(InspectorTest, ErrorIsReportedAfterPartialOutput) {
    const Bytes good = testutil::GzipMember("good");
    const Bytes cut = testutil::GzipMember(testutil::RandomText(600, 4));
    testutil::MemoryReader src(testutil::Concat({good, testutil::Slice(cut, 0, cut.size() / 2)}));
    std::ostringstream out;

    InspectOutcome outcome = Inspector(InspectOptions{.format = OutputFormat::Json}, out).Run(src);
    ASSERT_FALSE(outcome.ok());
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ScanErrorKind::DecodeFailed);

    auto lines = JsonLines(out.str());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0]["chunk_number"], 0);
    EXPECT_EQ(lines[1]["error"], "decode failed");
    EXPECT_EQ(lines[1]["offset"], good.size());
    EXPECT_EQ(lines[2]["total_chunks"], 1);
}

TEST_F(InspectorTest, CancelStopsBeforeFirstChunk) {
    testutil::MemoryReader src(FourMembers());
    std::ostringstream out;

    g_cancel.store(true);
    InspectOutcome outcome = Inspector(InspectOptions{.format = OutputFormat::Json}, out).Run(src);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.summary.total_chunks, 0U);
}

TEST(OutputFormatTest, Parse) {
    EXPECT_EQ(ParseOutputFormat("human"), OutputFormat::Human);
    EXPECT_EQ(ParseOutputFormat("json"), OutputFormat::Json);
    EXPECT_FALSE(ParseOutputFormat("xml").has_value());
}

} // namespace
} // namespace gzinspect
