#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include "test_bytes.hpp"
#include "../metascrub_cli/src/utils/file_scanner.hpp"
#include "../metascrub_cli/src/report/report_generator.hpp"
#include <algorithm>

namespace metascrub {
namespace {

namespace fs = std::filesystem;
using namespace test;

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const Bytes any = bytes_of("x");
        dir.write("a.png", any);
        dir.write("b.MP3", any);
        dir.write("notes.txt", any);
        dir.write(".DS_Store", any);
        dir.write("._a.png", any);
        dir.write("sub/c.wav", any);
        dir.write("sub/deeper/d.webp", any);
    }

    static std::vector<std::string> names(const std::vector<InputFile>& files) {
        std::vector<std::string> result;
        for (const auto& f : files) result.push_back(f.path.filename().string());
        return result;
    }

    TempDir dir;
};

TEST_F(FileScannerTest, TopLevelOnlyWithoutRecursion) {
    const auto files = collect_input_files({dir.path()}, false);

    EXPECT_EQ(names(files), (std::vector<std::string>{"a.png", "b.MP3"}));
    for (const auto& f : files) EXPECT_EQ(f.base, dir.path());
}

TEST_F(FileScannerTest, RecursiveWalkFindsNestedFiles) {
    const auto files = collect_input_files({dir.path()}, true);
    auto found = names(files);
    std::ranges::sort(found);

    EXPECT_EQ(found, (std::vector<std::string>{"a.png", "b.MP3", "c.wav", "d.webp"}));
}

TEST_F(FileScannerTest, ExplicitFilesAreKeptAsGiven) {
    const auto files = collect_input_files({dir.path() / "notes.txt", dir.path() / ".DS_Store",
                                            dir.path() / "missing.png"}, false);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, dir.path() / "notes.txt");
    EXPECT_EQ(files[0].base, dir.path() / "notes.txt");
}

TEST(JunkFileTest, RecognisesOsMetadataFiles) {
    EXPECT_TRUE(is_junk(".DS_Store"));
    EXPECT_TRUE(is_junk("/x/Desktop.ini"));
    EXPECT_TRUE(is_junk("._song.mp3"));
    EXPECT_FALSE(is_junk("song.mp3"));
}

TEST(ReportTest, CsvEscapeQuotesWhenNeeded) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(ReportTest, CsvExportWritesHeaderAndRows) {
    TempDir dir;
    Result ok;
    ok.path = "one.png";
    ok.mime = "image/png";
    ok.size_before = 2000;
    ok.size_after = 1000;
    ok.success = true;
    ok.replaced = true;
    Result failed;
    failed.path = "two,three.wav";
    failed.success = false;
    failed.error_msg = "Not a RIFF/WAVE file";

    const fs::path csv = dir.path() / "report.csv";
    ASSERT_TRUE(export_csv_report({ok, failed}, csv, 1.5));

    const auto content = read_file(csv);
    const std::string text(content.begin(), content.end());
    EXPECT_EQ(text.rfind("File,MIME,Before(B),After(B),Delta(%),Time(s),Result,Error\n", 0), 0u);
    EXPECT_NE(text.find("one.png,image/png,2000,1000,50.00,0.00,OK,\n"), std::string::npos);
    EXPECT_NE(text.find("\"two,three.wav\""), std::string::npos);
    EXPECT_NE(text.find("FAIL,Not a RIFF/WAVE file"), std::string::npos);
}

} // namespace
} // namespace metascrub
