#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include "test_bytes.hpp"
#include "../libmetascrub/include/errors.hpp"
#include "../libmetascrub/include/file_utils.hpp"

namespace metascrub {
namespace {

namespace fs = std::filesystem;
using namespace test;

TEST(ResolveOutputTest, EmptyOutputMeansInPlace) {
    EXPECT_EQ(resolve_output("/music/a.mp3", "/music", ""), fs::path("/music/a.mp3"));
}

TEST(ResolveOutputTest, SingleFileIntoFileOrDirectory) {
    TempDir dir;
    const fs::path input = dir.write("song.wav", bytes_of("x"));

    EXPECT_EQ(resolve_output(input, input, "/out/clean.wav"), fs::path("/out/clean.wav"));
    EXPECT_EQ(resolve_output(input, input, "/out"), fs::path("/out/song.wav"));
}

TEST(ResolveOutputTest, DirectoryInputMirrorsStructure) {
    TempDir dir;
    const fs::path nested = dir.write("album/disc1/track.mp3", bytes_of("x"));

    EXPECT_EQ(resolve_output(nested, dir.path(), "/out"), fs::path("/out/album/disc1/track.mp3"));
}

TEST(ResolveOutputTest, FileOutsideBaseFallsBackToName) {
    TempDir dir;

    EXPECT_EQ(resolve_output("/elsewhere/x.png", dir.path(), "/out"), fs::path("/out/x.png"));
}

TEST(ResolveConvertedOutputTest, InPlaceSwapsExtension) {
    EXPECT_EQ(resolve_converted_output("/pics/a.png", "/pics", "", ".webp"), fs::path("/pics/a.webp"));
}

TEST(ResolveConvertedOutputTest, ExplicitFileNameIsKept) {
    TempDir dir;
    const fs::path input = dir.write("shot.png", bytes_of("x"));

    EXPECT_EQ(resolve_converted_output(input, input, "/out/final.img", ".webp"), fs::path("/out/final.img"));
    EXPECT_EQ(resolve_converted_output(input, input, "/out", ".webp"), fs::path("/out/shot.webp"));
}

TEST(ResolveConvertedOutputTest, DirectoryInputMirrorsStructure) {
    TempDir dir;
    const fs::path nested = dir.write("trip/day1/beach.webp", bytes_of("x"));

    EXPECT_EQ(resolve_converted_output(nested, dir.path(), "/out", ".png"), fs::path("/out/trip/day1/beach.png"));
}

TEST(FileUtilsTest, ReadFileReturnsContents) {
    TempDir dir;
    const Bytes content = bytes_of("RIFF....WAVE");
    const fs::path file = dir.write("in.wav", content);

    EXPECT_EQ(read_file(file), content);
}

TEST(FileUtilsTest, ReadMissingFileThrowsIoError) {
    TempDir dir;

    try {
        (void)read_file(dir.path() / "missing.png");
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.path(), dir.path() / "missing.png");
    }
}

TEST(FileUtilsTest, AtomicWriteCreatesParentsAndLeavesNoTemp) {
    TempDir dir;
    const fs::path target = dir.path() / "a" / "b" / "out.png";
    const Bytes content = filled(64, 0xAB);

    write_file_atomic(target, content);

    EXPECT_EQ(read_file(target), content);
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(target.parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(FileUtilsTest, AtomicWriteReplacesExistingFile) {
    TempDir dir;
    const fs::path target = dir.write("x.wav", filled(100, 1));

    write_file_atomic(target, filled(10, 2));

    EXPECT_EQ(read_file(target), filled(10, 2));
}

TEST(FileUtilsTest, BackupCopiesExistingFile) {
    TempDir dir;
    const fs::path target = dir.write("photo.png", bytes_of("original"));

    const fs::path backup = create_backup(target);

    EXPECT_EQ(backup, dir.path() / "photo.png.bak");
    EXPECT_EQ(read_file(backup), bytes_of("original"));
}

TEST(FileUtilsTest, BackupOfMissingFileIsNoOp) {
    TempDir dir;

    EXPECT_TRUE(create_backup(dir.path() / "nothing.png").empty());
    EXPECT_FALSE(fs::exists(dir.path() / "nothing.png.bak"));
}

} // namespace
} // namespace metascrub
