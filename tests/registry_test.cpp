#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include "test_bytes.hpp"
#include "../libmetascrub/include/mime_detector.hpp"
#include "../libmetascrub/include/processor_registry.hpp"

namespace metascrub {
namespace {

using namespace test;

class ProcessorRegistryTest : public ::testing::Test {
protected:
    ProcessorRegistry registry;
    TempDir dir;
};

TEST_F(ProcessorRegistryTest, RegistersOneProcessorPerFormat) {
    ASSERT_EQ(registry.all().size(), 4u);
    EXPECT_EQ(registry.all()[0]->get_format(), MediaFormat::Png);
    EXPECT_EQ(registry.all()[1]->get_format(), MediaFormat::Webp);
    EXPECT_EQ(registry.all()[2]->get_format(), MediaFormat::Wav);
    EXPECT_EQ(registry.all()[3]->get_format(), MediaFormat::Mp3);
}

TEST_F(ProcessorRegistryTest, FindsByExtensionIgnoringCase) {
    auto procs = registry.find_by_extension(".PNG");
    ASSERT_EQ(procs.size(), 1u);
    EXPECT_EQ(procs.front()->get_format(), MediaFormat::Png);

    procs = registry.find_by_extension(".Wave");
    ASSERT_EQ(procs.size(), 1u);
    EXPECT_EQ(procs.front()->get_format(), MediaFormat::Wav);

    EXPECT_TRUE(registry.find_by_extension(".jpg").empty());
    EXPECT_TRUE(registry.find_by_extension("png").empty());
    EXPECT_TRUE(registry.find_by_extension("").empty());
}

TEST_F(ProcessorRegistryTest, FindsByMime) {
    auto procs = registry.find_by_mime("audio/x-wav");
    ASSERT_EQ(procs.size(), 1u);
    EXPECT_EQ(procs.front()->get_format(), MediaFormat::Wav);

    procs = registry.find_by_mime("audio/mpeg");
    ASSERT_EQ(procs.size(), 1u);
    EXPECT_EQ(procs.front()->get_format(), MediaFormat::Mp3);

    EXPECT_TRUE(registry.find_by_mime("video/mp4").empty());
}

TEST_F(ProcessorRegistryTest, ContentWinsOverExtension) {
    // a WAV file with a misleading extension
    const auto path = dir.write("recording.png",
                                riff_file("WAVE", {riff_chunk("fmt ", wav_fmt()), riff_chunk("data", filled(64, 0))}));
    std::string mime;

    const IProcessor* processor = registry.find_for(path, &mime);

    ASSERT_NE(processor, nullptr);
    EXPECT_EQ(processor->get_format(), MediaFormat::Wav);
    EXPECT_NE(mime.find("wav"), std::string::npos);
}

TEST_F(ProcessorRegistryTest, FallsBackToExtension) {
    const auto path = dir.write("notes.mp3", bytes_of("plain text that libmagic cannot place"));

    const IProcessor* processor = registry.find_for(path);

    ASSERT_NE(processor, nullptr);
    EXPECT_EQ(processor->get_format(), MediaFormat::Mp3);
}

TEST_F(ProcessorRegistryTest, UnsupportedFileHasNoProcessor) {
    const auto path = dir.write("notes.txt", bytes_of("hello"));

    EXPECT_EQ(registry.find_for(path), nullptr);
}

TEST_F(ProcessorRegistryTest, FindsByFormat) {
    ASSERT_NE(registry.find_by_format(MediaFormat::Webp), nullptr);
    EXPECT_EQ(registry.find_by_format(MediaFormat::Webp)->get_format(), MediaFormat::Webp);
    EXPECT_EQ(registry.find_by_format(MediaFormat::Unknown), nullptr);
}

TEST_F(ProcessorRegistryTest, FindsForDataByContentThenExtension) {
    const Bytes wav = riff_file("WAVE", {riff_chunk("fmt ", wav_fmt()), riff_chunk("data", filled(64, 0))});
    std::string mime;

    const IProcessor* by_content = registry.find_for_data(wav, ".png", &mime);
    ASSERT_NE(by_content, nullptr);
    EXPECT_EQ(by_content->get_format(), MediaFormat::Wav);
    EXPECT_EQ(mime_to_format.at(mime), MediaFormat::Wav);

    const IProcessor* by_name = registry.find_for_data(bytes_of("plain text that libmagic cannot place"), ".MP3");
    ASSERT_NE(by_name, nullptr);
    EXPECT_EQ(by_name->get_format(), MediaFormat::Mp3);

    EXPECT_EQ(registry.find_for_data(bytes_of("hello"), ".txt"), nullptr);
}

TEST(MimeDetectorTest, DetectsPngFromBytes) {
    const Bytes png = png_file({png_chunk("IHDR", png_ihdr(2, 2)), png_chunk("IEND", {})});

    EXPECT_EQ(MimeDetector::detect(png), "image/png");
}

} // namespace
} // namespace metascrub
