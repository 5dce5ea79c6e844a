#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include "test_bytes.hpp"
#include "../libmetascrub/include/events.hpp"
#include "../libmetascrub/include/file_utils.hpp"
#include "../libmetascrub/include/png_engine.hpp"
#include "../libmetascrub/include/processor_executor.hpp"
#include <webp/decode.h>
#include <zlib.h>
#include <map>
#include <set>

namespace metascrub {
namespace {

namespace fs = std::filesystem;
using namespace test;

/// Outcome of each file as seen through the bus.
struct Outcomes {
    std::map<fs::path, std::string> kind;
    std::map<fs::path, std::string> detail;
    std::map<fs::path, FileProcessCompleteEvent> completed;
    std::set<fs::path> started;
    size_t starts = 0;
    size_t unannounced = 0; // results for a file with no Start before them

    void finish(const fs::path& path, const std::string& what) {
        if (!started.contains(path)) ++unannounced;
        kind[path] = what;
    }

    void attach(EventBus& bus) {
        bus.subscribe<FileProcessStartEvent>([this](const FileProcessStartEvent& e) {
            ++starts;
            started.insert(e.path);
        });
        bus.subscribe<FileProcessCompleteEvent>([this](const FileProcessCompleteEvent& e) {
            finish(e.path, "complete");
            completed[e.path] = e;
        });
        bus.subscribe<FileProcessSkippedEvent>([this](const FileProcessSkippedEvent& e) {
            finish(e.path, "skipped");
            detail[e.path] = e.reason;
        });
        bus.subscribe<FileProcessErrorEvent>([this](const FileProcessErrorEvent& e) {
            finish(e.path, "error");
            detail[e.path] = e.error_message;
        });
    }
};

/// A decodable 8-bit RGB gradient PNG carrying a tEXt chunk.
Bytes gradient_png(const std::uint32_t width, const std::uint32_t height) {
    Bytes raw;
    for (std::uint32_t y = 0; y < height; ++y) {
        raw.push_back(0);
        for (std::uint32_t x = 0; x < width; ++x) {
            raw.insert(raw.end(), {static_cast<std::uint8_t>(x * 8), static_cast<std::uint8_t>(y * 8), 90});
        }
    }
    Bytes compressed(compressBound(static_cast<uLong>(raw.size())));
    uLongf compressed_size = compressed.size();
    compress2(compressed.data(), &compressed_size, raw.data(), static_cast<uLong>(raw.size()), 6);
    compressed.resize(compressed_size);

    return png_file({png_chunk("IHDR", png_ihdr(width, height)),
                     png_chunk("tEXt", png_text("Author", "Jane Roe")),
                     png_chunk("IDAT", compressed),
                     png_chunk("IEND", {})});
}

class ProcessorExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clean_wav = riff_file("WAVE", {riff_chunk("fmt ", wav_fmt()), riff_chunk("data", filled(256, 0x80))});
        tagged_wav = riff_file("WAVE", {riff_chunk("fmt ", wav_fmt()),
                                        riff_chunk("LIST", wav_info_list({{"IART", "Someone"}})),
                                        riff_chunk("iXML", filled(300, 'x')),
                                        riff_chunk("data", filled(256, 0x80))});
        outcomes.attach(bus);
    }

    std::vector<InputFile> inputs_in(const fs::path& base, std::initializer_list<fs::path> files) const {
        std::vector<InputFile> result;
        for (const auto& f : files) result.push_back({f, base});
        return result;
    }

    ProcessorRegistry registry;
    EventBus bus;
    Outcomes outcomes;
    TempDir dir;
    Bytes clean_wav, tagged_wav;
};

TEST_F(ProcessorExecutorTest, StripsInPlaceAndReportsEveryFile) {
    const auto tagged = dir.write("tagged.wav", tagged_wav);
    const auto clean = dir.write("clean.wav", clean_wav);
    const auto broken = dir.write("broken.wav", bytes_of("RIFF-but-not-a-wave"));
    const auto text = dir.write("readme.txt", bytes_of("hello"));

    ProcessorExecutor executor(registry, ProcessingConfig{}, "", bus, 2);
    executor.process(inputs_in(dir.path(), {tagged, clean, broken, text}));

    EXPECT_EQ(outcomes.starts, 4u);
    EXPECT_EQ(outcomes.kind[tagged], "complete");
    EXPECT_EQ(outcomes.kind[clean], "skipped");
    EXPECT_EQ(outcomes.detail[clean], "No size improvement");
    EXPECT_EQ(outcomes.kind[broken], "error");
    EXPECT_EQ(outcomes.kind[text], "skipped");
    EXPECT_EQ(outcomes.detail[text], "Unsupported format");
    EXPECT_EQ(outcomes.unannounced, 0u);

    EXPECT_EQ(read_file(tagged), clean_wav);
    EXPECT_EQ(read_file(clean), clean_wav);
    const auto& done = outcomes.completed[tagged];
    EXPECT_TRUE(done.replaced);
    EXPECT_EQ(done.original_size, tagged_wav.size());
    EXPECT_EQ(done.new_size, clean_wav.size());
}

TEST_F(ProcessorExecutorTest, SafePolicyKeepsInfoList) {
    const auto tagged = dir.write("tagged.wav", tagged_wav);
    ProcessingConfig config;
    config.strip = StripPolicy::Safe;

    ProcessorExecutor executor(registry, config, "", bus, 1);
    executor.process(inputs_in(tagged, {tagged}));

    const Bytes out = read_file(tagged);
    EXPECT_TRUE(contains(out, "Someone"));
    EXPECT_FALSE(contains(out, "iXML"));
}

TEST_F(ProcessorExecutorTest, DryRunWritesNothing) {
    const auto tagged = dir.write("tagged.wav", tagged_wav);
    ProcessingConfig config;
    config.dry_run = true;

    ProcessorExecutor executor(registry, config, "", bus, 1);
    executor.process(inputs_in(tagged, {tagged}));

    EXPECT_EQ(outcomes.kind[tagged], "complete");
    EXPECT_FALSE(outcomes.completed[tagged].replaced);
    EXPECT_EQ(read_file(tagged), tagged_wav);
}

TEST_F(ProcessorExecutorTest, OutputDirectoryMirrorsInputTree) {
    const auto nested = dir.write("in/session/take1.wav", tagged_wav);
    const fs::path out_dir = dir.path() / "out";

    ProcessorExecutor executor(registry, ProcessingConfig{}, out_dir, bus, 1);
    executor.process(inputs_in(dir.path() / "in", {nested}));

    EXPECT_EQ(read_file(out_dir / "session" / "take1.wav"), clean_wav);
    EXPECT_EQ(read_file(nested), tagged_wav);
    EXPECT_EQ(outcomes.completed[nested].output, out_dir / "session" / "take1.wav");
}

TEST_F(ProcessorExecutorTest, BackupKeepsOriginal) {
    const auto tagged = dir.write("tagged.wav", tagged_wav);
    ProcessingConfig config;
    config.backup = true;

    ProcessorExecutor executor(registry, config, "", bus, 1);
    executor.process(inputs_in(tagged, {tagged}));

    EXPECT_EQ(read_file(tagged), clean_wav);
    EXPECT_EQ(read_file(dir.path() / "tagged.wav.bak"), tagged_wav);
}

TEST_F(ProcessorExecutorTest, StopBeforeProcessingQueuesNothing) {
    const auto tagged = dir.write("tagged.wav", tagged_wav);

    ProcessorExecutor executor(registry, ProcessingConfig{}, "", bus, 1);
    executor.request_stop();
    executor.process(inputs_in(tagged, {tagged}));

    EXPECT_TRUE(executor.is_stopped());
    EXPECT_EQ(outcomes.starts, 0u);
    EXPECT_EQ(read_file(tagged), tagged_wav);
}

TEST_F(ProcessorExecutorTest, StopDuringAFileAnnouncesItAndDiscardsTheQueue) {
    const auto first = dir.write("first.wav", tagged_wav);
    const auto second = dir.write("second.wav", tagged_wav);

    ProcessorExecutor executor(registry, ProcessingConfig{}, "", bus, 1);
    bus.subscribe<FileProcessStartEvent>([&executor](const FileProcessStartEvent&) {
        executor.request_stop();
    });
    executor.process(inputs_in(dir.path(), {first, second}));

    EXPECT_EQ(outcomes.starts, 1u);
    EXPECT_EQ(outcomes.unannounced, 0u);
    EXPECT_EQ(outcomes.kind[first], "skipped");
    EXPECT_EQ(outcomes.detail[first], "Interrupted");
    EXPECT_FALSE(outcomes.kind.contains(second));
    EXPECT_EQ(read_file(first), tagged_wav);
    EXPECT_EQ(read_file(second), tagged_wav);
}

TEST_F(ProcessorExecutorTest, SafePolicyRemovesPrivateFramesFromMp3) {
    const Bytes tag = id3v23_tag({
        id3v23_text_frame("TIT2", "Night Drive"),
        id3v23_comment_frame("ripped by jdoe"),
        id3v23_priv_frame("com.example.editor", bytes_of("C:\\Users\\jdoe\\session.prproj")),
    });
    const Bytes mp3 = concat({tag, fake_audio(600)});
    const auto song = dir.write("song.mp3", mp3);
    ProcessingConfig config;
    config.strip = StripPolicy::Safe;

    ProcessorExecutor executor(registry, config, "", bus, 1);
    executor.process(inputs_in(song, {song}));

    EXPECT_EQ(outcomes.kind[song], "complete");
    const Bytes out = read_file(song);
    EXPECT_LT(out.size(), mp3.size());
    EXPECT_TRUE(contains(out, "Night Drive"));
    EXPECT_FALSE(contains(out, "COMM"));
    EXPECT_FALSE(contains(out, "PRIV"));
    EXPECT_FALSE(contains(out, "jdoe"));
}

TEST_F(ProcessorExecutorTest, ConvertsPngToWebpBesideTheSource) {
    const auto photo = dir.write("photo.png", gradient_png(16, 16));

    ProcessorExecutor executor(registry, ProcessingConfig{}, "", bus, 1);
    executor.set_conversion_target(MediaFormat::Webp);
    executor.process(inputs_in(photo, {photo}));

    ASSERT_EQ(outcomes.kind[photo], "complete");
    const fs::path converted = dir.path() / "photo.webp";
    EXPECT_EQ(outcomes.completed[photo].output, converted);
    EXPECT_TRUE(fs::exists(photo));

    const Bytes webp = read_file(converted);
    int width = 0;
    int height = 0;
    ASSERT_NE(WebPGetInfo(webp.data(), webp.size(), &width, &height), 0);
    EXPECT_EQ(width, 16);
    EXPECT_EQ(height, 16);
    EXPECT_FALSE(contains(webp, "Jane Roe"));
}

TEST_F(ProcessorExecutorTest, ConvertsWebpToPngInOutputDirectory) {
    const auto photo = dir.write("in/photo.png", gradient_png(8, 8));
    ProcessorExecutor to_webp(registry, ProcessingConfig{}, "", bus, 1);
    to_webp.set_conversion_target(MediaFormat::Webp);
    to_webp.process(inputs_in(photo, {photo}));
    const fs::path webp = dir.path() / "in" / "photo.webp";
    ASSERT_TRUE(fs::exists(webp));

    ProcessingConfig config;
    config.no_lossy = true;
    ProcessorExecutor to_png(registry, config, dir.path() / "out", bus, 1);
    to_png.set_conversion_target(MediaFormat::Png);
    to_png.process(inputs_in(dir.path() / "in", {webp}));

    ASSERT_EQ(outcomes.kind[webp], "complete");
    const Bytes png = read_file(dir.path() / "out" / "photo.png");
    EXPECT_TRUE(has_png_signature(png));
}

TEST_F(ProcessorExecutorTest, ConvertSkipsAudioAndSameFormat) {
    const auto song = dir.write("song.wav", tagged_wav);
    const auto photo = dir.write("photo.png", gradient_png(4, 4));

    ProcessorExecutor executor(registry, ProcessingConfig{}, "", bus, 1);
    executor.set_conversion_target(MediaFormat::Png);
    executor.process(inputs_in(dir.path(), {song, photo}));

    EXPECT_EQ(outcomes.kind[song], "skipped");
    EXPECT_EQ(outcomes.detail[song], "Unsupported format");
    EXPECT_EQ(outcomes.kind[photo], "skipped");
    EXPECT_EQ(outcomes.detail[photo], "Already png");
    EXPECT_EQ(outcomes.unannounced, 0u);
    EXPECT_EQ(read_file(song), tagged_wav);
}

TEST_F(ProcessorExecutorTest, ConvertDryRunWritesNothing) {
    const auto photo = dir.write("photo.png", gradient_png(8, 8));
    ProcessingConfig config;
    config.dry_run = true;

    ProcessorExecutor executor(registry, config, "", bus, 1);
    executor.set_conversion_target(MediaFormat::Webp);
    executor.process(inputs_in(photo, {photo}));

    EXPECT_EQ(outcomes.kind[photo], "complete");
    EXPECT_FALSE(outcomes.completed[photo].replaced);
    EXPECT_FALSE(fs::exists(dir.path() / "photo.webp"));
}

} // namespace
} // namespace metascrub
