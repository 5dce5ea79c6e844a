#include <gtest/gtest.h>
#include "recording_sink.hpp"
#include "test_bytes.hpp"
#include "../libmetascrub/include/byte_io.hpp"
#include "../libmetascrub/include/event_bus.hpp"
#include "../libmetascrub/include/events.hpp"
#include "../libmetascrub/include/inspect_util.hpp"
#include "../libmetascrub/include/logger.hpp"
#include "../libmetascrub/include/media_format.hpp"
#include "../libmetascrub/include/processing_config.hpp"
#include "../libmetascrub/include/random_utils.hpp"
#include "../libmetascrub/include/strip_policy.hpp"
#include "../libmetascrub/include/thread_pool.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>

namespace metascrub {
namespace {

using namespace test;

// --- byte_io ---

TEST(ByteIoTest, SynchsafeRoundTripAtBoundaries) {
    for (const std::uint32_t v : {0u, 1u, 127u, 128u, 16383u, 16384u, 0x0ABCDEFu, kMaxSynchsafe}) {
        Bytes out;
        append_synchsafe(out, v);
        ASSERT_EQ(out.size(), 4u);
        for (const auto b : out) EXPECT_EQ(b & 0x80, 0);
        EXPECT_EQ(decode_synchsafe(out, 0), v);
    }
}

TEST(ByteIoTest, SynchsafeIgnoresHighBits) {
    const Bytes raw = {0xFF, 0xFF, 0xFF, 0xFF};

    EXPECT_EQ(decode_synchsafe(raw, 0), kMaxSynchsafe);
}

TEST(ByteIoTest, SynchsafeRejectsOversizedValue) {
    Bytes out;

    EXPECT_THROW(append_synchsafe(out, kMaxSynchsafe + 1), std::out_of_range);
}

TEST(ByteIoTest, ReadsBothEndiannesses) {
    const Bytes data = {0x12, 0x34, 0x56, 0x78};

    EXPECT_EQ(read_u32_be(data, 0), 0x12345678u);
    EXPECT_EQ(read_u32_le(data, 0), 0x78563412u);
    EXPECT_EQ(read_u16_be(data, 2), 0x5678u);
    EXPECT_EQ(read_u16_le(data, 2), 0x7856u);
}

TEST(ByteIoTest, OutOfBoundsReadThrowsDecodeError) {
    const Bytes data = {1, 2, 3};

    EXPECT_THROW((void)read_u32_be(data, 0), DecodeError);
    EXPECT_THROW((void)read_u16_le(data, 2), DecodeError);
    EXPECT_THROW((void)tag_view(data, 0), DecodeError);
}

TEST(ByteIoTest, PatchOverwritesInPlace) {
    Bytes data(8, 0);
    patch_u32_le(data, 4, 0xA1B2C3D4u);

    EXPECT_EQ(read_u32_le(data, 4), 0xA1B2C3D4u);
    EXPECT_THROW(patch_u32_le(data, 6, 1), DecodeError);
}

TEST(ByteIoTest, HasTagAtChecksBounds) {
    const Bytes data = bytes_of("RIFFxxxx");

    EXPECT_TRUE(has_tag_at(data, 0, "RIFF"));
    EXPECT_FALSE(has_tag_at(data, 6, "RIFF"));
    EXPECT_FALSE(has_tag_at(data, 100, "R"));
}

// --- policy, format, config ---

TEST(StripPolicyTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parse_strip_policy("all"), StripPolicy::All);
    EXPECT_EQ(parse_strip_policy("SAFE"), StripPolicy::Safe);
    EXPECT_EQ(parse_strip_policy("None"), StripPolicy::None);
    EXPECT_FALSE(parse_strip_policy("some").has_value());
    EXPECT_FALSE(parse_strip_policy("").has_value());
    EXPECT_STREQ(strip_policy_to_string(StripPolicy::Safe), "safe");
}

TEST(MediaFormatTest, ParsesExtensions) {
    EXPECT_EQ(parse_media_format(".PNG"), MediaFormat::Png);
    EXPECT_EQ(parse_media_format("webp"), MediaFormat::Webp);
    EXPECT_EQ(parse_media_format(".wave"), MediaFormat::Wav);
    EXPECT_EQ(parse_media_format(".Mp3"), MediaFormat::Mp3);
    EXPECT_FALSE(parse_media_format(".jpg").has_value());
    EXPECT_EQ(media_format_to_string(MediaFormat::Wav), "wav");
    EXPECT_EQ(mime_to_format.at("audio/x-wav"), MediaFormat::Wav);
}

TEST(ProcessingConfigTest, SpeedMapsOntoEffort) {
    EXPECT_EQ(speed_to_effort(1, 9), 9);
    EXPECT_EQ(speed_to_effort(10, 9), 0);
    EXPECT_EQ(speed_to_effort(3, 9), 7);
    EXPECT_EQ(speed_to_effort(1, 6), 6);
    EXPECT_EQ(speed_to_effort(10, 6), 0);
    EXPECT_EQ(speed_to_effort(-5, 9), 9);
    EXPECT_EQ(speed_to_effort(42, 9), 0);
}

// --- inspect_util ---

TEST(InspectUtilTest, FormatsSizes) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(3 * 1024 * 1024), "3.00 MB");
}

TEST(InspectUtilTest, ShowsTextOrHexPreview) {
    EXPECT_EQ(format_unknown_data(bytes_of("hello world")), "\"hello world\"");
    EXPECT_EQ(format_unknown_data({}), "<empty>");

    const std::string hex = format_unknown_data(Bytes{0x00, 0x01, 0xFE, 0xFF});
    EXPECT_EQ(hex, "<binary: 00 01 FE FF (4 bytes)>");
}

TEST(InspectUtilTest, MarksTextWithPaths) {
    const std::string shown = format_unknown_data(bytes_of("saved from /home/alex/mix.wav"));

    EXPECT_NE(shown.find("[!] CONTAINS FILE PATHS"), std::string::npos);
}

TEST(InspectUtilTest, ExtractsEmbeddedPaths) {
    const auto paths = extract_file_paths(
        bytes_of("project=D:\\Edits\\cut.prproj\nsrc=/Users/sam/Desktop/raw.mov\n"));

    ASSERT_FALSE(paths.empty());
    EXPECT_NE(std::ranges::find(paths, std::string("D:\\Edits\\cut.prproj")), paths.end());
    EXPECT_NE(std::ranges::find(paths, std::string("/Users/sam/Desktop/raw.mov")), paths.end());
    EXPECT_TRUE(std::ranges::is_sorted(paths));
}

TEST(InspectUtilTest, NoPathsInPlainText) {
    EXPECT_TRUE(extract_file_paths(bytes_of("just some words")).empty());
}

TEST(InspectUtilTest, TrimsFixedFields) {
    Bytes field = bytes_of("Title   ");
    field.resize(30, 0);

    EXPECT_EQ(trim_fixed_field(field), "Title");
    EXPECT_EQ(trim_fixed_field(Bytes{0xE9, 't', 0xE9}), "\xC3\xA9t\xC3\xA9");
}

// --- logger ---

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
}

TEST(LoggerTest, DeliversToEverySink) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<RecordingSink>(first));
    Logger::add_sink(std::make_unique<RecordingSink>(second));

    Logger::log(LogLevel::Warning, "odd chunk", "wav");
    Logger::log(LogLevel::Info, "default tag");
    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "discarded");

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0], "WARN|wav|odd chunk");
    EXPECT_EQ(first[1], "INFO|metascrub|default tag");
    EXPECT_EQ(second, first);
}

// --- event bus ---

TEST(EventBusTest, DeliversByEventType) {
    EventBus bus;
    std::vector<std::string> completed;
    int errors = 0;

    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        completed.push_back(e.path.string());
    });
    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent&) { ++errors; });

    EXPECT_EQ(bus.publish(FileProcessCompleteEvent{"a.png", "a.png", 10, 5, true, {}}), 1u);
    EXPECT_EQ(bus.publish(FileProcessSkippedEvent{"b.png", "No size improvement"}), 0u);
    EXPECT_EQ(bus.publish(FileProcessErrorEvent{"c.png", "boom"}), 1u);

    EXPECT_EQ(completed, std::vector<std::string>{"a.png"});
    EXPECT_EQ(errors, 1);
    EXPECT_EQ(bus.subscriber_count<FileProcessSkippedEvent>(), 0u);
}

TEST(EventBusTest, SerialisesConcurrentPublishers) {
    EventBus bus;
    size_t count = 0; // guarded by the bus lock
    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent&) { ++count; });

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&bus] {
                for (int i = 0; i < 250; ++i) bus.publish(FileProcessSkippedEvent{"x", "r"});
            });
        }
    }

    EXPECT_EQ(count, 1000u);
}

// --- thread pool, random ---

TEST(ThreadPoolTest, RunsEveryTaskBeforeWaitIdleReturns) {
    ThreadPool pool(3);
    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        pool.enqueue([&sum, i](const std::stop_token&) { sum += i; });
    }
    pool.wait_idle();

    EXPECT_EQ(sum.load(), 5050);
}

TEST(ThreadPoolTest, FuturesCarryResults) {
    ThreadPool pool(2);
    auto f = pool.enqueue([](const std::stop_token&) { return 6 * 7; });

    EXPECT_EQ(f.get(), 42);
}

TEST(ThreadPoolTest, RefusesWorkAfterStop) {
    ThreadPool pool(1);
    pool.request_stop();

    EXPECT_THROW(pool.enqueue([](const std::stop_token&) {}), std::runtime_error);
    pool.wait_idle();
}

TEST(RandomUtilsTest, SuffixesDiffer) {
    const std::string a = RandomUtils::random_suffix();
    const std::string b = RandomUtils::random_suffix();

    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::ranges::all_of(a, [](const char c) { return std::isxdigit(static_cast<unsigned char>(c)); }));
}

} // namespace
} // namespace metascrub
