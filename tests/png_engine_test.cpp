#include <gtest/gtest.h>
#include "recording_sink.hpp"
#include "test_bytes.hpp"
#include "../libmetascrub/include/errors.hpp"
#include "../libmetascrub/include/png_engine.hpp"
#include <algorithm>
#include <sstream>

namespace metascrub {
namespace {

using namespace test;

class PngEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ihdr = png_chunk("IHDR", png_ihdr());
        idat = png_chunk("IDAT", filled(20, 0x11));
        iend = png_chunk("IEND", {});
        gama = png_chunk("gAMA", {0, 0, 0xB1, 0x8F});
        text = png_chunk("tEXt", png_text("Author", "Jane Doe"));
        time = png_chunk("tIME", {0x07, 0xE8, 1, 2, 3, 4, 5});
        exif = png_chunk("eXIf", filled(30, 0x45));
    }

    PngEngine engine;
    Bytes ihdr, idat, iend, gama, text, time, exif;
};

TEST_F(PngEngineTest, WalkProducesRecordsInFileOrder) {
    const Bytes png = png_file({ihdr, text, idat, iend});
    const auto records = engine.walk(png);

    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].id, "IHDR");
    EXPECT_EQ(records[1].id, "tEXt");
    EXPECT_EQ(records[2].id, "IDAT");
    EXPECT_EQ(records[3].id, "IEND");
    EXPECT_EQ(records[0].offset, 8u);
    EXPECT_EQ(records[0].byte_length, 13u);
    EXPECT_EQ(records[2].payload.size(), 20u);
}

TEST_F(PngEngineTest, ClassifiesByCriticalBitAndSafeList) {
    EXPECT_EQ(engine.classify("IHDR"), ChunkClass::Essential);
    EXPECT_EQ(engine.classify("PLTE"), ChunkClass::Essential);
    EXPECT_EQ(engine.classify("IDAT"), ChunkClass::Essential);
    EXPECT_EQ(engine.classify("IEND"), ChunkClass::Essential);
    EXPECT_EQ(engine.classify("tRNS"), ChunkClass::Safe);
    EXPECT_EQ(engine.classify("gAMA"), ChunkClass::Safe);
    EXPECT_EQ(engine.classify("sRGB"), ChunkClass::Safe);
    EXPECT_EQ(engine.classify("pHYs"), ChunkClass::Safe);
    EXPECT_EQ(engine.classify("tEXt"), ChunkClass::Unsafe);
    EXPECT_EQ(engine.classify("iTXt"), ChunkClass::Unsafe);
    EXPECT_EQ(engine.classify("tIME"), ChunkClass::Unsafe);
    EXPECT_EQ(engine.classify("eXIf"), ChunkClass::Unsafe);
    EXPECT_EQ(engine.classify("prVt"), ChunkClass::Unsafe);
}

TEST_F(PngEngineTest, StripAllRemovesTextTimeAndExif) {
    const Bytes png = png_file({ihdr, gama, text, time, exif, idat, iend});
    const Bytes expected = png_file({ihdr, gama, idat, iend});

    EXPECT_EQ(engine.strip(png, StripPolicy::All), expected);
}

TEST_F(PngEngineTest, StripLogsEveryRecordDecision) {
    std::vector<std::string> lines;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<RecordingSink>(lines));

    (void)engine.strip(png_file({ihdr, gama, text, idat, iend}), StripPolicy::All);
    Logger::clear_sinks();

    auto logged = [&lines](const std::string& line) {
        return std::ranges::find(lines, line) != lines.end();
    };
    EXPECT_TRUE(logged("DEBUG|png|keep IHDR (essential, 13 bytes)"));
    EXPECT_TRUE(logged("DEBUG|png|keep gAMA (safe, 4 bytes)"));
    EXPECT_TRUE(logged("DEBUG|png|drop tEXt (unsafe, 15 bytes)"));
}

TEST_F(PngEngineTest, SafeKeepsTheSameChunksAsAll) {
    const Bytes png = png_file({ihdr, gama, text, idat, time, iend});

    EXPECT_EQ(engine.strip(png, StripPolicy::Safe), engine.strip(png, StripPolicy::All));
}

TEST_F(PngEngineTest, NoneReturnsInputUnchanged) {
    const Bytes png = png_file({ihdr, text, idat, iend});

    EXPECT_EQ(engine.strip(png, StripPolicy::None), png);
}

TEST_F(PngEngineTest, NoneDoesNotWalkMalformedInput) {
    const Bytes garbage = bytes_of("definitely not a png");

    EXPECT_EQ(engine.strip(garbage, StripPolicy::None), garbage);
}

TEST_F(PngEngineTest, RetainedChunksKeepTheirCrcVerbatim) {
    Bytes bad_crc_idat = idat;
    bad_crc_idat.back() ^= 0xFF;
    const Bytes png = png_file({ihdr, text, bad_crc_idat, iend});

    EXPECT_EQ(engine.strip(png, StripPolicy::All), png_file({ihdr, bad_crc_idat, iend}));
}

TEST_F(PngEngineTest, StripAllConverges) {
    const Bytes png = png_file({ihdr, text, exif, idat, iend});
    const Bytes once = engine.strip(png, StripPolicy::All);

    EXPECT_EQ(engine.strip(once, StripPolicy::All), once);
}

TEST_F(PngEngineTest, BytesAfterIendAreDropped) {
    Bytes png = png_file({ihdr, idat, iend});
    const Bytes expected = png;
    png.insert(png.end(), {'t', 'r', 'a', 'i', 'l'});

    EXPECT_EQ(engine.strip(png, StripPolicy::All), expected);
}

TEST_F(PngEngineTest, MissingIendIsAccepted) {
    const Bytes png = png_file({ihdr, text, idat});

    EXPECT_EQ(engine.strip(png, StripPolicy::All), png_file({ihdr, idat}));
}

TEST_F(PngEngineTest, BadSignatureThrows) {
    Bytes png = png_file({ihdr, idat, iend});
    png[1] = 'X';

    EXPECT_THROW((void)engine.walk(png), DecodeError);
    EXPECT_THROW((void)engine.strip(png, StripPolicy::All), DecodeError);
}

TEST_F(PngEngineTest, OverrunningChunkLengthThrows) {
    Bytes png = png_file({ihdr, idat, iend});
    // IDAT length field sits right after signature + IHDR chunk
    const std::size_t idat_len = 8 + ihdr.size();
    png[idat_len] = 0x7F;

    EXPECT_THROW((void)engine.walk(png), DecodeError);
}

TEST_F(PngEngineTest, TruncatedChunkHeaderThrows) {
    Bytes png = png_file({ihdr, idat});
    png.insert(png.end(), {0, 0, 0});

    EXPECT_THROW((void)engine.walk(png), DecodeError);
}

TEST_F(PngEngineTest, InspectReportsChunksAndText) {
    const Bytes png = png_file({ihdr, text, idat, iend});
    std::ostringstream out;
    engine.inspect(png, out);
    const std::string report = out.str();

    EXPECT_NE(report.find("[CRITICAL] IHDR"), std::string::npos);
    EXPECT_NE(report.find("[ANCILLARY] tEXt"), std::string::npos);
    EXPECT_NE(report.find("Author: Jane Doe"), std::string::npos);
    EXPECT_NE(report.find("1x1"), std::string::npos);
    EXPECT_EQ(report.find("MISMATCH"), std::string::npos);
}

TEST_F(PngEngineTest, InspectInflatesCompressedText) {
    const std::string value = "Created with a very secret editor";
    Bytes compressed(compressBound(value.size()));
    uLongf compressed_size = compressed.size();
    ASSERT_EQ(compress(compressed.data(), &compressed_size,
                       reinterpret_cast<const Bytef*>(value.data()), value.size()), Z_OK);
    compressed.resize(compressed_size);

    Bytes ztxt = bytes_of("Software");
    ztxt.push_back(0);
    ztxt.push_back(0); // compression method
    append_bytes(ztxt, compressed);

    const Bytes png = png_file({ihdr, png_chunk("zTXt", ztxt), idat, iend});
    std::ostringstream out;
    engine.inspect(png, out);

    EXPECT_NE(out.str().find("Software: " + value), std::string::npos);
}

TEST_F(PngEngineTest, InspectFlagsCrcMismatch) {
    Bytes bad_text = text;
    bad_text.back() ^= 0x01;
    const Bytes png = png_file({ihdr, bad_text, idat, iend});
    std::ostringstream out;
    engine.inspect(png, out);

    EXPECT_NE(out.str().find("MISMATCH"), std::string::npos);
}

TEST_F(PngEngineTest, InspectDoesNotThrowOnMalformedInput) {
    const Bytes garbage = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0xFF, 0xFF};
    std::ostringstream out;

    EXPECT_NO_THROW(engine.inspect(garbage, out));
    EXPECT_NE(out.str().find("Chunk walk failed"), std::string::npos);
}

} // namespace
} // namespace metascrub
