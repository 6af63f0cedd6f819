#include "error.hpp"
#include "frame_decoder.hpp"
#include "frame_index.hpp"
#include "xtc_writer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <vector>

using namespace molly;

namespace {

std::vector<std::uint8_t> mixed_trajectory() {
    std::vector<fixture::FrameSpec> frames = fixture::make_trajectory(12, 60);
    frames[3] = fixture::make_frame(30, 4, 5);    // raw
    frames[7] = fixture::make_frame(70, 300, 6);  // larger
    return fixture::encode_trajectory(frames);
}

} // namespace

TEST(FrameIndex, EntriesAreContiguousAndCoverTheFile) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());

    ASSERT_EQ(index.size(), 12u);
    EXPECT_EQ(index[0].offset, 0u);
    for (std::size_t i = 1; i < index.size(); ++i) {
        EXPECT_EQ(index[i].offset, index[i - 1].end()) << "frame " << i;
    }
    EXPECT_EQ(index.end_offset(), bytes.size());
    EXPECT_EQ(index[3].length, kFrameHeaderBytes + 4 * 12);
}

TEST(FrameIndex, EntriesPointAtDecodableRecords) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());
    for (std::size_t i = 0; i < index.size(); ++i) {
        Frame frame = decode_frame(bytes.data() + index[i].offset, index[i].length);
        EXPECT_EQ(frame.step, static_cast<std::int64_t>(i * 10));
    }
}

TEST(FrameIndex, EmptyInput) {
    FrameIndex index = FrameIndex::build(nullptr, 0);
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.end_offset(), 0u);
}

TEST(FrameIndex, TruncatedTailFailsWholeBuild) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    bytes.resize(bytes.size() - 6);
    try {
        FrameIndex::build(bytes.data(), bytes.size());
        FAIL() << "expected TruncatedInput";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.frame(), 11u);
    }
}

TEST(FrameIndex, BadMagicInTheMiddle) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());
    fixture::put_i32be(bytes, static_cast<std::size_t>(index[5].offset), 42);
    try {
        FrameIndex::build(bytes.data(), bytes.size());
        FAIL() << "expected BadMagic";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadMagic);
        EXPECT_EQ(e.frame(), 5u);
    }
}

TEST(FrameIndex, AtChecksBounds) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());
    EXPECT_NO_THROW(index.at(11));
    try {
        index.at(12);
        FAIL() << "expected IndexOutOfRange";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IndexOutOfRange);
    }
}

TEST(FrameIndex, RefreshAfterGrowthEqualsRebuild) {
    std::vector<fixture::FrameSpec> frames = fixture::make_trajectory(10, 50);
    std::vector<std::uint8_t> bytes = fixture::encode_trajectory(
        std::vector<fixture::FrameSpec>(frames.begin(), frames.begin() + 6));
    FrameIndex before = FrameIndex::build(bytes.data(), bytes.size());

    std::vector<std::uint8_t> grown = fixture::encode_trajectory(frames);
    FrameIndex refreshed = before.refreshed(grown.data(), grown.size());
    EXPECT_EQ(refreshed.size(), 10u);
    EXPECT_EQ(refreshed, FrameIndex::build(grown.data(), grown.size()));

    // unchanged file: refresh is idempotent
    EXPECT_EQ(refreshed.refreshed(grown.data(), grown.size()), refreshed);
}

TEST(FrameIndex, RefreshAfterRewriteRebuilds) {
    std::vector<std::uint8_t> bytes = fixture::encode_trajectory(fixture::make_trajectory(6, 50));
    FrameIndex before = FrameIndex::build(bytes.data(), bytes.size());

    // a different file of the same name: records of another size
    std::vector<std::uint8_t> rewritten = fixture::encode_trajectory(fixture::make_trajectory(9, 400));
    FrameIndex refreshed = before.refreshed(rewritten.data(), rewritten.size());
    EXPECT_EQ(refreshed, FrameIndex::build(rewritten.data(), rewritten.size()));

    // a shorter file
    std::vector<std::uint8_t> shrunk(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(before[2].end()));
    EXPECT_EQ(before.refreshed(shrunk.data(), shrunk.size()).size(), 3u);
}

TEST(FrameIndex, FailedRefreshLeavesIndexUntouched) {
    std::vector<fixture::FrameSpec> frames = fixture::make_trajectory(8, 50);
    std::vector<std::uint8_t> bytes = fixture::encode_trajectory(
        std::vector<fixture::FrameSpec>(frames.begin(), frames.begin() + 4));
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());

    std::vector<std::uint8_t> grown = fixture::encode_trajectory(frames);
    grown.resize(grown.size() - 10);
    EXPECT_THROW(index.refreshed(grown.data(), grown.size()), XtcError);
    EXPECT_EQ(index.size(), 4u);
}

TEST(FrameIndex, CacheRoundTrip) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());
    const std::string cache = fixture::temp_path("index.cache");

    index.save(cache, bytes.size());
    FrameIndex loaded = FrameIndex::load(cache, bytes.data(), bytes.size());
    EXPECT_EQ(loaded, index);
}

TEST(FrameIndex, CacheForAnotherFileIsRejected) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    FrameIndex index = FrameIndex::build(bytes.data(), bytes.size());
    const std::string cache = fixture::temp_path("index.cache");
    index.save(cache, bytes.size());

    // different size
    std::vector<std::uint8_t> longer = bytes;
    std::vector<std::uint8_t> extra = fixture::encode_frame(fixture::make_frame(999, 20, 1));
    longer.insert(longer.end(), extra.begin(), extra.end());
    try {
        FrameIndex::load(cache, longer.data(), longer.size());
        FAIL() << "expected CorruptFrame";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptFrame);
    }

    // same size, first record damaged
    std::vector<std::uint8_t> damaged = bytes;
    fixture::put_i32be(damaged, 0, 7);
    try {
        FrameIndex::load(cache, damaged.data(), damaged.size());
        FAIL() << "expected CorruptFrame";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptFrame);
        EXPECT_EQ(e.frame(), 0u);
    }
}

TEST(FrameIndex, MissingOrGarbageCache) {
    std::vector<std::uint8_t> bytes = mixed_trajectory();
    try {
        FrameIndex::load(fixture::temp_path("does_not_exist.cache"), bytes.data(), bytes.size());
        FAIL() << "expected FileNotFound";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FileNotFound);
    }

    const std::string garbage = fixture::temp_path("garbage.cache");
    fixture::write_file(garbage, {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'n', 'd', 'e', 'x'});
    try {
        FrameIndex::load(garbage, bytes.data(), bytes.size());
        FAIL() << "expected CorruptFrame";
    } catch (const XtcError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptFrame);
    }
}
