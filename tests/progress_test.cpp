/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/progress.hpp"
#include <cstring>
#include <gtest/gtest.h>

using namespace mediarun;

namespace {

std::vector<std::string> feedAll(RecordSplitter& splitter, const std::string& bytes) {
    return splitter.feed(bytes.data(), bytes.size());
}

}

TEST(RecordSplitterTest, SplitsOnCarriageReturnAndLineFeed) {
    RecordSplitter splitter;
    auto records = feedAll(splitter, "abc\r123\n456");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], "abc");
    EXPECT_EQ(records[1], "123");
    EXPECT_EQ(splitter.pending(), 3u);

    auto rest = splitter.finish();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, "456");
    EXPECT_FALSE(splitter.finish().has_value());
}

TEST(RecordSplitterTest, KeepsPartialRecordsAcrossReads) {
    RecordSplitter splitter;
    EXPECT_TRUE(feedAll(splitter, "time=00:0").empty());
    EXPECT_TRUE(feedAll(splitter, "0:01.00").empty());
    auto records = feedAll(splitter, " speed=1x\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], "time=00:00:01.00 speed=1x");
    EXPECT_EQ(splitter.pending(), 0u);
}

TEST(RecordSplitterTest, SkipsEmptyRecords) {
    RecordSplitter splitter;
    auto records = feedAll(splitter, "\r\n\r\nline\n\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], "line");
}

TEST(DecodeLossyTest, ReplacesInvalidSequences) {
    EXPECT_EQ(decodeLossy("ok\xff"), "ok\xEF\xBF\xBD");
    EXPECT_EQ(decodeLossy("\xC3"), "\xEF\xBF\xBD");
    EXPECT_EQ(decodeLossy("h\xC3\xA9llo"), "h\xC3\xA9llo");
    EXPECT_EQ(decodeLossy(""), "");
}

TEST(ProgressParserTest, ComputesPercentFromPositionAndDuration) {
    EXPECT_EQ(ProgressParser::computePercent(5.0, 10.0), 50);
    EXPECT_EQ(ProgressParser::computePercent(9.99, 10.0), 99);
    EXPECT_EQ(ProgressParser::computePercent(12.0, 10.0), 99);
    EXPECT_EQ(ProgressParser::computePercent(5.0, std::nullopt), 0);
    EXPECT_EQ(ProgressParser::computePercent(5.0, 0.0), 0);
}

TEST(ProgressParserTest, CachesFirstDuration) {
    ProgressParser parser;
    auto first = parser.parse("  Duration: 00:02:00.00, start: 0.000000, bitrate: 1205 kb/s");
    EXPECT_FALSE(first.event.has_value());
    ASSERT_TRUE(parser.cachedDuration().has_value());
    EXPECT_DOUBLE_EQ(*parser.cachedDuration(), 120.0);

    (void)parser.parse("  Duration: 00:05:00.00, start: 0.000000");
    EXPECT_DOUBLE_EQ(*parser.cachedDuration(), 120.0);

    auto result = parser.parse("frame=  100 fps=25 q=28.0 size=256kB time=00:01:00.00 bitrate=34.9kbits/s speed=2.5x");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 50);
    EXPECT_EQ(result.event->elapsedTime, "00:01:00");
    EXPECT_EQ(result.event->speed, std::optional<std::string>("2.5x"));
}

TEST(ProgressParserTest, KnownDurationSeedsCache) {
    ProgressParser parser(10.0);
    auto result = parser.parse("time=00:00:05.00 speed=1.0x");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 50);
}

TEST(ProgressParserTest, PositionWithoutDurationStillEmits) {
    ProgressParser parser;
    auto result = parser.parse("size=  1024kB time=00:00:07.50 bitrate= 1.1kbits/s");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 0);
    EXPECT_EQ(result.event->elapsedTime, "00:00:07");
    EXPECT_FALSE(result.event->speed.has_value());
}

TEST(ProgressParserTest, NeverReportsHundredWhileRunning) {
    ProgressParser parser(10.0);
    auto result = parser.parse("time=00:00:10.00 speed=1.0x");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 99);
}

TEST(ProgressParserTest, DropsUninformativeRecords) {
    ProgressParser parser;
    EXPECT_FALSE(parser.parse("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'in.mov':").event.has_value());
    EXPECT_FALSE(parser.parse("[youtube] abc123: Downloading player").event.has_value());
    EXPECT_FALSE(parser.parse("   ").event.has_value());
}

TEST(ProgressParserTest, ParsesTransferProgress) {
    ProgressParser parser;
    auto result = parser.parse("[download]  45.3% of ~10.50MiB at  2.00MiB/s ETA 00:05");
    ASSERT_TRUE(result.event.has_value());
    const auto& event = *result.event;
    EXPECT_EQ(event.percent, 45);
    EXPECT_EQ(event.size, std::optional<std::string>("10.50MiB"));
    EXPECT_EQ(event.speed, std::optional<std::string>("2.00MiB/s"));
    EXPECT_EQ(event.eta, std::optional<std::string>("00:05"));
    EXPECT_EQ(event.status, std::optional<std::string>("Downloading..."));
}

TEST(ProgressParserTest, FinalTransferPercentIsClamped) {
    ProgressParser parser;
    auto result = parser.parse("[download] 100.0% of 10.00MiB at 3.10MiB/s ETA 00:00");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 99);
    EXPECT_EQ(result.event->status, std::optional<std::string>("Finalizing download..."));
}

TEST(ProgressParserTest, RecordsDestinationAnnouncements) {
    ProgressParser parser;
    auto dest = parser.parse("[download] Destination: /tmp/out/video.f137.mp4");
    EXPECT_EQ(dest.destination, std::optional<std::string>("/tmp/out/video.f137.mp4"));
    ASSERT_TRUE(dest.event.has_value());
    EXPECT_EQ(dest.event->status, std::optional<std::string>("Creating output file..."));

    auto merged = parser.parse("[Merger] Merging formats into \"/tmp/out/video.mp4\"");
    EXPECT_EQ(merged.destination, std::optional<std::string>("/tmp/out/video.mp4"));
    ASSERT_TRUE(merged.event.has_value());
    EXPECT_EQ(merged.event->status, std::optional<std::string>("Merging audio and video..."));

    auto existing = parser.parse("[download] /tmp/out/video.mp4 has already been downloaded");
    EXPECT_EQ(existing.destination, std::optional<std::string>("/tmp/out/video.mp4"));
}

TEST(ProgressParserTest, StatusEventsCarryLastPercent) {
    ProgressParser parser;
    (void)parser.parse("[download]  45.3% of 10.00MiB at 1.00MiB/s ETA 00:06");
    auto result = parser.parse("[ExtractAudio] Destination: /tmp/out/audio.mp3");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 45);
    EXPECT_EQ(parser.lastPercent(), 45);
}

TEST(ProgressParserTest, MapsComponentTagsToStatus) {
    ProgressParser parser;
    auto info = parser.parse("[info] abc123: Downloading webpage");
    ASSERT_TRUE(info.event.has_value());
    EXPECT_EQ(info.event->status, std::optional<std::string>("Fetching metadata..."));

    auto extract = parser.parse("[ExtractAudio] Post-processing");
    ASSERT_TRUE(extract.event.has_value());
    EXPECT_EQ(extract.event->status, std::optional<std::string>("Extracting audio..."));

    auto cleanup = parser.parse("Deleting original file /tmp/out/video.f137.mp4 (pass -k to keep)");
    ASSERT_TRUE(cleanup.event.has_value());
    EXPECT_EQ(cleanup.event->status, std::optional<std::string>("Cleaning up temporary files..."));

    EXPECT_EQ(classifyTag("Merger"), ComponentTag::Merger);
    EXPECT_EQ(classifyTag("youtube"), ComponentTag::Other);
    EXPECT_EQ(classifyTag(""), ComponentTag::None);
}

TEST(ProgressParserTest, ErrorLinesBecomeStatus) {
    ProgressParser parser;
    auto result = parser.parse("ERROR: [youtube] abc123: Video unavailable");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->status, std::optional<std::string>("Error: [youtube] abc123: Video unavailable"));
}

TEST(ProgressParserTest, FormatsClock) {
    EXPECT_EQ(ProgressParser::formatClock(0.0), "00:00:00");
    EXPECT_EQ(ProgressParser::formatClock(3725.9), "01:02:05");
    EXPECT_EQ(ProgressParser::formatClock(-4.0), "00:00:00");
}

TEST(ProgressParserTest, OverlongNumbersAreIgnored) {
    const std::string digits(400, '9');
    ProgressParser parser(10.0);

    ParseResult transfer;
    EXPECT_NO_THROW(transfer = parser.parse("[download] " + digits + "% of 10.00MiB"));
    EXPECT_FALSE(transfer.event.has_value());

    ParseResult position;
    EXPECT_NO_THROW(position = parser.parse("frame=1 time=" + digits + ":00:00.00 bitrate=N/A"));
    EXPECT_FALSE(position.event.has_value());

    ProgressParser fresh;
    EXPECT_NO_THROW((void)fresh.parse("  Duration: " + digits + ":00:00.00, start: 0.000000"));
    EXPECT_FALSE(fresh.cachedDuration().has_value());

    // The parser keeps working after rejecting a record
    auto next = parser.parse("time=00:00:05.00 speed=1.0x");
    ASSERT_TRUE(next.event.has_value());
    EXPECT_EQ(next.event->percent, 50);
}

TEST(ProgressParserTest, HugeFinitePositionIsClamped) {
    ProgressParser parser(10.0);
    auto result = parser.parse("time=" + std::string(30, '9') + ":00:00.00 speed=1.0x");
    ASSERT_TRUE(result.event.has_value());
    EXPECT_EQ(result.event->percent, 99);
    EXPECT_FALSE(result.event->elapsedTime.empty());
}
