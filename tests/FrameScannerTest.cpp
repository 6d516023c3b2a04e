// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/jpeg/include/FrameScanner.hpp"
#include "TestHelpers.hpp"

// GTest includes:
#include <gtest/gtest.h>

// Std includes:
#include <algorithm>
#include <random>

using screenstreamer::jpeg::FramePtr;
using screenstreamer::jpeg::FrameScanner;
using screenstreamer::test::append;
using screenstreamer::test::syntheticFrame;

namespace {

struct ScanRecorder
{
    std::vector<std::vector<uint8_t>> frames;
    std::vector<uint64_t> sequences;
    std::vector<uint64_t> discardedByteCounts;

    FrameScanner makeScanner(uint32_t maxBufferSize = FrameScanner::defaultMaxBufferSize)
    {
        return FrameScanner(
            [this](FramePtr frame)
            {
                frames.push_back(frame->bytes());
                sequences.push_back(frame->sequence());
            },
            [this](const screenstreamer::common::StreamDesyncError &desyncError)
            {
                discardedByteCounts.push_back(desyncError.discardedByteCount());
            },
            maxBufferSize
        );
    }
};

void scanInChunks(FrameScanner &scanner, const std::vector<uint8_t> &stream, const std::vector<uint32_t> &cuts)
{
    uint32_t offset = 0;
    for(const auto cut : cuts)
    {
        scanner.scan(stream.data() + offset, cut - offset);
        offset = cut;
    }
    scanner.scan(stream.data() + offset, static_cast<uint32_t>(stream.size()) - offset);
}

} // namespace

TEST(FrameScannerTest, emitsSingleFrameFromSingleChunk)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    const auto frame = syntheticFrame(0x11);
    EXPECT_EQ(scanner.scan(frame.data(), static_cast<uint32_t>(frame.size())), 1u);

    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], frame);
    EXPECT_EQ(recorder.sequences[0], 1u);
    EXPECT_EQ(scanner.pendingByteCount(), 0u);
}

TEST(FrameScannerTest, emitsSeveralFramesFromOneChunkInOrder)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    std::vector<uint8_t> stream;
    append(stream, syntheticFrame(0x01, 10));
    append(stream, syntheticFrame(0x02, 20));
    append(stream, syntheticFrame(0x03, 30));

    EXPECT_EQ(scanner.scan(stream.data(), static_cast<uint32_t>(stream.size())), 3u);

    ASSERT_EQ(recorder.frames.size(), 3u);
    EXPECT_EQ(recorder.frames[0], syntheticFrame(0x01, 10));
    EXPECT_EQ(recorder.frames[1], syntheticFrame(0x02, 20));
    EXPECT_EQ(recorder.frames[2], syntheticFrame(0x03, 30));
    EXPECT_EQ(recorder.sequences, (std::vector<uint64_t>{ 1, 2, 3 }));
    EXPECT_EQ(scanner.frameCount(), 3u);
}

TEST(FrameScannerTest, keepsIncompleteTailForNextChunk)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    const auto frame = syntheticFrame(0x22, 40);
    scanner.scan(frame.data(), 25);

    EXPECT_TRUE(recorder.frames.empty());
    EXPECT_EQ(scanner.pendingByteCount(), 25u);

    scanner.scan(frame.data() + 25, static_cast<uint32_t>(frame.size()) - 25);
    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], frame);
}

TEST(FrameScannerTest, findsEndMarkerSplitAcrossChunks)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    const auto frame = syntheticFrame(0x33);
    const uint32_t markerOffset = static_cast<uint32_t>(frame.size()) - 2;

    // 0xFF ends the first chunk, 0xD9 starts the second one
    scanner.scan(frame.data(), markerOffset + 1);
    EXPECT_TRUE(recorder.frames.empty());

    scanner.scan(frame.data() + markerOffset + 1, 1);
    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], frame);
}

TEST(FrameScannerTest, outputDoesNotDependOnChunkBoundaries)
{
    std::vector<uint8_t> stream;
    append(stream, syntheticFrame(0x41, 7));
    append(stream, syntheticFrame(0x42, 3));
    append(stream, syntheticFrame(0x43, 12));

    ScanRecorder reference;
    {
        auto scanner = reference.makeScanner();
        scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));
    }
    ASSERT_EQ(reference.frames.size(), 3u);

    // every single split point
    for(uint32_t cut = 1; cut < stream.size(); cut++)
    {
        ScanRecorder recorder;
        auto scanner = recorder.makeScanner();
        scanInChunks(scanner, stream, { cut });

        EXPECT_EQ(recorder.frames, reference.frames) << "split at " << cut;
    }

    // every pair of split points
    for(uint32_t first = 1; first < stream.size(); first++)
    {
        for(uint32_t second = first + 1; second < stream.size(); second++)
        {
            ScanRecorder recorder;
            auto scanner = recorder.makeScanner();
            scanInChunks(scanner, stream, { first, second });

            ASSERT_EQ(recorder.frames, reference.frames) << "split at " << first << " and " << second;
        }
    }
}

TEST(FrameScannerTest, outputDoesNotDependOnRandomChunking)
{
    std::mt19937 generator(1234);

    std::vector<uint8_t> stream;
    for(uint8_t fill = 1; fill <= 50; fill++)
    {
        append(stream, syntheticFrame(fill, 1 + (fill * 37) % 200));
    }

    ScanRecorder reference;
    {
        auto scanner = reference.makeScanner();
        scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));
    }
    ASSERT_EQ(reference.frames.size(), 50u);

    std::uniform_int_distribution<uint32_t> chunkSizeDistribution(1, 300);
    for(int round = 0; round < 100; round++)
    {
        ScanRecorder recorder;
        auto scanner = recorder.makeScanner();

        uint32_t offset = 0;
        while(offset < stream.size())
        {
            const auto chunkSize = std::min<uint32_t>(chunkSizeDistribution(generator),
                                                      static_cast<uint32_t>(stream.size()) - offset);
            scanner.scan(stream.data() + offset, chunkSize);
            offset += chunkSize;
        }

        ASSERT_EQ(recorder.frames, reference.frames) << "round " << round;
        EXPECT_EQ(scanner.pendingByteCount(), 0u);
    }
}

TEST(FrameScannerTest, byteByByteScanMatchesWholeScan)
{
    std::vector<uint8_t> stream;
    append(stream, syntheticFrame(0x51, 5));
    append(stream, syntheticFrame(0x52, 0));
    append(stream, syntheticFrame(0x53, 9));

    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();
    for(const auto byte : stream)
    {
        scanner.scan(&byte, 1);
    }

    ASSERT_EQ(recorder.frames.size(), 3u);
    EXPECT_EQ(recorder.frames[1], syntheticFrame(0x52, 0));
}

TEST(FrameScannerTest, leadingGarbageIsPartOfFirstFrame)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    std::vector<uint8_t> stream = { 0x00, 0x01, 0x02 };
    append(stream, syntheticFrame(0x61));
    scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));

    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], stream);
}

TEST(FrameScannerTest, emptyChunkDoesNothing)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    EXPECT_EQ(scanner.scan(nullptr, 0), 0u);
    EXPECT_TRUE(recorder.frames.empty());
    EXPECT_EQ(scanner.pendingByteCount(), 0u);
}

TEST(FrameScannerTest, oversizedTailIsDiscardedAndScanningRecovers)
{
    const uint32_t maxBufferSize = 64;
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner(maxBufferSize);

    // no end marker in 100 bytes
    const std::vector<uint8_t> garbage(100, 0x77);
    scanner.scan(garbage.data(), static_cast<uint32_t>(garbage.size()));

    EXPECT_TRUE(recorder.frames.empty());
    ASSERT_EQ(recorder.discardedByteCounts.size(), 1u);
    EXPECT_EQ(recorder.discardedByteCounts[0], 100u);
    EXPECT_EQ(scanner.desyncCount(), 1u);
    EXPECT_EQ(scanner.pendingByteCount(), 0u);

    // the next frame is found normally
    const auto frame = syntheticFrame(0x78, 10);
    scanner.scan(frame.data(), static_cast<uint32_t>(frame.size()));
    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], frame);
    EXPECT_EQ(recorder.sequences[0], 1u);
}

TEST(FrameScannerTest, tailUnderCapIsKept)
{
    const uint32_t maxBufferSize = 64;
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner(maxBufferSize);

    const std::vector<uint8_t> partial(64, 0x79);
    scanner.scan(partial.data(), static_cast<uint32_t>(partial.size()));

    EXPECT_TRUE(recorder.discardedByteCounts.empty());
    EXPECT_EQ(scanner.pendingByteCount(), 64u);
}

TEST(FrameScannerTest, completedFramesAreEmittedBeforeOversizedTailIsDropped)
{
    const uint32_t maxBufferSize = 32;
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner(maxBufferSize);

    std::vector<uint8_t> stream;
    append(stream, syntheticFrame(0x0A, 10));
    stream.insert(stream.end(), 50, 0x0B);
    scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));

    ASSERT_EQ(recorder.frames.size(), 1u);
    EXPECT_EQ(recorder.frames[0], syntheticFrame(0x0A, 10));
    ASSERT_EQ(recorder.discardedByteCounts.size(), 1u);
    EXPECT_EQ(recorder.discardedByteCounts[0], 50u);
}

TEST(FrameScannerTest, bytesAfterEndMarkerStartNextFrame)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    // the D9 following an end marker belongs to the next frame
    const std::vector<uint8_t> stream = { 0xFF, 0xD8, 0x01, 0xFF, 0xD9, 0xD9, 0x02, 0xFF, 0xD9 };
    scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));

    ASSERT_EQ(recorder.frames.size(), 2u);
    EXPECT_EQ(recorder.frames[0], (std::vector<uint8_t>{ 0xFF, 0xD8, 0x01, 0xFF, 0xD9 }));
    EXPECT_EQ(recorder.frames[1], (std::vector<uint8_t>{ 0xD9, 0x02, 0xFF, 0xD9 }));
}

TEST(FrameScannerTest, endMarkerInsidePayloadSplitsFrame)
{
    ScanRecorder recorder;
    auto scanner = recorder.makeScanner();

    // boundaries are byte pairs, the JPEG structure is not parsed
    const std::vector<uint8_t> stream = { 0xFF, 0xD8, 0x01, 0xFF, 0xD9, 0x02, 0x03, 0xFF, 0xD9 };
    scanner.scan(stream.data(), static_cast<uint32_t>(stream.size()));

    ASSERT_EQ(recorder.frames.size(), 2u);
    EXPECT_EQ(recorder.frames[0], (std::vector<uint8_t>{ 0xFF, 0xD8, 0x01, 0xFF, 0xD9 }));
    EXPECT_EQ(recorder.frames[1], (std::vector<uint8_t>{ 0x02, 0x03, 0xFF, 0xD9 }));
}
