// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/common/include/Error.hpp"
#include "screenstreamer/jpeg/include/Frame.hpp"

// Std includes:
#include <cstdint>
#include <functional>
#include <vector>

namespace screenstreamer {
namespace jpeg {

/// @brief Incremental MJPEG frame splitter
///
/// An MJPEG stream produced by @c ffmpeg @c -f @c mjpeg is simply the concatenation of JPEG
/// images without any additional data. The producer pipe hands out those bytes in arbitrary
/// chunks, so a frame (and even its end marker) may be split over several reads.
///
/// The scanner keeps the bytes of the frame in progress in an accumulation buffer, and cuts a
/// frame each time it sees the end of image marker (0xFFD9). Each frame spans from the byte after
/// the previous marker up to and including the next one.
///
/// @note The marker is not validated against the JPEG structure: a 0xFF 0xD9 pair appearing in
/// an entropy-coded segment would be taken as a frame boundary. Encoders stuff 0xFF bytes of
/// scan data with 0x00, so this does not happen with well-formed input, but a corrupted stream
/// can produce truncated frames.
///
/// If the accumulation buffer grows beyond @c maxBufferSize without any marker, the stream is
/// considered desynchronized: the buffer is dropped, and the desync handler is notified. The
/// scanner then resumes on the following bytes.
class FrameScanner
{
public:
    using FrameHandler = std::function<void(FramePtr)>;
    using DesyncHandler = std::function<void(const common::StreamDesyncError&)>;

public:
    static constexpr uint32_t defaultMaxBufferSize = 10 * 1024 * 1024;

public:
    FrameScanner(FrameHandler frameHandler, DesyncHandler desyncHandler,
                 uint32_t maxBufferSize = defaultMaxBufferSize);

public:
    /// @brief Appends one chunk and emits every frame it completes, in stream order
    /// @return number of frames emitted for this chunk
    uint32_t scan(const uint8_t *chunk, uint32_t chunkSize);

public:
    uint32_t pendingByteCount() const
    {
        return static_cast<uint32_t>(m_accumulationBuffer.size());
    }

    uint64_t frameCount() const
    {
        return m_frameCount;
    }

    uint64_t desyncCount() const
    {
        return m_desyncCount;
    }

    uint32_t maxBufferSize() const
    {
        return m_maxBufferSize;
    }

private:
    const FrameHandler m_frameHandler;
    const DesyncHandler m_desyncHandler;
    const uint32_t m_maxBufferSize;

private:
    std::vector<uint8_t> m_accumulationBuffer;
    // bytes at the start of the buffer already searched for a marker
    uint32_t m_scannedByteCount = 0;
    uint64_t m_frameCount = 0;
    uint64_t m_desyncCount = 0;
};


} // namespace jpeg
} // namespace screenstreamer
