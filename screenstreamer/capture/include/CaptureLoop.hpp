// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/common/include/Cancellation.hpp"
#include "screenstreamer/jpeg/include/FrameScanner.hpp"
#include "screenstreamer/process/include/ChunkSource.hpp"
#include "screenstreamer/store/include/FrameStore.hpp"

// Std includes:
#include <atomic>
#include <cstdint>
#include <vector>

namespace screenstreamer {
namespace capture {

class PreviewPath;

/// @brief Producer to frame store pump
///
/// Reads the producer output chunk by chunk, cuts it into frames with a
/// @ref jpeg::FrameScanner, and publishes each frame, in stream order, to the frame store.
/// Frames are also offered to the optional preview path, which may drop them.
///
/// The loop ends at the end of the producer stream (the producer exited or was stopped) or when
/// cancellation is requested. A stream desync is logged and the loop goes on.
class CaptureLoop
{
public:
    static constexpr uint32_t defaultReadChunkSize = 4096;

public:
    /// @throw std::invalid_argument if @p readChunkSize is zero
    CaptureLoop(process::ChunkSource &chunkSource,
                store::FrameStore &frameStore,
                PreviewPath *previewPath,
                common::CancellationToken cancellationToken,
                uint32_t readChunkSize = defaultReadChunkSize,
                uint32_t maxBufferSize = jpeg::FrameScanner::defaultMaxBufferSize,
                bool isVerbose = false);

public:
    /// @brief Blocks until end of stream or cancellation
    void run();

public:
    uint64_t frameCount() const
    {
        return m_frameCount.load();
    }

    uint64_t desyncCount() const
    {
        return m_desyncCount.load();
    }

    uint64_t byteCount() const
    {
        return m_byteCount.load();
    }

private:
    void onFrame(jpeg::FramePtr frame);
    void onDesync(const common::StreamDesyncError &desyncError);

private:
    process::ChunkSource &m_chunkSource;
    store::FrameStore &m_frameStore;
    PreviewPath* const m_previewPath;
    const common::CancellationToken m_cancellationToken;
    const bool m_isVerbose;

private:
    jpeg::FrameScanner m_frameScanner;
    std::vector<uint8_t> m_readBuffer;

private:
    std::atomic<uint64_t> m_frameCount{0};
    std::atomic<uint64_t> m_desyncCount{0};
    std::atomic<uint64_t> m_byteCount{0};
};


} // namespace capture
} // namespace screenstreamer
