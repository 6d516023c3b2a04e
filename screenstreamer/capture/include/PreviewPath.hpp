// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/jpeg/include/Decoder.hpp"
#include "screenstreamer/jpeg/include/Frame.hpp"
#include "screenstreamer/common/include/Cancellation.hpp"

// Boost includes:
#include <boost/asio/thread_pool.hpp>

// Std includes:
#include <atomic>
#include <cstdint>
#include <functional>

namespace screenstreamer {
namespace capture {

/// @brief Rate-limited preview decoding
///
/// Frames offered to the preview path are decoded in a side thread and handed to the display
/// collaborator. At most one decode is in flight: a frame offered while the previous one is
/// still being decoded is dropped, so that the capture loop never waits for the preview.
///
/// Decode errors stay in the side thread; they are logged and the frame is skipped.
class PreviewPath
{
public:
    /// Called from the decode thread. A null image means "clear the preview".
    using PreviewHandler = std::function<void(jpeg::PreviewImagePtr)>;

public:
    PreviewPath(uint32_t targetWidth, PreviewHandler previewHandler, common::CancellationToken cancellationToken);
    ~PreviewPath();

public:
    /// @return true if a decode was started, false if the frame was dropped
    bool offer(jpeg::FramePtr frame);

    /// @brief Waits for the decode in flight, then refuses new frames
    void stop();

public:
    uint64_t decodedCount() const
    {
        return m_decodedCount.load();
    }

    uint64_t droppedCount() const
    {
        return m_droppedCount.load();
    }

    uint64_t failedCount() const
    {
        return m_failedCount.load();
    }

private:
    void decodeFrame(const jpeg::FramePtr &frame);

private:
    const uint32_t m_targetWidth;
    const PreviewHandler m_previewHandler;
    const common::CancellationToken m_cancellationToken;

private:
    // capacity-1 permit
    std::atomic<bool> m_isDecoding{false};
    std::atomic<bool> m_isStopped{false};
    std::atomic<uint64_t> m_decodedCount{0};
    std::atomic<uint64_t> m_droppedCount{0};
    std::atomic<uint64_t> m_failedCount{0};

private:
    // only used from the pool thread
    jpeg::Decoder m_decoder;
    boost::asio::thread_pool m_threadPool;
};


} // namespace capture
} // namespace screenstreamer
