// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/capture/include/CaptureLoop.hpp"
#include "screenstreamer/capture/include/PreviewPath.hpp"

// Std includes:
#include <iostream>
#include <stdexcept>

screenstreamer::capture::CaptureLoop::CaptureLoop(process::ChunkSource &chunkSource,
                                                  store::FrameStore &frameStore,
                                                  PreviewPath *previewPath,
                                                  common::CancellationToken cancellationToken,
                                                  uint32_t readChunkSize,
                                                  uint32_t maxBufferSize,
                                                  bool isVerbose)
    : m_chunkSource(chunkSource)
    , m_frameStore(frameStore)
    , m_previewPath(previewPath)
    , m_cancellationToken(std::move(cancellationToken))
    , m_isVerbose(isVerbose)
    , m_frameScanner(
        [this](jpeg::FramePtr frame) { onFrame(std::move(frame)); },
        [this](const common::StreamDesyncError &desyncError) { onDesync(desyncError); },
        maxBufferSize)
    , m_readBuffer(readChunkSize)
{
    // a zero-sized read would look like the end of the producer stream
    if(readChunkSize == 0)
    {
        throw std::invalid_argument("Capture read chunk size must not be zero");
    }
}

void screenstreamer::capture::CaptureLoop::run()
{
    while(!m_cancellationToken.isCancellationRequested())
    {
        const auto readByteCount = m_chunkSource.readChunk(m_readBuffer.data(), static_cast<uint32_t>(m_readBuffer.size()));
        if(readByteCount == 0)
        {
            // the producer closed its output
            std::cout << "Capture: end of producer stream" << std::endl;
            break;
        }
        m_byteCount += readByteCount;

        // bytes read after a stop request are not published
        if(m_cancellationToken.isCancellationRequested())
        {
            break;
        }

        m_frameScanner.scan(m_readBuffer.data(), readByteCount);
    }

    std::cout << "Capture: " << m_frameCount << " frames from " << m_byteCount << " bytes"
              << ", " << m_desyncCount << " desync" << std::endl;
}

void screenstreamer::capture::CaptureLoop::onFrame(jpeg::FramePtr frame)
{
    m_frameCount++;

    if(m_isVerbose && (frame->sequence() % 100 == 0))
    {
        std::cout << "Capture: frame " << frame->sequence() << " (" << frame->size() << " bytes)" << std::endl;
    }

    // the raw frame is always published, even when the preview drops it
    m_frameStore.publish(frame);

    if(m_previewPath != nullptr)
    {
        m_previewPath->offer(std::move(frame));
    }
}

void screenstreamer::capture::CaptureLoop::onDesync(const common::StreamDesyncError &desyncError)
{
    m_desyncCount++;
    std::cerr << "Warning: stream desync, " << desyncError.what() << std::endl;
}
