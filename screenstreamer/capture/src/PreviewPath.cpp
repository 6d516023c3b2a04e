// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/capture/include/PreviewPath.hpp"
#include "screenstreamer/common/include/Error.hpp"

// Boost includes:
#include <boost/asio/post.hpp>

// Std includes:
#include <iostream>

screenstreamer::capture::PreviewPath::PreviewPath(uint32_t targetWidth, PreviewHandler previewHandler,
                                                  common::CancellationToken cancellationToken)
    : m_targetWidth(targetWidth)
    , m_previewHandler(std::move(previewHandler))
    , m_cancellationToken(std::move(cancellationToken))
    , m_threadPool(1)
{ }

screenstreamer::capture::PreviewPath::~PreviewPath()
{
    stop();
}

bool screenstreamer::capture::PreviewPath::offer(jpeg::FramePtr frame)
{
    if(m_isStopped || m_cancellationToken.isCancellationRequested())
    {
        return false;
    }

    bool isIdle = false;
    if(!m_isDecoding.compare_exchange_strong(isIdle, true))
    {
        // a decode is in flight
        m_droppedCount++;
        return false;
    }

    boost::asio::post(m_threadPool,
        [this, frame]
        {
            decodeFrame(frame);
            m_isDecoding = false;
        }
    );

    return true;
}

void screenstreamer::capture::PreviewPath::decodeFrame(const jpeg::FramePtr &frame)
{
    if(m_cancellationToken.isCancellationRequested())
    {
        return;
    }

    try
    {
        auto image = m_decoder.decode(frame->data(), frame->size(), m_targetWidth);
        image->sequence = frame->sequence();
        m_decodedCount++;

        if(m_previewHandler)
        {
            m_previewHandler(std::move(image));
        }
    }
    catch(const common::DecodeError &e)
    {
        m_failedCount++;
        std::cerr << "Preview: frame " << frame->sequence() << " skipped: " << e.what() << std::endl;
    }
    catch(const std::exception &e)
    {
        m_failedCount++;
        std::cerr << "Preview: handler failed on frame " << frame->sequence() << ": " << e.what() << std::endl;
    }
}

void screenstreamer::capture::PreviewPath::stop()
{
    if(m_isStopped.exchange(true))
    {
        return;
    }

    m_threadPool.join();
}
