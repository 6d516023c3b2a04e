// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/store/include/LatestFrameStore.hpp"

void screenstreamer::store::LatestFrameStore::publish(jpeg::FramePtr frame)
{
    // the previous frame is released outside of the lock
    jpeg::FramePtr previousFrame;
    {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        previousFrame = std::move(m_slot);
        m_slot = std::move(frame);
    }
    m_publishCount.fetch_add(1, std::memory_order_relaxed);
}

screenstreamer::jpeg::FramePtr screenstreamer::store::LatestFrameStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_slotMutex);
    return m_slot;
}

void screenstreamer::store::LatestFrameStore::clear()
{
    jpeg::FramePtr previousFrame;
    {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        previousFrame = std::move(m_slot);
    }
}
