// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/store/include/FrameStore.hpp"

// Std includes:
#include <atomic>
#include <cstdint>
#include <mutex>

namespace screenstreamer {
namespace store {

/// @brief Single-slot, latest-wins frame store
///
/// The mutex only protects the pointer swap and the pointer copy, never frame data or I/O.
/// Intermediate frames overwritten before anyone read them are silently dropped.
class LatestFrameStore : public FrameStore
{
public:
    void publish(jpeg::FramePtr frame) override;
    jpeg::FramePtr snapshot() const override;
    void clear() override;

public:
    uint64_t publishCount() const
    {
        return m_publishCount.load(std::memory_order_relaxed);
    }

private:
    mutable std::mutex m_slotMutex;
    jpeg::FramePtr m_slot;
    std::atomic<uint64_t> m_publishCount{0};
};


} // namespace store
} // namespace screenstreamer
