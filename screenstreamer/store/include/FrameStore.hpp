// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/jpeg/include/Frame.hpp"

namespace screenstreamer {
namespace store {

/// @brief Hand-over point between the capture thread and the frame consumers
///
/// There is one writer (the capture loop) and any number of readers (HTTP connections, preview).
/// Implementations must make @ref publish and @ref snapshot atomic with respect to each other,
/// and neither may wait for I/O. A reader gets a shared pointer to an immutable frame: it stays
/// valid after the slot is overwritten.
class FrameStore
{
public:
    virtual ~FrameStore() = default;

public:
    virtual void publish(jpeg::FramePtr frame) = 0;

    /// @return latest published frame, or @c nullptr before the first publish
    virtual jpeg::FramePtr snapshot() const = 0;

    virtual void clear() = 0;
};


} // namespace store
} // namespace screenstreamer
