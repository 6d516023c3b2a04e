// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <cstdint>

namespace screenstreamer {
namespace process {

/// @brief Blocking byte stream read by the capture loop
class ChunkSource
{
public:
    virtual ~ChunkSource() = default;

public:
    /// @brief Reads whatever bytes are available, waiting for at least one
    /// @return number of bytes written to @p buffer, 0 at end of stream
    virtual uint32_t readChunk(uint8_t *buffer, uint32_t bufferSize) = 0;
};


} // namespace process
} // namespace screenstreamer
