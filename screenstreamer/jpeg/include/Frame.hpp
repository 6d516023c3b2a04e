// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <cstdint>
#include <memory>
#include <vector>

namespace screenstreamer {
namespace jpeg {

/// @brief One JPEG image cut out of the producer stream
///
/// A frame is immutable once created. It is shared by pointer between the frame store, the
/// HTTP connections and the preview worker; whoever holds a @ref FramePtr can keep reading the
/// bytes after the store has moved on to a newer frame.
class Frame
{
public:
    Frame(uint64_t sequence, std::vector<uint8_t> &&jpegData)
        : m_sequence(sequence)
        , m_jpegData(std::move(jpegData))
    { }

public:
    /// Position of the frame in the producer stream, starting at 1
    uint64_t sequence() const
    {
        return m_sequence;
    }

    const uint8_t* data() const
    {
        return m_jpegData.data();
    }

    uint32_t size() const
    {
        return static_cast<uint32_t>(m_jpegData.size());
    }

    const std::vector<uint8_t>& bytes() const
    {
        return m_jpegData;
    }

private:
    const uint64_t m_sequence;
    const std::vector<uint8_t> m_jpegData;
};

using FramePtr = std::shared_ptr<const Frame>;


} // namespace jpeg
} // namespace screenstreamer
