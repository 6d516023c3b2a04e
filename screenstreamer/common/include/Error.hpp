// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <cstdint>
#include <stdexcept>
#include <string>

namespace screenstreamer {
namespace common {

/// @brief The producer process could not be started
///
/// Thrown by @ref screenstreamer::process::SubprocessPipe::start when the executable is not
/// found or the operating system refuses to spawn it. Fatal to session start.
class LaunchError : public std::runtime_error
{
public:
    explicit LaunchError(const std::string &message)
        : std::runtime_error(message)
    { }
};

/// @brief The frame scanner gave up on its accumulated bytes
///
/// This error is never thrown. It is handed to the desync handler of
/// @ref screenstreamer::jpeg::FrameScanner after the accumulation buffer grew past its cap
/// without a frame boundary, and was discarded.
class StreamDesyncError : public std::runtime_error
{
public:
    StreamDesyncError(uint64_t discardedByteCount, uint64_t maxBufferSize)
        : std::runtime_error("no frame boundary in " + std::to_string(discardedByteCount)
                             + " bytes (cap " + std::to_string(maxBufferSize) + "), buffer reset")
        , m_discardedByteCount(discardedByteCount)
    { }

    uint64_t discardedByteCount() const
    {
        return m_discardedByteCount;
    }

private:
    uint64_t m_discardedByteCount;
};

/// @brief A JPEG frame could not be decoded for preview
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string &message)
        : std::runtime_error(message)
    { }
};


} // namespace common
} // namespace screenstreamer
