// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/capture/include/CaptureLoop.hpp"
#include "screenstreamer/http/include/ServerConfig.hpp"
#include "screenstreamer/jpeg/include/FrameScanner.hpp"
#include "screenstreamer/process/include/ProducerConfig.hpp"

// Std includes:
#include <cstdint>

namespace screenstreamer {
namespace session {

struct SessionConfig
{
    process::ProducerConfig producer;
    http::ServerConfig server;

    uint32_t readChunkSize = capture::CaptureLoop::defaultReadChunkSize;
    uint32_t maxBufferSize = jpeg::FrameScanner::defaultMaxBufferSize;

    // 0 disables the preview path
    uint32_t previewWidth = 0;

    bool isVerbose = false;
};


} // namespace session
} // namespace screenstreamer
