// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <chrono>
#include <cstdint>
#include <string>

namespace screenstreamer {
namespace http {

struct ServerConfig
{
    std::string address = "0.0.0.0";
    // 0 picks a free port
    uint16_t port = 5000;
    uint16_t threadCount = 2;

    // minimum time between two parts sent to one viewer (66ms = 15fps)
    std::chrono::milliseconds minInterval{66};
    // wait before looking again at an empty frame store
    std::chrono::milliseconds idleRetryInterval{10};

    std::string indexPage = "<html><body><img src='/stream'/></body></html>";

    bool isVerbose = false;
};

// Multipart framing of the stream
constexpr const char* streamPath = "/stream";
constexpr const char* boundaryToken = "frame";
constexpr const char* streamContentType = "multipart/x-mixed-replace; boundary=frame";
constexpr const char* partHeader = "--frame\r\nContent-Type: image/jpeg\r\n\r\n";
constexpr const char* partTrailer = "\r\n";


} // namespace http
} // namespace screenstreamer
