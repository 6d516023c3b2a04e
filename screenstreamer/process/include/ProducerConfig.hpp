// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace screenstreamer {
namespace process {

/// @brief How to launch and stop the capture producer
///
/// The default values run @c ffmpeg grabbing the X11 display and writing MJPEG on stdout:
/// @verbatim ffmpeg -f x11grab -i :0.0 -vf fps=15 -q:v 5 -f mjpeg - @endverbatim
///
/// When @ref arguments is not empty, it is passed as is and the capture fields are ignored. Any
/// program writing concatenated JPEG images on stdout can be used that way, e.g.:
/// @verbatim gst-launch-1.0 -q ximagesrc ! videoconvert ! jpegenc ! fdsink @endverbatim
struct ProducerConfig
{
    std::string executable = "ffmpeg";
    std::vector<std::string> arguments;

    std::string display = ":0.0";
    uint16_t frameRate = 15;
    uint16_t quality = 5;
    // 0 keeps the captured size
    uint16_t scaleWidth = 0;

    // written on stdin to ask the producer to quit
    std::string quitCommand = "q";
    std::chrono::milliseconds stopTimeout{2000};

    std::vector<std::string> buildArguments() const;
};


} // namespace process
} // namespace screenstreamer
