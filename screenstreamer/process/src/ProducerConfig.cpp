// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/process/include/ProducerConfig.hpp"

std::vector<std::string> screenstreamer::process::ProducerConfig::buildArguments() const
{
    if(!arguments.empty())
    {
        return arguments;
    }

    std::string videoFilter = "fps=" + std::to_string(frameRate);
    if(scaleWidth > 0)
    {
        // -1 keeps the aspect ratio
        videoFilter += ",scale=" + std::to_string(scaleWidth) + ":-1";
    }

    return {
        "-hide_banner",
        "-f", "x11grab",
        "-i", display,
        "-vf", videoFilter,
        "-q:v", std::to_string(quality),
        "-f", "mjpeg",
        "-"
    };
}
