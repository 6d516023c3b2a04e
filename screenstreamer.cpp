// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// screenstreamer, Inatech's screen streamer

/// @mainpage Screenstreamer
/// Welcome to @e screenstreamer.
///
/// @e screenstreamer captures the screen with an external MJPEG producer (@c ffmpeg by default)
/// and broadcasts the latest frame to any number of browsers over HTTP.
///
/// Start at the documentation of the main file: @ref screenstreamer.cpp.

// Local includes:
#include "version.h"
#include "screenstreamer/session/include/SessionController.hpp"

// Boost includes:
#include <boost/program_options.hpp>
namespace po = boost::program_options;
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

// C includes:
#include <csignal>

// Std includes:
#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <vector>
#include <atomic>

/// @brief screenstreamer
///
/// This tool runs a screen capture producer, splits its MJPEG output into frames and serves them
/// as an HTTP MJPEG stream.
///
/// With the default options, it runs:
/// @verbatim ffmpeg -f x11grab -i :0.0 -vf fps=15 -q:v 5 -f mjpeg - @endverbatim
/// and serves the stream on every interface, port 5000. Open @c http://<your-lan-ip>:5000 in a
/// browser, or watch the raw stream with:
/// @verbatim ffplay -f mjpeg http://127.0.0.1:5000/stream @endverbatim
///
/// Any other program which writes concatenated JPEG images on stdout can be used instead:
/// @verbatim screenstreamer --producer gst-launch-1.0 --producer-arg=-q --producer-arg=ximagesrc --producer-arg=! --producer-arg=jpegenc --producer-arg=! --producer-arg=fdsink @endverbatim
///
/// The tool stops on SIGINT or SIGTERM, or when the producer exits.
int main(int argc, char** argv)
{
    screenstreamer::session::SessionConfig config;

    std::vector<std::string> producerArgs;
    uint32_t minIntervalMs;
    uint32_t stopTimeoutMs;
    std::string configFilename;
    std::string previewDumpPath;
    {
        po::options_description desc(
            std::string("screenstreamer ") + screenstreamer::version::GIT_COMMIT_TAG +
            " (" + screenstreamer::version::GIT_COMMIT_DATE + ")" +
            "\n\nAllowed options"
        );

        // the same keys can be used in the configuration file
        po::options_description streamDesc;
        streamDesc.add_options()
            ("producer", po::value<std::string>(&config.producer.executable)->default_value("ffmpeg"),
             "Run PRODUCER to capture the screen as MJPEG on stdout")
            ("producer-arg", po::value<std::vector<std::string>>(&producerArgs)->composing(),
             "Pass ARG to the producer (repeatable), replaces the built-in capture arguments")
            ("display", po::value<std::string>(&config.producer.display)->default_value(":0.0"),
             "Capture X11 DISPLAY")
            ("fps", po::value<uint16_t>(&config.producer.frameRate)->default_value(15),
             "Capture FPS frames per second")
            ("quality", po::value<uint16_t>(&config.producer.quality)->default_value(5),
             "JPEG QUALITY of the producer (ffmpeg -q:v, 2 is best)")
            ("scale-width", po::value<uint16_t>(&config.producer.scaleWidth)->default_value(0),
             "Scale captured frames to WIDTH (0 keeps the screen size)")
            ("stop-timeout-ms", po::value<uint32_t>(&stopTimeoutMs)->default_value(2000),
             "Kill the producer when it did not quit after MS milliseconds")

            ("address", po::value<std::string>(&config.server.address)->default_value("0.0.0.0"),
             "Serve HTTP stream on ADDR")
            ("port", po::value<uint16_t>(&config.server.port)->default_value(5000),
             "Serve HTTP stream on PORT")
            ("http-threads", po::value<uint16_t>(&config.server.threadCount)->default_value(2),
             "Number of HTTP I/O threads")
            ("min-interval-ms", po::value<uint32_t>(&minIntervalMs)->default_value(66),
             "Send at most one frame every MS milliseconds to each viewer")

            ("max-buffer-size", po::value<uint32_t>(&config.maxBufferSize)->default_value(10*1024*1024),
             "Drop the capture buffer when a frame gets bigger than SIZE bytes")

            ("preview-width", po::value<uint32_t>(&config.previewWidth)->default_value(0),
             "Decode a preview of WIDTH pixels (0 disables the preview)")
            ("preview-dump-path", po::value<std::string>(&previewDumpPath)->default_value(""),
             "Write the latest preview to PATH as PPM")
        ;

        desc.add(streamDesc);
        desc.add_options()
            ("config", po::value<std::string>(&configFilename)->default_value(""),
             "Read options from INI FILE")
            ("verbose,v", "Verbose log mode")
            ("help,h", "Show this help message")
        ;

        po::variables_map vm;
        try
        {
            po::store(po::parse_command_line(argc, argv, desc), vm);

            // command line values win over the configuration file
            if(vm.count("config") && !vm["config"].as<std::string>().empty())
            {
                const auto filename = vm["config"].as<std::string>();
                std::ifstream configFile(filename);
                if(!configFile)
                {
                    std::cerr << "Error: cannot open configuration file " << filename << std::endl;
                    return 1;
                }
                po::store(po::parse_config_file(configFile, streamDesc), vm);
            }
            po::notify(vm);
        }
        catch(const po::error &e)
        {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << desc << std::endl;
            return 1;
        }

        if(vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        if(vm.count("verbose"))
            config.isVerbose = true;
    }

    config.producer.arguments = producerArgs;
    config.producer.stopTimeout = std::chrono::milliseconds(stopTimeoutMs);
    config.server.minInterval = std::chrono::milliseconds(minIntervalMs);
    config.server.isVerbose = config.isVerbose;

    std::cout << "screenstreamer " << screenstreamer::version::GIT_COMMIT_TAG
              << " (" << screenstreamer::version::GIT_COMMIT_DATE << ")" << std::endl;

    boost::asio::io_context ioContext;

    std::atomic<uint64_t> previewCount{0};
    const bool isVerbose = config.isVerbose;
    auto previewHandler = [&previewCount, previewDumpPath, isVerbose](screenstreamer::jpeg::PreviewImagePtr image)
    {
        if(!image)
        {
            // session stopped
            return;
        }

        previewCount++;
        if(isVerbose && (previewCount % 100 == 0))
        {
            std::cout << "Preview " << image->sequence << ": "
                      << image->width << "x" << image->height << std::endl;
        }

        if(!previewDumpPath.empty())
        {
            image->writePpm(previewDumpPath);
        }
    };

    using Status = screenstreamer::session::SessionController::Status;
    auto statusHandler = [&ioContext](Status status, const std::string &text)
    {
        std::cout << "Status: " << text << std::endl;

        // the producer exited on its own
        if(status == Status::Stopped)
        {
            boost::asio::post(ioContext, [&ioContext]{ ioContext.stop(); });
        }
    };

    screenstreamer::session::SessionController sessionController(previewHandler, statusHandler);

    const auto startResult = sessionController.startSession(config);
    if(!startResult.isOk())
    {
        std::cerr << "Error: " << screenstreamer::common::toString(startResult.code)
                  << ": " << startResult.message << std::endl;
        return 1;
    }

    boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
    signals.async_wait(
        [&ioContext](const boost::system::error_code &ec, int signalNumber)
        {
            if(!ec)
            {
                std::cout << "Signal " << signalNumber << " received, stopping" << std::endl;
            }
            ioContext.stop();
        }
    );

    ioContext.run();

    const auto stopResult = sessionController.stopSession();
    if(!stopResult.isOk())
    {
        std::cerr << "Error: " << screenstreamer::common::toString(stopResult.code)
                  << ": " << stopResult.message << std::endl;
        return 1;
    }

    if(config.previewWidth > 0)
    {
        std::cout << previewCount.load() << " previews" << std::endl;
    }

    return 0;
}
