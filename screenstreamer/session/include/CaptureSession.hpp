// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/capture/include/CaptureLoop.hpp"
#include "screenstreamer/capture/include/PreviewPath.hpp"
#include "screenstreamer/common/include/Cancellation.hpp"
#include "screenstreamer/http/include/StreamServer.hpp"
#include "screenstreamer/process/include/SubprocessPipe.hpp"
#include "screenstreamer/session/include/SessionConfig.hpp"
#include "screenstreamer/store/include/LatestFrameStore.hpp"

// Std includes:
#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace screenstreamer {
namespace session {

/// @brief Everything that lives between "start stream" and "stop stream"
///
/// A session owns the producer process, the frame store, the capture thread, the optional
/// preview path and the HTTP server. All of them share the session cancellation signal.
///
/// Stop order matters: cancel first, so that every loop exits at its next step, then close the
/// HTTP connections, then stop the producer (which ends the blocking read of the capture
/// thread), and finally join the capture thread and the preview worker.
class CaptureSession
{
public:
    /// Called from the capture thread when the producer stream ended without a stop request
    using EndHandler = std::function<void()>;

public:
    CaptureSession(const SessionConfig &config, capture::PreviewPath::PreviewHandler previewHandler,
                   EndHandler endHandler);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

public:
    /// @throw common::LaunchError if the producer cannot be started
    /// @throw boost::system::system_error if the HTTP server cannot be bound
    /// @throw std::exception for any other setup failure; what was started is stopped by stop()
    void start();

    void stop();

public:
    store::LatestFrameStore& frameStore()
    {
        return m_frameStore;
    }

    http::StreamServer* server()
    {
        return m_server.get();
    }

    process::SubprocessPipe* producer()
    {
        return m_producer.get();
    }

    capture::CaptureLoop* captureLoop()
    {
        return m_captureLoop.get();
    }

    bool isCaptureRunning() const
    {
        return m_isCaptureRunning.load();
    }

private:
    void captureThreadFunc();

private:
    const SessionConfig m_config;
    const capture::PreviewPath::PreviewHandler m_previewHandler;
    const EndHandler m_endHandler;

private:
    common::CancellationSource m_cancellationSource;
    store::LatestFrameStore m_frameStore;
    std::unique_ptr<process::SubprocessPipe> m_producer;
    std::unique_ptr<capture::PreviewPath> m_previewPath;
    std::unique_ptr<capture::CaptureLoop> m_captureLoop;
    std::unique_ptr<http::StreamServer> m_server;
    std::thread m_captureThread;
    std::atomic<bool> m_isCaptureRunning{false};
    bool m_isStopped = false;
};


} // namespace session
} // namespace screenstreamer
