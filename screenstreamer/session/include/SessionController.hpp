// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/common/include/Result.hpp"
#include "screenstreamer/session/include/CaptureSession.hpp"
#include "screenstreamer/session/include/SessionConfig.hpp"

// Std includes:
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace screenstreamer {
namespace session {

/// @brief Start/stop control surface
///
/// Holds at most one @ref CaptureSession. Requests never throw: failures come back as a
/// @ref common::Result and as a status change.
class SessionController
{
public:
    enum class Status
    {
        Stopped,
        Starting,
        Streaming,
        Stopping,
        Failed
    };

    /// Receives the new status and its human readable text
    using StatusHandler = std::function<void(Status, const std::string&)>;

public:
    SessionController(capture::PreviewPath::PreviewHandler previewHandler, StatusHandler statusHandler);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

public:
    common::Result startSession(const SessionConfig &config);
    common::Result stopSession();

public:
    Status status() const
    {
        return m_status.load();
    }

    std::string statusText();

    /// Current session, null when stopped
    CaptureSession* session()
    {
        return m_session.get();
    }

private:
    void setStatus(Status status, const std::string &text);
    void onCaptureEnded();

private:
    const capture::PreviewPath::PreviewHandler m_previewHandler;
    const StatusHandler m_statusHandler;

private:
    // serializes start and stop requests
    std::mutex m_controlMutex;
    std::unique_ptr<CaptureSession> m_session;

private:
    std::mutex m_statusMutex;
    std::atomic<Status> m_status{Status::Stopped};
    std::string m_statusText = "Stopped";
};

const char* toString(SessionController::Status status);


} // namespace session
} // namespace screenstreamer
