// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/session/include/SessionController.hpp"
#include "screenstreamer/common/include/Error.hpp"

// Boost includes:
#include <boost/system/system_error.hpp>

// Std includes:
#include <iostream>
#include <sstream>

using Status = screenstreamer::session::SessionController::Status;

screenstreamer::session::SessionController::SessionController(capture::PreviewPath::PreviewHandler previewHandler,
                                                              StatusHandler statusHandler)
    : m_previewHandler(std::move(previewHandler))
    , m_statusHandler(std::move(statusHandler))
{ }

screenstreamer::session::SessionController::~SessionController()
{
    std::lock_guard<std::mutex> lock(m_controlMutex);
    m_session.reset();
}

screenstreamer::common::Result screenstreamer::session::SessionController::startSession(const SessionConfig &config)
{
    std::lock_guard<std::mutex> lock(m_controlMutex);

    if(m_session)
    {
        if(m_session->isCaptureRunning())
        {
            return common::Result::error(common::ErrorCode::AlreadyRunning, "A session is already running");
        }

        // the producer of the previous session exited on its own
        m_session.reset();
    }

    setStatus(Status::Starting, "Starting...");

    auto session = std::make_unique<CaptureSession>(config, m_previewHandler, [this]{ onCaptureEnded(); });
    try
    {
        session->start();
    }
    catch(const common::LaunchError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        setStatus(Status::Failed, e.what());
        return common::Result::error(common::ErrorCode::LaunchFailed, e.what());
    }
    catch(const boost::system::system_error &e)
    {
        std::ostringstream message;
        message << "Cannot listen on " << config.server.address << ":" << config.server.port
                << ": " << e.code().message();
        std::cerr << "Error: " << message.str() << std::endl;
        setStatus(Status::Failed, message.str());
        return common::Result::error(common::ErrorCode::BindFailed, message.str());
    }
    catch(const std::exception &e)
    {
        // the partly started session is stopped when it goes out of scope
        const std::string message = std::string("Cannot start session: ") + e.what();
        std::cerr << "Error: " << message << std::endl;
        setStatus(Status::Failed, message);
        return common::Result::error(common::ErrorCode::StartFailed, message);
    }

    std::ostringstream text;
    text << "Streaming on http://" << config.server.address << ":" << session->server()->port();
    m_session = std::move(session);
    setStatus(Status::Streaming, text.str());

    // the producer may already be gone, e.g. no display to grab
    if(!m_session->isCaptureRunning())
    {
        setStatus(Status::Stopped, "Stopped");
    }

    return common::Result::ok();
}

screenstreamer::common::Result screenstreamer::session::SessionController::stopSession()
{
    std::lock_guard<std::mutex> lock(m_controlMutex);

    if(!m_session)
    {
        return common::Result::error(common::ErrorCode::NotRunning, "No session is running");
    }

    setStatus(Status::Stopping, "Stopping...");
    m_session->stop();
    m_session.reset();
    setStatus(Status::Stopped, "Stopped");

    return common::Result::ok();
}

std::string screenstreamer::session::SessionController::statusText()
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    return m_statusText;
}

void screenstreamer::session::SessionController::setStatus(Status status, const std::string &text)
{
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        m_status = status;
        m_statusText = text;
    }

    if(m_statusHandler)
    {
        m_statusHandler(status, text);
    }
}

void screenstreamer::session::SessionController::onCaptureEnded()
{
    // called from the capture thread: the session is cleaned up by the next control request
    if(m_status == Status::Streaming)
    {
        setStatus(Status::Stopped, "Stopped");
    }
}

const char* screenstreamer::session::toString(SessionController::Status status)
{
    switch(status)
    {
        case Status::Stopped:   return "Stopped";
        case Status::Starting:  return "Starting";
        case Status::Streaming: return "Streaming";
        case Status::Stopping:  return "Stopping";
        case Status::Failed:    return "Failed";
    }
    return "Unknown";
}
