// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/session/include/CaptureSession.hpp"

// Boost includes:
#include <boost/system/system_error.hpp>

// Std includes:
#include <iostream>

screenstreamer::session::CaptureSession::CaptureSession(const SessionConfig &config,
                                                        capture::PreviewPath::PreviewHandler previewHandler,
                                                        EndHandler endHandler)
    : m_config(config)
    , m_previewHandler(std::move(previewHandler))
    , m_endHandler(std::move(endHandler))
{ }

screenstreamer::session::CaptureSession::~CaptureSession()
{
    stop();
}

void screenstreamer::session::CaptureSession::start()
{
    const bool isVerbose = m_config.isVerbose;
    const std::string producerName = m_config.producer.executable;

    // throws LaunchError, nothing else is running yet
    m_producer = process::SubprocessPipe::start(m_config.producer,
        [isVerbose, producerName](const std::string &line)
        {
            if(isVerbose)
            {
                std::cerr << "[" << producerName << "] " << line << std::endl;
            }
        }
    );

    m_server = std::make_unique<http::StreamServer>(m_config.server, m_frameStore, m_cancellationSource.token());
    try
    {
        m_server->start();
    }
    catch(const boost::system::system_error &)
    {
        m_cancellationSource.cancel();
        m_server.reset();
        m_producer->requestStop(m_config.producer.stopTimeout);
        m_isStopped = true;
        throw;
    }

    if((m_config.previewWidth > 0) && m_previewHandler)
    {
        m_previewPath = std::make_unique<capture::PreviewPath>(
            m_config.previewWidth, m_previewHandler, m_cancellationSource.token());
    }

    m_captureLoop = std::make_unique<capture::CaptureLoop>(
        *m_producer, m_frameStore, m_previewPath.get(), m_cancellationSource.token(),
        m_config.readChunkSize, m_config.maxBufferSize, m_config.isVerbose);

    m_isCaptureRunning = true;
    m_captureThread = std::thread(&CaptureSession::captureThreadFunc, this);
}

void screenstreamer::session::CaptureSession::stop()
{
    if(m_isStopped)
    {
        return;
    }
    m_isStopped = true;

    m_cancellationSource.cancel();

    if(m_server)
    {
        m_server->stop();
    }

    // ends the blocking read of the capture thread
    process::SubprocessPipe::State producerState = process::SubprocessPipe::State::Exited;
    if(m_producer)
    {
        producerState = m_producer->requestStop(m_config.producer.stopTimeout);
    }

    if(m_captureThread.joinable())
    {
        m_captureThread.join();
    }

    if(m_previewPath)
    {
        m_previewPath->stop();
        if(m_previewHandler)
        {
            m_previewHandler(nullptr);
        }
    }

    m_frameStore.clear();

    if(m_producer)
    {
        std::cout << "Session stopped: producer " << process::toString(producerState)
                  << " (exit code " << m_producer->exitCode() << ")";
        if(m_captureLoop)
        {
            std::cout << ", " << m_captureLoop->frameCount() << " frames captured";
        }
        if(m_previewPath)
        {
            std::cout << ", " << m_previewPath->decodedCount() << " previews ("
                      << m_previewPath->droppedCount() << " dropped)";
        }
        std::cout << std::endl;
    }
}

void screenstreamer::session::CaptureSession::captureThreadFunc()
{
    try
    {
        m_captureLoop->run();
    }
    catch(const std::exception &e)
    {
        std::cerr << "Error: capture stopped: " << e.what() << std::endl;
    }
    m_isCaptureRunning = false;

    // the producer went away on its own
    if(!m_cancellationSource.isCancellationRequested())
    {
        if(m_producer->isRunning())
        {
            std::cout << "Capture: producer closed its output" << std::endl;
        }
        else
        {
            std::cout << "Capture: producer exited with code " << m_producer->exitCode() << std::endl;
        }

        if(m_endHandler)
        {
            m_endHandler();
        }
    }
}
