// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/process/include/ChunkSource.hpp"
#include "screenstreamer/process/include/ProducerConfig.hpp"

// Boost includes:
#include <boost/asio/io_context.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/pipe.hpp>

// Std includes:
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace screenstreamer {
namespace process {

/// @brief Capture producer running as a child process
///
/// The producer writes its MJPEG stream on stdout, which is read with @ref readChunk.
/// Its stderr is drained line by line in a side thread, only so that the producer never blocks
/// on a full pipe. Lines go to the diagnostic handler and are never interpreted.
///
/// Stopping is done in two phases (see @ref requestStop): the quit command is written on the
/// producer's stdin, so that it can release the capture device cleanly, then the process is
/// killed if it did not exit within the timeout.
///
/// The producer runs in its own process group. Helpers it starts (a wrapper script running
/// ffmpeg, for instance) belong to that group and are killed with it, so none of them can keep
/// the output pipes open after a stop.
///
/// @verbatim
/// Running --requestStop--> StopRequested --exit--> Exited
///    |                          `--timeout--> ForceKilled
///    `--exit on its own--> Exited
/// @endverbatim
class SubprocessPipe : public ChunkSource
{
public:
    enum class State
    {
        Running,
        StopRequested,
        Exited,
        ForceKilled
    };

    using LineHandler = std::function<void(const std::string&)>;

public:
    /// @brief Launches the producer
    /// @throw common::LaunchError if the executable is not found or cannot be started
    static std::unique_ptr<SubprocessPipe> start(const ProducerConfig &config, LineHandler diagnosticHandler);

    ~SubprocessPipe();

    SubprocessPipe(const SubprocessPipe&) = delete;
    SubprocessPipe& operator=(const SubprocessPipe&) = delete;

public:
    uint32_t readChunk(uint8_t *buffer, uint32_t bufferSize) override;

    /// @brief Asks the producer to quit, and kills it after @p timeout
    ///
    /// Safe to call several times and from another thread than the reader. Once this returns,
    /// no process of the producer group is running anymore. After a forced stop, a pending or
    /// later @ref readChunk reports the end of stream right away.
    State requestStop(std::chrono::milliseconds timeout);

public:
    State state() const
    {
        return m_state.load();
    }

    bool isRunning();
    int exitCode();

    int pid() const
    {
        return m_child.id();
    }

    const std::string& name() const
    {
        return m_name;
    }

private:
    SubprocessPipe(const ProducerConfig &config, LineHandler diagnosticHandler);
    void stderrThreadFunc();
    void readStderr();
    void forwardLine(const std::string &line);
    void joinStderrThread();

    bool waitForExit(std::chrono::milliseconds timeout);
    void writeQuitCommand();
    void killGroup();
    void closeOutputs();

private:
    const std::string m_name;
    const std::string m_quitCommand;
    const std::chrono::milliseconds m_stopTimeout;
    const LineHandler m_diagnosticHandler;

private:
    // stdout is driven by the reader thread, stderr by m_stderrThread
    boost::asio::io_context m_stdoutContext;
    boost::asio::io_context m_stderrContext;
    boost::process::async_pipe m_stdoutPipe;
    boost::process::async_pipe m_stderrPipe;
    boost::process::pipe m_stdinPipe;
    boost::process::child m_child;
    std::thread m_stderrThread;
    std::array<char, 1024> m_stderrBuffer;
    std::string m_stderrLine;
    std::atomic<bool> m_isOutputClosed{false};

private:
    std::mutex m_stopMutex;
    std::atomic<State> m_state{State::Running};
};

const char* toString(SubprocessPipe::State state);


} // namespace process
} // namespace screenstreamer
