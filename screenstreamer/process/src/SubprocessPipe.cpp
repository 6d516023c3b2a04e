// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/process/include/SubprocessPipe.hpp"
#include "screenstreamer/common/include/Error.hpp"

// Boost includes:
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/process/args.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/exception.hpp>
#include <boost/filesystem/path.hpp>

// C includes:
#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

// Std includes:
#include <cstring>
#include <iostream>
#include <system_error>

namespace bp = boost::process;

screenstreamer::process::SubprocessPipe::SubprocessPipe(const ProducerConfig &config, LineHandler diagnosticHandler)
    : m_name( boost::filesystem::path(config.executable).filename().string() )
    , m_quitCommand(config.quitCommand)
    , m_stopTimeout(config.stopTimeout)
    , m_diagnosticHandler(std::move(diagnosticHandler))
    , m_stdoutPipe(m_stdoutContext)
    , m_stderrPipe(m_stderrContext)
{ }

std::unique_ptr<screenstreamer::process::SubprocessPipe> screenstreamer::process::SubprocessPipe::start(
        const ProducerConfig &config, LineHandler diagnosticHandler)
{
    boost::filesystem::path executablePath(config.executable);
    if(config.executable.find('/') == std::string::npos)
    {
        executablePath = bp::search_path(config.executable);
        if(executablePath.empty())
        {
            throw common::LaunchError("Producer executable '" + config.executable + "' not found in PATH");
        }
    }

    std::unique_ptr<SubprocessPipe> subprocess( new SubprocessPipe(config, std::move(diagnosticHandler)) );

    try
    {
        subprocess->m_child = bp::child(
            bp::exe = executablePath,
            bp::args = config.buildArguments(),
            bp::std_out > subprocess->m_stdoutPipe,
            bp::std_err > subprocess->m_stderrPipe,
            bp::std_in < subprocess->m_stdinPipe,
            // new process group, led by the producer
            bp::extend::on_exec_setup([](auto&) { ::setpgid(0, 0); })
        );
    }
    catch(const bp::process_error &e)
    {
        throw common::LaunchError("Cannot start producer '" + executablePath.string() + "': " + e.what());
    }

    subprocess->m_stderrThread = std::thread(&SubprocessPipe::stderrThreadFunc, subprocess.get());

    std::cout << "Started producer " << subprocess->m_name
              << " (pid " << subprocess->m_child.id() << ")" << std::endl;

    return subprocess;
}

screenstreamer::process::SubprocessPipe::~SubprocessPipe()
{
    requestStop(m_stopTimeout);
}

uint32_t screenstreamer::process::SubprocessPipe::readChunk(uint8_t *buffer, uint32_t bufferSize)
{
    if(m_isOutputClosed)
    {
        return 0;
    }

    boost::system::error_code readError;
    std::size_t readByteCount = 0;
    m_stdoutPipe.async_read_some(boost::asio::buffer(buffer, bufferSize),
        [&readError, &readByteCount](const boost::system::error_code &ec, std::size_t byteCount)
        {
            readError = ec;
            readByteCount = byteCount;
        }
    );

    // also runs the close posted by a forced stop, which aborts the read
    m_stdoutContext.restart();
    m_stdoutContext.run();

    if(readError)
    {
        if( (readError != boost::asio::error::eof) &&
            (readError != boost::asio::error::operation_aborted) &&
            (readError != boost::asio::error::bad_descriptor) )
        {
            std::cerr << "Error: reading from " << m_name << " failed: " << readError.message() << std::endl;
        }
        return 0;
    }
    return static_cast<uint32_t>(readByteCount);
}

screenstreamer::process::SubprocessPipe::State screenstreamer::process::SubprocessPipe::requestStop(
        std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(m_stopMutex);

    const auto currentState = m_state.load();
    if( (currentState == State::Exited) || (currentState == State::ForceKilled) )
    {
        joinStderrThread();
        return currentState;
    }

    // launch failed, there is nothing to stop
    if(!m_child.valid())
    {
        m_state = State::Exited;
        return m_state;
    }

    std::error_code ec;
    if(!m_child.running(ec))
    {
        // helpers may outlive a producer which exited on its own
        killGroup();
        m_state = State::Exited;
        joinStderrThread();
        return m_state;
    }

    m_state = State::StopRequested;

    // phase 1: graceful
    if(!m_quitCommand.empty())
    {
        writeQuitCommand();
    }
    m_stdinPipe.close();

    if(waitForExit(timeout))
    {
        killGroup();
        m_state = State::Exited;
    }
    else
    {
        // phase 2: forced
        std::cerr << "Warning: " << m_name << " did not exit within " << timeout.count()
                  << "ms, killing it" << std::endl;

        killGroup();
        m_child.wait(ec);
        closeOutputs();
        m_state = State::ForceKilled;
    }

    joinStderrThread();

    std::cout << "Producer " << m_name << " stopped (" << toString(m_state.load()) << ")" << std::endl;
    return m_state;
}

bool screenstreamer::process::SubprocessPipe::waitForExit(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(true)
    {
        std::error_code ec;
        if(!m_child.running(ec))
        {
            return true;
        }

        if(std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void screenstreamer::process::SubprocessPipe::writeQuitCommand()
{
    // A producer which closed its stdin raises SIGPIPE on this thread only: keep it pending
    // while writing, then drop it.
    sigset_t pipeSignal;
    sigemptyset(&pipeSignal);
    sigaddset(&pipeSignal, SIGPIPE);

    sigset_t previousMask;
    pthread_sigmask(SIG_BLOCK, &pipeSignal, &previousMask);

    const char *data = m_quitCommand.data();
    std::size_t remainingSize = m_quitCommand.size();
    while(remainingSize > 0)
    {
        const auto writtenSize = ::write(m_stdinPipe.native_sink(), data, remainingSize);
        if(writtenSize < 0)
        {
            if(errno == EINTR)
            {
                continue;
            }

            if(errno == EPIPE)
            {
                if(!sigismember(&previousMask, SIGPIPE))
                {
                    const timespec noWait = { 0, 0 };
                    ::sigtimedwait(&pipeSignal, nullptr, &noWait);
                }
            }
            else
            {
                std::cerr << "Error: cannot send quit command to " << m_name << ": "
                          << std::strerror(errno) << std::endl;
            }
            break;
        }

        data += writtenSize;
        remainingSize -= static_cast<std::size_t>(writtenSize);
    }

    pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
}

void screenstreamer::process::SubprocessPipe::killGroup()
{
    const pid_t groupId = m_child.id();
    if(groupId <= 0)
    {
        return;
    }

    if( (::kill(-groupId, SIGKILL) != 0) && (errno != ESRCH) )
    {
        std::cerr << "Error: cannot kill " << m_name << ": " << std::strerror(errno) << std::endl;
    }
}

void screenstreamer::process::SubprocessPipe::closeOutputs()
{
    m_isOutputClosed = true;

    boost::asio::post(m_stdoutContext,
        [this]
        {
            boost::system::error_code ec;
            m_stdoutPipe.close(ec);
        }
    );
    boost::asio::post(m_stderrContext,
        [this]
        {
            boost::system::error_code ec;
            m_stderrPipe.close(ec);
        }
    );
}

bool screenstreamer::process::SubprocessPipe::isRunning()
{
    std::lock_guard<std::mutex> lock(m_stopMutex);

    std::error_code ec;
    const bool isChildRunning = m_child.running(ec);

    auto runningState = State::Running;
    if(!isChildRunning)
    {
        m_state.compare_exchange_strong(runningState, State::Exited);
    }
    return isChildRunning;
}

int screenstreamer::process::SubprocessPipe::exitCode()
{
    std::lock_guard<std::mutex> lock(m_stopMutex);
    return m_child.exit_code();
}

void screenstreamer::process::SubprocessPipe::stderrThreadFunc()
{
    readStderr();
    m_stderrContext.run();
}

void screenstreamer::process::SubprocessPipe::readStderr()
{
    m_stderrPipe.async_read_some(boost::asio::buffer(m_stderrBuffer),
        [this](const boost::system::error_code &ec, std::size_t byteCount)
        {
            for(std::size_t i = 0; i < byteCount; i++)
            {
                const char c = m_stderrBuffer[i];
                // ffmpeg ends its progress lines with a carriage return
                if( (c == '\n') || (c == '\r') )
                {
                    if(!m_stderrLine.empty())
                    {
                        forwardLine(m_stderrLine);
                        m_stderrLine.clear();
                    }
                }
                else
                {
                    m_stderrLine.push_back(c);
                }
            }

            if(ec)
            {
                // end of stream, or closed by a forced stop
                if(!m_stderrLine.empty())
                {
                    forwardLine(m_stderrLine);
                    m_stderrLine.clear();
                }
                return;
            }
            readStderr();
        }
    );
}

void screenstreamer::process::SubprocessPipe::forwardLine(const std::string &line)
{
    if(!m_diagnosticHandler)
    {
        return;
    }

    try
    {
        m_diagnosticHandler(line);
    }
    catch(const std::exception &e)
    {
        std::cerr << "Error: diagnostic handler failed: " << e.what() << std::endl;
    }
}

void screenstreamer::process::SubprocessPipe::joinStderrThread()
{
    if(m_stderrThread.joinable())
    {
        m_stderrThread.join();
    }
}

const char* screenstreamer::process::toString(SubprocessPipe::State state)
{
    switch(state)
    {
        case SubprocessPipe::State::Running:       return "Running";
        case SubprocessPipe::State::StopRequested: return "StopRequested";
        case SubprocessPipe::State::Exited:        return "Exited";
        case SubprocessPipe::State::ForceKilled:   return "ForceKilled";
    }
    return "Unknown";
}
