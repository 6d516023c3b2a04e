// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/common/include/Cancellation.hpp"
#include "screenstreamer/http/include/ServerConfig.hpp"
#include "screenstreamer/store/include/FrameStore.hpp"

// Boost includes:
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

// Std includes:
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace screenstreamer {
namespace http {

class StreamConnection;

/// @brief MJPEG over HTTP broadcast server
///
/// Serves the latest frame of a @ref store::FrameStore to any number of viewers:
///  - @c GET @c / returns a small HTML page showing the stream;
///  - @c GET @c /stream returns a @c multipart/x-mixed-replace body, one JPEG per part.
///
/// Each viewer gets its own @ref StreamConnection, paced independently from the producer and
/// from the other viewers. A slow or broken viewer only affects its own connection.
///
/// The server runs on a Boost.Asio @c io_context driven by @c threadCount threads.
/// You can watch the stream with a browser, or with:
/// @verbatim ffplay -f mjpeg http://127.0.0.1:5000/stream @endverbatim
class StreamServer
{
public:
    StreamServer(const ServerConfig &config, store::FrameStore &frameStore,
                 common::CancellationToken cancellationToken);
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

public:
    /// @brief Binds, listens and starts the I/O threads
    /// @throw boost::system::system_error if the address cannot be bound
    void start();

    /// @brief Stops accepting, closes every open connection and joins the I/O threads
    void stop();

public:
    /// Bound port, useful when configured with port 0
    uint16_t port() const
    {
        return m_boundPort;
    }

    /// Number of connections currently streaming
    uint32_t streamingCount();

    uint64_t acceptedCount() const
    {
        return m_nextConnectionId - 1;
    }

private:
    void doAccept();
    void ioThreadFunc();

private:
    const ServerConfig m_config;
    store::FrameStore &m_frameStore;
    const common::CancellationToken m_cancellationToken;

private:
    boost::asio::io_context m_ioContext;
    boost::asio::ip::tcp::acceptor m_acceptor;
    std::vector<std::thread> m_ioThreads;
    uint16_t m_boundPort = 0;
    bool m_isStarted = false;
    bool m_isStopping = false;

private:
    std::mutex m_connectionsMutex;
    std::vector<std::weak_ptr<StreamConnection>> m_connections;
    std::atomic<uint64_t> m_nextConnectionId{1};
};


} // namespace http
} // namespace screenstreamer
