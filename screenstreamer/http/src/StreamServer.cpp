// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/http/include/StreamServer.hpp"
#include "screenstreamer/http/include/StreamConnection.hpp"

// Boost includes:
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

// Std includes:
#include <algorithm>
#include <iostream>

namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

screenstreamer::http::StreamServer::StreamServer(const ServerConfig &config, store::FrameStore &frameStore,
                                                 common::CancellationToken cancellationToken)
    : m_config(config)
    , m_frameStore(frameStore)
    , m_cancellationToken(std::move(cancellationToken))
    , m_acceptor(m_ioContext)
{ }

screenstreamer::http::StreamServer::~StreamServer()
{
    stop();
}

void screenstreamer::http::StreamServer::start()
{
    const tcp::endpoint endpoint(asio::ip::make_address(m_config.address), m_config.port);

    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(asio::socket_base::max_listen_connections);
    m_boundPort = m_acceptor.local_endpoint().port();

    doAccept();

    const uint16_t threadCount = std::max<uint16_t>(1, m_config.threadCount);
    for(uint16_t i = 0; i < threadCount; i++)
    {
        m_ioThreads.emplace_back(&StreamServer::ioThreadFunc, this);
    }
    m_isStarted = true;

    std::cout << "HTTP server listening on " << m_config.address << ":" << m_boundPort
              << " (" << threadCount << " threads)" << std::endl;
}

void screenstreamer::http::StreamServer::stop()
{
    if(!m_isStarted)
    {
        boost::system::error_code ec;
        m_acceptor.close(ec);
        return;
    }
    m_isStarted = false;

    asio::post(m_ioContext,
        [this]
        {
            boost::system::error_code ec;
            m_acceptor.close(ec);
        }
    );

    uint32_t closedCount = 0;
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        m_isStopping = true;

        for(const auto &weakConnection : m_connections)
        {
            if(const auto connection = weakConnection.lock())
            {
                connection->close();
                closedCount++;
            }
        }
        m_connections.clear();
    }

    // returns once every connection handler has completed
    for(auto &ioThread : m_ioThreads)
    {
        ioThread.join();
    }
    m_ioThreads.clear();

    std::cout << "HTTP server stopped, " << closedCount << " connections closed" << std::endl;
}

uint32_t screenstreamer::http::StreamServer::streamingCount()
{
    std::lock_guard<std::mutex> lock(m_connectionsMutex);

    uint32_t count = 0;
    for(const auto &weakConnection : m_connections)
    {
        const auto connection = weakConnection.lock();
        if(connection && connection->isStreaming())
        {
            count++;
        }
    }
    return count;
}

void screenstreamer::http::StreamServer::doAccept()
{
    m_acceptor.async_accept(asio::make_strand(m_ioContext),
        [this](const boost::system::error_code &ec, tcp::socket socket)
        {
            if(ec == asio::error::operation_aborted)
            {
                return;
            }

            if(ec)
            {
                std::cerr << "Error: HTTP accept failed: " << ec.message() << std::endl;
                doAccept();
                return;
            }

            std::shared_ptr<StreamConnection> connection;
            {
                std::lock_guard<std::mutex> lock(m_connectionsMutex);
                if(m_isStopping)
                {
                    boost::system::error_code closeError;
                    socket.close(closeError);
                    return;
                }

                // forget connections which are already gone
                m_connections.erase(
                    std::remove_if(m_connections.begin(), m_connections.end(),
                                   [](const std::weak_ptr<StreamConnection> &c) { return c.expired(); }),
                    m_connections.end()
                );

                connection = std::make_shared<StreamConnection>(
                    std::move(socket), m_config, m_frameStore, m_cancellationToken, m_nextConnectionId++);
                m_connections.push_back(connection);
            }

            connection->start();
            doAccept();
        }
    );
}

void screenstreamer::http::StreamServer::ioThreadFunc()
{
    try
    {
        m_ioContext.run();
    }
    catch(const std::exception &e)
    {
        std::cerr << "Error: HTTP I/O thread stopped: " << e.what() << std::endl;
    }
}
