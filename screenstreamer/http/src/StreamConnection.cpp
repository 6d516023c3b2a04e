// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/http/include/StreamConnection.hpp"

// Boost includes:
#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>

// Std includes:
#include <cstring>
#include <iostream>

namespace asio = boost::asio;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

screenstreamer::http::StreamConnection::StreamConnection(tcp::socket &&socket,
                                                         const ServerConfig &config,
                                                         store::FrameStore &frameStore,
                                                         common::CancellationToken cancellationToken,
                                                         uint64_t connectionId)
    : m_socket(std::move(socket))
    , m_timer(m_socket.get_executor())
    , m_config(config)
    , m_frameStore(frameStore)
    , m_cancellationToken(std::move(cancellationToken))
    , m_connectionId(connectionId)
{ }

screenstreamer::http::StreamConnection::~StreamConnection() = default;

void screenstreamer::http::StreamConnection::start()
{
    asio::dispatch(m_socket.get_executor(),
        [self = shared_from_this()]
        {
            boost::system::error_code ec;
            // parts are small and must leave as soon as written
            self->m_socket.set_option(tcp::no_delay(true), ec);
            self->readRequest();
        }
    );
}

void screenstreamer::http::StreamConnection::close()
{
    asio::post(m_socket.get_executor(),
        [self = shared_from_this()]
        {
            self->finish("server stopped");
            self->doClose();
        }
    );
}

void screenstreamer::http::StreamConnection::readRequest()
{
    bhttp::async_read(m_socket, m_requestBuffer, m_request,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t)
        {
            self->onRequest(ec);
        }
    );
}

void screenstreamer::http::StreamConnection::onRequest(const boost::system::error_code &ec)
{
    if(ec)
    {
        finish("request not received", ec);
        doClose();
        return;
    }

    std::string target(m_request.target().data(), m_request.target().size());
    const auto queryPos = target.find('?');
    if(queryPos != std::string::npos)
    {
        target.resize(queryPos);
    }

    if(m_config.isVerbose)
    {
        std::cout << "HTTP #" << m_connectionId << ": " << m_request.method_string() << " " << target << std::endl;
    }

    if(m_request.method() != bhttp::verb::get)
    {
        sendResponse(bhttp::status::method_not_allowed, "text/plain", "Method Not Allowed\n");
    }
    else if(target == streamPath)
    {
        sendStreamHeader();
    }
    else if(target == "/")
    {
        sendResponse(bhttp::status::ok, "text/html", m_config.indexPage);
    }
    else
    {
        sendResponse(bhttp::status::not_found, "text/plain", "Not Found\n");
    }
}

void screenstreamer::http::StreamConnection::sendResponse(bhttp::status status, const std::string &contentType,
                                                          const std::string &body)
{
    m_response = std::make_unique<bhttp::response<bhttp::string_body>>(status, m_request.version());
    m_response->set(bhttp::field::server, "screenstreamer");
    m_response->set(bhttp::field::content_type, contentType);
    m_response->keep_alive(false);
    m_response->body() = body;
    m_response->prepare_payload();

    bhttp::async_write(m_socket, *m_response,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t)
        {
            self->finish("response sent", ec);
            self->doClose();
        }
    );
}

void screenstreamer::http::StreamConnection::sendStreamHeader()
{
    m_streamResponse = std::make_unique<bhttp::response<bhttp::empty_body>>(bhttp::status::ok, m_request.version());
    m_streamResponse->set(bhttp::field::server, "screenstreamer");
    m_streamResponse->set(bhttp::field::content_type, streamContentType);
    m_streamResponse->set(bhttp::field::cache_control, "no-cache, no-store, must-revalidate");
    m_streamResponse->set(bhttp::field::pragma, "no-cache");
    m_streamResponse->set(bhttp::field::expires, "0");
    m_streamResponse->keep_alive(false);

    // Only the header goes through the serializer. The body is an endless sequence of parts
    // written directly on the socket, without content length or chunked encoding.
    m_streamSerializer = std::make_unique<bhttp::response_serializer<bhttp::empty_body>>(*m_streamResponse);

    bhttp::async_write_header(m_socket, *m_streamSerializer,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t)
        {
            if(ec)
            {
                self->finish("stream header not sent", ec);
                self->doClose();
                return;
            }

            self->m_isStreaming = true;
            if(self->m_config.isVerbose)
            {
                std::cout << "HTTP #" << self->m_connectionId << ": streaming to "
                          << self->m_socket.remote_endpoint(self->m_closeError) << std::endl;
            }

            self->watchClientClose();
            self->tick();
        }
    );
}

void screenstreamer::http::StreamConnection::watchClientClose()
{
    // A viewer never sends anything after its request: any completion here means it is gone.
    m_socket.async_read_some(asio::buffer(m_discardBuffer),
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t)
        {
            if(ec)
            {
                self->finish("client disconnected", ec);
                self->doClose();
                return;
            }
            self->watchClientClose();
        }
    );
}

void screenstreamer::http::StreamConnection::tick()
{
    if(m_isFinished)
    {
        return;
    }

    if(m_cancellationToken.isCancellationRequested())
    {
        finish("session stopped");
        doClose();
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if(m_hasSent)
    {
        const auto elapsed = now - m_lastSendTime;
        if(elapsed < m_config.minInterval)
        {
            waitAndTick(m_config.minInterval - elapsed);
            return;
        }
    }

    auto frame = m_frameStore.snapshot();
    if(!frame)
    {
        waitAndTick(m_config.idleRetryInterval);
        return;
    }

    sendPart(std::move(frame));
}

void screenstreamer::http::StreamConnection::waitAndTick(std::chrono::steady_clock::duration delay)
{
    m_timer.expires_after(delay);
    m_timer.async_wait(
        [self = shared_from_this()](const boost::system::error_code &ec)
        {
            // aborted by doClose()
            if(ec)
            {
                return;
            }
            self->tick();
        }
    );
}

void screenstreamer::http::StreamConnection::sendPart(jpeg::FramePtr frame)
{
    m_pendingFrame = std::move(frame);

    const std::array<asio::const_buffer, 3> partBuffers = {
        asio::buffer(partHeader, std::strlen(partHeader)),
        asio::buffer(m_pendingFrame->data(), m_pendingFrame->size()),
        asio::buffer(partTrailer, std::strlen(partTrailer))
    };

    asio::async_write(m_socket, partBuffers,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t)
        {
            self->m_pendingFrame.reset();

            if(ec)
            {
                self->finish("write failed", ec);
                self->doClose();
                return;
            }

            self->m_lastSendTime = std::chrono::steady_clock::now();
            self->m_hasSent = true;
            self->m_sentPartCount++;

            self->tick();
        }
    );
}

void screenstreamer::http::StreamConnection::doClose()
{
    m_isStreaming = false;
    m_timer.cancel();

    if(!m_socket.is_open())
    {
        return;
    }

    m_socket.shutdown(tcp::socket::shutdown_both, m_closeError);
    m_socket.close(m_closeError);
}

void screenstreamer::http::StreamConnection::finish(const char *reason, const boost::system::error_code &ec)
{
    if(m_isFinished)
    {
        return;
    }
    m_isFinished = true;
    m_isStreaming = false;

    if(m_config.isVerbose)
    {
        std::cout << "HTTP #" << m_connectionId << ": " << reason;
        if(ec)
        {
            std::cout << " (" << ec.message() << ")";
        }
        std::cout << ", " << m_sentPartCount << " parts sent" << std::endl;
    }
}
