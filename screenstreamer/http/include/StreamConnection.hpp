// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Local includes:
#include "screenstreamer/common/include/Cancellation.hpp"
#include "screenstreamer/http/include/ServerConfig.hpp"
#include "screenstreamer/jpeg/include/Frame.hpp"
#include "screenstreamer/store/include/FrameStore.hpp"

// Boost includes:
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>

// Std includes:
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace screenstreamer {
namespace http {

/// @brief One HTTP client of the stream server
///
/// Reads a single request, then either answers it (index page, errors) or enters the streaming
/// loop for @c /stream. All handlers of a connection run on its own strand.
///
/// Streaming loop, one step per timer tick:
///  - stop if the session is cancelled or the client went away;
///  - if the last part went out less than @c minInterval ago, wait for the rest of the interval;
///  - take the latest frame from the store, or wait @c idleRetryInterval if there is none yet;
///  - write one multipart part and remember when it was sent.
///
/// Frames published faster than the pacing interval are coalesced: each tick sends whatever is
/// the latest frame. The same frame is sent again when nothing newer arrived.
class StreamConnection : public std::enable_shared_from_this<StreamConnection>
{
public:
    StreamConnection(boost::asio::ip::tcp::socket &&socket,
                     const ServerConfig &config,
                     store::FrameStore &frameStore,
                     common::CancellationToken cancellationToken,
                     uint64_t connectionId);
    ~StreamConnection();

public:
    void start();

    /// @brief Closes the socket from any thread; pending operations complete with an error
    void close();

public:
    uint64_t id() const
    {
        return m_connectionId;
    }

    uint64_t sentPartCount() const
    {
        return m_sentPartCount.load();
    }

    bool isStreaming() const
    {
        return m_isStreaming.load();
    }

private:
    void readRequest();
    void onRequest(const boost::system::error_code &ec);
    void sendResponse(boost::beast::http::status status, const std::string &contentType, const std::string &body);

    void sendStreamHeader();
    void watchClientClose();
    void tick();
    void waitAndTick(std::chrono::steady_clock::duration delay);
    void sendPart(jpeg::FramePtr frame);

    void doClose();
    void finish(const char *reason, const boost::system::error_code &ec = {});

private:
    boost::asio::ip::tcp::socket m_socket;
    boost::asio::steady_timer m_timer;
    const ServerConfig &m_config;
    store::FrameStore &m_frameStore;
    const common::CancellationToken m_cancellationToken;
    const uint64_t m_connectionId;

private:
    boost::beast::flat_buffer m_requestBuffer;
    boost::beast::http::request<boost::beast::http::string_body> m_request;
    std::unique_ptr<boost::beast::http::response<boost::beast::http::string_body>> m_response;
    std::unique_ptr<boost::beast::http::response<boost::beast::http::empty_body>> m_streamResponse;
    std::unique_ptr<boost::beast::http::response_serializer<boost::beast::http::empty_body>> m_streamSerializer;

private:
    // frame being written, kept alive until the write completes
    jpeg::FramePtr m_pendingFrame;
    std::array<char, 64> m_discardBuffer;
    boost::system::error_code m_closeError;
    std::chrono::steady_clock::time_point m_lastSendTime;
    bool m_hasSent = false;
    bool m_isFinished = false;
    std::atomic<bool> m_isStreaming{false};
    std::atomic<uint64_t> m_sentPartCount{0};
};


} // namespace http
} // namespace screenstreamer
