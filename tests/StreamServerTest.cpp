// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/http/include/StreamServer.hpp"
#include "screenstreamer/store/include/LatestFrameStore.hpp"
#include "TestHelpers.hpp"

// Boost includes:
#include <boost/system/system_error.hpp>

// GTest includes:
#include <gtest/gtest.h>

// Std includes:
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using screenstreamer::common::CancellationSource;
using screenstreamer::http::ServerConfig;
using screenstreamer::http::StreamServer;
using screenstreamer::jpeg::Frame;
using screenstreamer::store::LatestFrameStore;
using screenstreamer::test::HttpClient;
using screenstreamer::test::syntheticFrame;

namespace {

class StreamServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_config.address = "127.0.0.1";
        m_config.port = 0;
        m_config.minInterval = std::chrono::milliseconds(10);
        m_config.idleRetryInterval = std::chrono::milliseconds(5);

        m_server = std::make_unique<StreamServer>(m_config, m_store, m_cancellationSource.token());
        m_server->start();
    }

    void TearDown() override
    {
        m_server.reset();
    }

    void publish(uint64_t sequence, uint8_t fill)
    {
        m_store.publish(std::make_shared<const Frame>(sequence, syntheticFrame(fill)));
    }

    uint16_t port() const
    {
        return m_server->port();
    }

    /// Waits until @p count viewers are streaming, or gives up after 2 seconds
    bool waitForStreamingCount(uint32_t count)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while(std::chrono::steady_clock::now() < deadline)
        {
            if(m_server->streamingCount() == count)
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

protected:
    ServerConfig m_config;
    LatestFrameStore m_store;
    CancellationSource m_cancellationSource;
    std::unique_ptr<StreamServer> m_server;
};

} // namespace

TEST_F(StreamServerTest, bindsEphemeralPort)
{
    EXPECT_NE(port(), 0u);
}

TEST_F(StreamServerTest, servesIndexPage)
{
    HttpClient client(port());
    client.sendRequest("GET", "/");

    const auto header = client.readHeader();
    EXPECT_NE(header.find("HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_NE(header.find("Content-Type: text/html"), std::string::npos);

    const auto body = client.readToEnd();
    EXPECT_EQ(body, m_config.indexPage);
    EXPECT_NE(body.find("<img src='/stream'/>"), std::string::npos);
}

TEST_F(StreamServerTest, unknownPathIsNotFound)
{
    HttpClient client(port());
    client.sendRequest("GET", "/favicon.ico");

    const auto header = client.readHeader();
    EXPECT_NE(header.find("HTTP/1.1 404 Not Found"), std::string::npos);
}

TEST_F(StreamServerTest, postIsNotAllowed)
{
    HttpClient client(port());
    client.sendRequest("POST", "/stream");

    const auto header = client.readHeader();
    EXPECT_NE(header.find("HTTP/1.1 405 Method Not Allowed"), std::string::npos);
}

TEST_F(StreamServerTest, streamHeaderDisablesCaching)
{
    publish(1, 0x10);

    HttpClient client(port());
    client.sendRequest("GET", "/stream");

    const auto header = client.readHeader();
    EXPECT_NE(header.find("HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_NE(header.find(std::string("Content-Type: multipart/x-mixed-replace; boundary=")
                          + screenstreamer::http::boundaryToken), std::string::npos);
    EXPECT_NE(header.find("Cache-Control: no-cache, no-store, must-revalidate"), std::string::npos);
    EXPECT_NE(header.find("Pragma: no-cache"), std::string::npos);
    EXPECT_NE(header.find("Expires: 0"), std::string::npos);
    EXPECT_NE(header.find("Connection: close"), std::string::npos);
}

TEST_F(StreamServerTest, queryStringIsIgnored)
{
    publish(1, 0x10);

    HttpClient client(port());
    client.sendRequest("GET", "/stream?t=123");

    const auto header = client.readHeader();
    EXPECT_NE(header.find("multipart/x-mixed-replace"), std::string::npos);
    EXPECT_EQ(client.readPart(), syntheticFrame(0x10));
}

TEST_F(StreamServerTest, latestFrameIsResentUntilReplaced)
{
    publish(1, 0x20);

    HttpClient client(port());
    client.sendRequest("GET", "/stream");
    client.readHeader();

    EXPECT_EQ(client.readPart(), syntheticFrame(0x20));
    EXPECT_EQ(client.readPart(), syntheticFrame(0x20));
    EXPECT_EQ(client.readPart(), syntheticFrame(0x20));
}

TEST_F(StreamServerTest, viewerWaitsForFirstFrame)
{
    HttpClient client(port());
    client.sendRequest("GET", "/stream");
    client.readHeader();

    ASSERT_TRUE(waitForStreamingCount(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    publish(1, 0x30);

    EXPECT_EQ(client.readPart(), syntheticFrame(0x30));
}

TEST_F(StreamServerTest, viewerSeesFramesInPublishOrder)
{
    publish(1, 0x01);

    HttpClient client(port());
    client.sendRequest("GET", "/stream");
    client.readHeader();

    // consecutive duplicates collapse to the published sequence
    std::vector<std::vector<uint8_t>> distinctBodies;
    for(uint8_t fill = 0x01; fill <= 0x03; fill++)
    {
        while(true)
        {
            const auto body = client.readPart();
            if(distinctBodies.empty() || (distinctBodies.back() != body))
            {
                distinctBodies.push_back(body);
            }
            if(body == syntheticFrame(fill))
            {
                break;
            }
        }
        publish(fill + 1, static_cast<uint8_t>(fill + 1));
    }

    ASSERT_EQ(distinctBodies.size(), 3u);
    EXPECT_EQ(distinctBodies[0], syntheticFrame(0x01));
    EXPECT_EQ(distinctBodies[1], syntheticFrame(0x02));
    EXPECT_EQ(distinctBodies[2], syntheticFrame(0x03));
}

TEST_F(StreamServerTest, twoViewersReceiveSameFrames)
{
    publish(1, 0x40);

    HttpClient first(port());
    first.sendRequest("GET", "/stream");
    first.readHeader();

    HttpClient second(port());
    second.sendRequest("GET", "/stream");
    second.readHeader();

    EXPECT_EQ(first.readPart(), syntheticFrame(0x40));
    EXPECT_EQ(second.readPart(), syntheticFrame(0x40));
    EXPECT_TRUE(waitForStreamingCount(2));
    EXPECT_EQ(m_server->acceptedCount(), 2u);
}

TEST_F(StreamServerTest, closingOneViewerKeepsTheOther)
{
    publish(1, 0x50);

    HttpClient first(port());
    first.sendRequest("GET", "/stream");
    first.readHeader();

    HttpClient second(port());
    second.sendRequest("GET", "/stream");
    second.readHeader();

    first.readPart();
    second.readPart();
    first.close();

    EXPECT_TRUE(waitForStreamingCount(1));

    publish(2, 0x51);
    while(second.readPart() != syntheticFrame(0x51))
    { }
    EXPECT_EQ(second.readPart(), syntheticFrame(0x51));
}

TEST_F(StreamServerTest, stopClosesOpenStreams)
{
    publish(1, 0x60);

    HttpClient client(port());
    client.sendRequest("GET", "/stream");
    client.readHeader();
    client.readPart();

    const auto stopStart = std::chrono::steady_clock::now();
    m_server->stop();

    // drains the parts already sent, then sees the end of the connection
    client.readToEnd();
    EXPECT_LT(std::chrono::steady_clock::now() - stopStart, std::chrono::seconds(2));
    EXPECT_EQ(m_server->streamingCount(), 0u);
}

TEST_F(StreamServerTest, cancellationEndsStreamsAtNextTick)
{
    publish(1, 0x70);

    HttpClient client(port());
    client.sendRequest("GET", "/stream");
    client.readHeader();
    client.readPart();

    const auto cancelStart = std::chrono::steady_clock::now();
    m_cancellationSource.cancel();

    client.readToEnd();
    EXPECT_LT(std::chrono::steady_clock::now() - cancelStart, std::chrono::seconds(2));
}

TEST(StreamServerBindTest, busyPortThrows)
{
    LatestFrameStore store;
    CancellationSource cancellationSource;

    ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;

    StreamServer first(config, store, cancellationSource.token());
    first.start();

    config.port = first.port();
    StreamServer second(config, store, cancellationSource.token());
    EXPECT_THROW(second.start(), boost::system::system_error);
}

TEST(StreamServerStopTest, stopInterruptsPendingWrite)
{
    LatestFrameStore store;
    CancellationSource cancellationSource;

    ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.minInterval = std::chrono::milliseconds(200);
    config.idleRetryInterval = std::chrono::milliseconds(5);

    StreamServer server(config, store, cancellationSource.token());
    server.start();

    // far larger than the socket buffers, so the part cannot be written out
    const auto largeFrame = syntheticFrame(0x42, 32 * 1024 * 1024);
    store.publish(std::make_shared<const Frame>(1, largeFrame));

    HttpClient client(server.port());
    client.sendRequest("GET", "/stream");
    client.readHeader();

    // the client does not read: the write stays pending
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const auto stopStart = std::chrono::steady_clock::now();
    cancellationSource.cancel();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stopStart, config.minInterval);

    const auto received = client.readToEnd();
    EXPECT_LT(std::chrono::steady_clock::now() - stopStart, 2 * config.minInterval);

    // the connection ended in the middle of the part
    EXPECT_LT(received.size(), largeFrame.size());
    EXPECT_EQ(server.streamingCount(), 0u);
}
