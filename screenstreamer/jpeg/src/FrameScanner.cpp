// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/jpeg/include/FrameScanner.hpp"

// Std includes:
#include <algorithm>

screenstreamer::jpeg::FrameScanner::FrameScanner(FrameHandler frameHandler, DesyncHandler desyncHandler,
                                                 uint32_t maxBufferSize)
    : m_frameHandler(std::move(frameHandler))
    , m_desyncHandler(std::move(desyncHandler))
    , m_maxBufferSize(maxBufferSize)
{ }

uint32_t screenstreamer::jpeg::FrameScanner::scan(const uint8_t *chunk, uint32_t chunkSize)
{
    // MJPEG mini parser
    // - 0xFFD8: start of image
    // - 0xFFD9: end of image
    // See: https://stackoverflow.com/a/4614629

    if(chunkSize == 0)
    {
        return 0;
    }

    m_accumulationBuffer.insert(m_accumulationBuffer.end(), chunk, chunk + chunkSize);

    const auto bufferSize = static_cast<uint32_t>(m_accumulationBuffer.size());
    const uint8_t* const buffer = m_accumulationBuffer.data();

    uint32_t emittedCount = 0;
    uint32_t consumedOffset = 0;

    // Pairs ending before 'm_scannedByteCount' were checked by a previous call. The pair made of
    // the last old byte and the first new byte is not, so a marker split over two chunks is found.
    for(uint32_t i = std::max<uint32_t>(1, m_scannedByteCount); i < bufferSize; i++)
    {
        // end marker, not overlapping the previous frame
        if( (buffer[i - 1] == 0xFF) && (buffer[i] == 0xD9) && (i - 1 >= consumedOffset) )
        {
            std::vector<uint8_t> jpegData(buffer + consumedOffset, buffer + i + 1);
            consumedOffset = i + 1;

            m_frameCount++;
            emittedCount++;

            if(m_frameHandler)
            {
                m_frameHandler( std::make_shared<const Frame>(m_frameCount, std::move(jpegData)) );
            }
        }
    }

    // keep the unconsumed tail only
    if(consumedOffset > 0)
    {
        m_accumulationBuffer.erase(m_accumulationBuffer.begin(), m_accumulationBuffer.begin() + consumedOffset);
    }
    m_scannedByteCount = static_cast<uint32_t>(m_accumulationBuffer.size());

    // The tail never contains a marker. Past the cap, assume the stream is corrupted.
    if(m_accumulationBuffer.size() > m_maxBufferSize)
    {
        const common::StreamDesyncError desyncError(m_accumulationBuffer.size(), m_maxBufferSize);

        m_accumulationBuffer.clear();
        m_accumulationBuffer.shrink_to_fit();
        m_scannedByteCount = 0;
        m_desyncCount++;

        if(m_desyncHandler)
        {
            m_desyncHandler(desyncError);
        }
    }

    return emittedCount;
}
