// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

// Local includes:
#include "screenstreamer/jpeg/include/Decoder.hpp"
#include "screenstreamer/common/include/Error.hpp"

// TurboJpeg includes:
#include <turbojpeg.h>
// Note: libjpeg-turbo != libturbojpeg
// => apt install libturbojpeg0-dev

// Std includes:
#include <fstream>

screenstreamer::jpeg::Decoder::Decoder()
        : m_jpegDecompressor( tjInitDecompress() )
{
    if(m_jpegDecompressor == nullptr)
    {
        throw common::DecodeError(std::string("tjInitDecompress: ") + tjGetErrorStr2(nullptr));
    }
}

screenstreamer::jpeg::Decoder::~Decoder()
{
    tjDestroy(m_jpegDecompressor);
}

void screenstreamer::jpeg::Decoder::scaledSize(uint32_t jpegWidth, uint32_t jpegHeight, uint32_t targetWidth,
                                               uint32_t &scaledWidth, uint32_t &scaledHeight)
{
    scaledWidth = jpegWidth;
    scaledHeight = jpegHeight;
    if( (targetWidth == 0) || (jpegWidth <= targetWidth) )
    {
        return;
    }

    int scalingFactorCount = 0;
    const tjscalingfactor* const scalingFactors = tjGetScalingFactors(&scalingFactorCount);

    bool isFound = false;
    uint32_t smallestWidth = jpegWidth, smallestHeight = jpegHeight;
    for(int i = 0; i < scalingFactorCount; i++)
    {
        const auto width = static_cast<uint32_t>( TJSCALED(static_cast<int>(jpegWidth), scalingFactors[i]) );
        const auto height = static_cast<uint32_t>( TJSCALED(static_cast<int>(jpegHeight), scalingFactors[i]) );

        if( (width <= targetWidth) && (!isFound || (width > scaledWidth)) )
        {
            scaledWidth = width;
            scaledHeight = height;
            isFound = true;
        }

        if(width < smallestWidth)
        {
            smallestWidth = width;
            smallestHeight = height;
        }
    }

    // even the smallest factor is wider than requested
    if(!isFound)
    {
        scaledWidth = smallestWidth;
        scaledHeight = smallestHeight;
    }
}

std::shared_ptr<screenstreamer::jpeg::PreviewImage> screenstreamer::jpeg::Decoder::decode(
        const uint8_t *jpegBuffer, uint32_t jpegBufferSize, uint32_t targetWidth)
{
    int jpegWidth = 0, jpegHeight = 0, jpegSubsamp = 0, jpegColorspace = 0;
    int tjError = 0;

    tjError = tjDecompressHeader3(m_jpegDecompressor, jpegBuffer, jpegBufferSize,
                                  &jpegWidth, &jpegHeight, &jpegSubsamp, &jpegColorspace);
    if( (tjError != 0) && (tjGetErrorCode(m_jpegDecompressor) == TJERR_FATAL) )
    {
        throw common::DecodeError(std::string("tjDecompressHeader3: ") + tjGetErrorStr2(m_jpegDecompressor));
    }
    if( (jpegWidth <= 0) || (jpegHeight <= 0) )
    {
        throw common::DecodeError("JPEG header without image size");
    }

    auto image = std::make_shared<PreviewImage>();
    scaledSize(jpegWidth, jpegHeight, targetWidth, image->width, image->height);
    image->rgbaBuffer.resize(static_cast<size_t>(image->width) * image->height * m_pixelSize);

    tjError = tjDecompress2(
        m_jpegDecompressor,
        jpegBuffer, jpegBufferSize,
        image->rgbaBuffer.data(), static_cast<int>(image->width), 0 /*pitch*/, static_cast<int>(image->height),
        TJPF_RGBA, TJFLAG_FASTDCT | TJFLAG_NOREALLOC
    );
    // Note: warnings such as "unknown JFIF revision number" still produce a complete image
    if( (tjError != 0) && (tjGetErrorCode(m_jpegDecompressor) == TJERR_FATAL) )
    {
        throw common::DecodeError(std::string("tjDecompress2: ") + tjGetErrorStr2(m_jpegDecompressor));
    }

    return image;
}

void screenstreamer::jpeg::PreviewImage::writePpm(const std::string &filename) const
{
    std::ofstream ppmFile(filename, std::ios::binary);

    // PPM header
    ppmFile << "P6 " << width << " " << height << " 255" << "\n";

    // PPM data
    const unsigned int pixelSize = 4;
    for(uint32_t i=0; i<height; i++)
    {
        for(uint32_t j=0; j<width; j++)
        {
            ppmFile << rgbaBuffer[(i*width+j)*pixelSize + 0];
            ppmFile << rgbaBuffer[(i*width+j)*pixelSize + 1];
            ppmFile << rgbaBuffer[(i*width+j)*pixelSize + 2];
            // skip alpha channel
        }
    }

    ppmFile.close();
}
