// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace screenstreamer {
namespace jpeg {

/// @brief Decoded RGBA image, ready for display
struct PreviewImage
{
    uint64_t sequence = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgbaBuffer;

    void writePpm(const std::string &filename) const;
};

using PreviewImagePtr = std::shared_ptr<const PreviewImage>;

/// @brief JPEG decoder class
///
/// This class is just a wrapper around @c libturbojpeg to decompress a JPEG data buffer, scaled
/// down to fit a preview width. @c libturbojpeg only scales by fixed factors (1/8, 1/4, 1/2,
/// ...), so the output is the largest scaled size whose width does not exceed the target.
///
/// A decoder is not thread-safe; use one instance per thread.
class Decoder
{
public:
    Decoder();
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

public:
    /// @throw common::DecodeError if the data is not a decodable JPEG image
    std::shared_ptr<PreviewImage> decode(const uint8_t *jpegBuffer, uint32_t jpegBufferSize, uint32_t targetWidth);

public:
    static void scaledSize(uint32_t jpegWidth, uint32_t jpegHeight, uint32_t targetWidth,
                           uint32_t &scaledWidth, uint32_t &scaledHeight);

private:
    static constexpr unsigned int m_pixelSize = 4; // because TJPF_RGBA

private:
    // tjhandler
    void* m_jpegDecompressor;
};


} // namespace jpeg
} // namespace screenstreamer
