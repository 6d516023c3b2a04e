// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <atomic>
#include <memory>

namespace screenstreamer {
namespace common {

/// @brief Read side of a cancellation signal
///
/// Tokens are cheap to copy. All copies made from the same @ref CancellationSource observe the
/// same flag, so a token can be handed to the capture thread, the preview worker and every HTTP
/// connection of one session.
class CancellationToken
{
public:
    CancellationToken()
        : m_state( std::make_shared<std::atomic<bool>>(false) )
    { }

public:
    bool isCancellationRequested() const
    {
        return m_state->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_state;

    friend class CancellationSource;
};

/// @brief Owner side of a cancellation signal
class CancellationSource
{
public:
    void cancel()
    {
        m_token.m_state->store(true, std::memory_order_release);
    }

    CancellationToken token() const
    {
        return m_token;
    }

    bool isCancellationRequested() const
    {
        return m_token.isCancellationRequested();
    }

private:
    CancellationToken m_token;
};


} // namespace common
} // namespace screenstreamer
