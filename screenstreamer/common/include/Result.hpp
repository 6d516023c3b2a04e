// Copyright (C) 2020 Inatech srl
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#pragma once

// Std includes:
#include <string>

namespace screenstreamer {
namespace common {

enum class ErrorCode
{
    Success = 0,
    AlreadyRunning,
    NotRunning,
    LaunchFailed,
    BindFailed,
    StartFailed
};

/// @brief Outcome of a session control request
///
/// Returned by the session control surface instead of throwing, so that a GUI or CLI caller
/// can turn it into a status line directly.
struct Result
{
    ErrorCode code = ErrorCode::Success;
    std::string message;

    bool isOk() const
    {
        return code == ErrorCode::Success;
    }

    static Result ok()
    {
        return Result{};
    }

    static Result error(ErrorCode code, const std::string &message)
    {
        return Result{ code, message };
    }
};

inline const char* toString(ErrorCode code)
{
    switch(code)
    {
        case ErrorCode::Success:        return "Success";
        case ErrorCode::AlreadyRunning: return "AlreadyRunning";
        case ErrorCode::NotRunning:     return "NotRunning";
        case ErrorCode::LaunchFailed:   return "LaunchFailed";
        case ErrorCode::BindFailed:     return "BindFailed";
        case ErrorCode::StartFailed:    return "StartFailed";
    }
    return "Unknown";
}


} // namespace common
} // namespace screenstreamer
