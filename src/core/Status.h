// src/core/Status.h
#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace gw2util::core {

// Failure categories surfaced to the user. Every non-None kind is fatal for the
// current run.
enum class ErrorKind
{
    None,
    NotFound,      // game executable missing
    IOError,       // open / rename / copy / remove failure
    LaunchFailed,  // spawn failure or non-zero child exit
    InvalidState   // Load/Unload called out of order
};

[[nodiscard]] const char* ToString(ErrorKind kind) noexcept;

// Result of a profile or launch operation.
//
// `code` carries the OS error when there is one; `message` is the
// human-readable context ("rename a -> b").
struct Status
{
    ErrorKind       kind = ErrorKind::None;
    std::error_code code;
    std::string     message;

    [[nodiscard]] bool ok() const noexcept { return kind == ErrorKind::None; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] static Status Ok() { return {}; }

    [[nodiscard]] static Status Fail(ErrorKind k, std::string msg, std::error_code ec = {})
    {
        Status s;
        s.kind    = k;
        s.code    = ec;
        s.message = std::move(msg);
        return s;
    }
};

// "I/O error: rename Local.dat -> Local.dat.bak (Permission denied)"
[[nodiscard]] std::string Describe(const Status& status);

} // namespace gw2util::core
