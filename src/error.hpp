#pragma once

#include <string>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

// Base of every error raised by the core. Callers that only care about
// "something failed" catch this, the boundary catches the subclasses to
// pick a recovery (re-prompt, retry, abort).
class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &what) : std::runtime_error(what) {}
        template<typename ...Args>
        Error(fmt::format_string<Args...> fmts, Args&&... args)
        : std::runtime_error(fmt::format(fmts, std::forward<Args>(args)...)) {}
};

// Malformed URI/URL, or a URL that does not point at the web player
class InvalidReference : public Error {
    public:
        using Error::Error;
};

class RemoteServiceError : public Error {
    public:
        using Error::Error;
        template<typename ...Args>
        RemoteServiceError(int status, fmt::format_string<Args...> fmts, Args&&... args)
        : Error(fmts, std::forward<Args>(args)...), http_status(status) {}

        // 0 when the failure happened before an HTTP status was received
        int status() const { return http_status; }

    private:
        int http_status = 0;
};

class UnsupportedFormat : public Error {
    public:
        using Error::Error;
};

class TagEncodingError : public Error {
    public:
        using Error::Error;
};
