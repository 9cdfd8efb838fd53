#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every user-facing failure raised by the core
 *
 * Each error carries a short machine-readable reason code and the HTTP status
 * the web layer answers with. The message is safe to show to clients; it never
 * contains filesystem paths.
 */
class MediaError : public std::runtime_error
{
public:
    MediaError(const std::string &message, std::string code, int http_status)
        : std::runtime_error(message), code_(std::move(code)), http_status_(http_status) {}

    const std::string &code() const { return code_; }
    int httpStatus() const { return http_status_; }

private:
    std::string code_;
    int http_status_;
};

// Missing or invalid input, user-correctable
class ValidationError : public MediaError
{
public:
    explicit ValidationError(const std::string &message, const std::string &code = "VALIDATION_ERROR")
        : MediaError(message, code, 400) {}
};

// Size value not parseable or not on the allow-list
class InvalidSizeError : public ValidationError
{
public:
    explicit InvalidSizeError(const std::string &message)
        : ValidationError(message, "INVALID_SIZE") {}
};

// Content or policy violation (video too long, nudity detected, ...)
class PolicyRejection : public MediaError
{
public:
    PolicyRejection(const std::string &message, const std::string &code)
        : MediaError(message, code, 400) {}
};

class AuthError : public MediaError
{
public:
    AuthError(const std::string &message, const std::string &code)
        : MediaError(message, code, 403) {}
};

class RateLimitedError : public MediaError
{
public:
    RateLimitedError(const std::string &message, const std::string &code)
        : MediaError(message, code, 429) {}
};

class NotFoundError : public MediaError
{
public:
    NotFoundError()
        : MediaError("File not found", "NOT_FOUND", 404) {}
};

// Hostile input; reported as a validation failure without filesystem detail
class PathTraversalError : public MediaError
{
public:
    PathTraversalError()
        : MediaError("Invalid filename", "INVALID_FILENAME", 400) {}
};

/**
 * @brief Unexpected failure inside a capability (decode, encode, resize)
 *
 * what() holds the detail for logs; the web layer replies with a generic message.
 */
class InternalFailure : public MediaError
{
public:
    explicit InternalFailure(const std::string &detail)
        : MediaError(detail, "INTERNAL_ERROR", 500) {}
};

// Upload or remote payload above the configured size cap
class PayloadTooLargeError : public MediaError
{
public:
    explicit PayloadTooLargeError(const std::string &message)
        : MediaError(message, "PAYLOAD_TOO_LARGE", 413) {}
};
