#include "auth/access_guard.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <array>
#include <openssl/crypto.h>
#include <openssl/sha.h>

namespace
{
    const std::string BEARER_PREFIX = "Bearer ";

    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest(const std::string &value)
    {
        std::array<unsigned char, SHA256_DIGEST_LENGTH> out{};
        SHA256(reinterpret_cast<const unsigned char *>(value.data()), value.size(), out.data());
        return out;
    }
}

void AccessDecision::enforce() const
{
    switch (outcome)
    {
    case AccessOutcome::ADMITTED:
        return;
    case AccessOutcome::REJECTED:
        throw AuthError(message, reason);
    case AccessOutcome::RATE_LIMITED:
        throw RateLimitedError(message, reason);
    }
}

AccessDecision AccessDecision::reject(std::string reason, std::string message)
{
    return {AccessOutcome::REJECTED, std::move(reason), std::move(message)};
}

AccessDecision AccessDecision::rateLimited(std::string reason, std::string message)
{
    return {AccessOutcome::RATE_LIMITED, std::move(reason), std::move(message)};
}

AccessGuard::AccessGuard(const ServerConfig &config, std::shared_ptr<RateLimiter> limiter)
    : api_key_(config.api_key),
      require_for_upload_(config.require_api_key_for_upload),
      require_for_delete_(config.require_api_key_for_delete),
      failed_auth_window_{config.max_api_key_attempts_per_minute, std::chrono::seconds(60)},
      upload_windows_{{config.max_uploads_per_minute, std::chrono::seconds(60)},
                      {config.max_uploads_per_hour, std::chrono::seconds(3600)},
                      {config.max_uploads_per_day, std::chrono::seconds(86400)}},
      limiter_(std::move(limiter))
{
    if (api_key_ && api_key_->empty())
        api_key_.reset();
}

AccessDecision AccessGuard::checkUpload(const std::string &client, const std::string &authorization)
{
    if (!limiter_->hitAll("upload:" + client, upload_windows_))
    {
        Logger::warn("Upload quota exhausted for " + client);
        return AccessDecision::rateLimited("UPLOAD_QUOTA_EXCEEDED", "Rate limit exceeded");
    }

    if (api_key_ && require_for_upload_)
        return authenticate(client, authorization);
    return AccessDecision::admit();
}

AccessDecision AccessGuard::checkDelete(const std::string &client, const std::string &authorization)
{
    if (!api_key_ || !require_for_delete_)
        return AccessDecision::reject("ENDPOINT_DISABLED", "Delete endpoint is disabled");
    return authenticate(client, authorization);
}

AccessDecision AccessGuard::authenticate(const std::string &client, const std::string &authorization)
{
    if (!api_key_)
        return AccessDecision::admit();

    if (authorization.compare(0, BEARER_PREFIX.size(), BEARER_PREFIX) != 0)
        return AccessDecision::reject("AUTH_REQUIRED", "Authorization required");

    const std::string token = authorization.substr(BEARER_PREFIX.size());
    if (constantTimeEquals(token, *api_key_))
        return AccessDecision::admit();

    if (!limiter_->hit("auth:" + client, failed_auth_window_))
    {
        Logger::warn("Too many failed API key attempts from " + client);
        return AccessDecision::rateLimited("TOO_MANY_FAILED_ATTEMPTS", "Too many failed attempts");
    }
    Logger::info("Invalid API key presented by " + client);
    return AccessDecision::reject("INVALID_TOKEN", "Invalid API key");
}

bool AccessGuard::constantTimeEquals(const std::string &a, const std::string &b)
{
    auto da = digest(a);
    auto db = digest(b);
    return CRYPTO_memcmp(da.data(), db.data(), da.size()) == 0;
}
