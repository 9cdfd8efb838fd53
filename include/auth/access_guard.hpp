#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "auth/rate_limiter.hpp"
#include "core/server_config_manager.hpp"

enum class AccessOutcome
{
    ADMITTED,
    REJECTED,
    RATE_LIMITED
};

struct AccessDecision
{
    AccessOutcome outcome = AccessOutcome::ADMITTED;
    std::string reason;  // AUTH_REQUIRED, INVALID_TOKEN, ...; empty when admitted
    std::string message; // client facing

    bool admitted() const { return outcome == AccessOutcome::ADMITTED; }

    // Throw AuthError / RateLimitedError unless admitted
    void enforce() const;

    static AccessDecision admit() { return {}; }
    static AccessDecision reject(std::string reason, std::string message);
    static AccessDecision rateLimited(std::string reason, std::string message);
};

/**
 * @brief Gatekeeper for mutating endpoints
 *
 * Combines shared-secret bearer authentication with per-client counters for
 * failed attempts and upload quotas. The secret is never logged.
 */
class AccessGuard
{
public:
    AccessGuard(const ServerConfig &config, std::shared_ptr<RateLimiter> limiter);

    /**
     * @brief Consume upload quota for the client, then authenticate if required
     * @param client Remote address
     * @param authorization Raw Authorization header value (may be empty)
     */
    AccessDecision checkUpload(const std::string &client, const std::string &authorization);

    /**
     * @brief Authorize a delete; disabled entirely without a configured secret
     */
    AccessDecision checkDelete(const std::string &client, const std::string &authorization);

    /**
     * @brief Validate a bearer token, counting mismatches per client
     */
    AccessDecision authenticate(const std::string &client, const std::string &authorization);

    // Length-independent comparison of SHA-256 digests
    static bool constantTimeEquals(const std::string &a, const std::string &b);

private:
    std::optional<std::string> api_key_;
    bool require_for_upload_;
    bool require_for_delete_;
    RateWindow failed_auth_window_;
    std::vector<RateWindow> upload_windows_;
    std::shared_ptr<RateLimiter> limiter_;
};
