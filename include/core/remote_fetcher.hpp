#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Downloads an upload given by URL
 */
class RemoteFetcher
{
public:
    virtual ~RemoteFetcher() = default;

    /**
     * @brief Stream the resource at url into destination
     * @param max_bytes Abort once the body exceeds this size
     * @throws ValidationError (FETCH_FAILED) on malformed URLs, transport
     *         errors and non-2xx answers
     * @throws PayloadTooLargeError if the body exceeds max_bytes
     */
    virtual void fetch(const std::string &url, const fs::path &destination, size_t max_bytes) = 0;
};

/**
 * @brief RemoteFetcher over cpp-httplib; follows redirects, http and https
 */
class HttpRemoteFetcher : public RemoteFetcher
{
public:
    explicit HttpRemoteFetcher(std::chrono::seconds timeout = std::chrono::seconds(30));

    void fetch(const std::string &url, const fs::path &destination, size_t max_bytes) override;

    /**
     * @brief Split an absolute URL into origin ("https://host:port") and path
     * @return false if the URL is not http(s) or has no host
     */
    static bool splitUrl(const std::string &url, std::string &origin, std::string &path);

private:
    std::chrono::seconds timeout_;
};
