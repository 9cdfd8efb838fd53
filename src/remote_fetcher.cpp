#include "core/remote_fetcher.hpp"
#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <httplib.h>
#include <regex>

HttpRemoteFetcher::HttpRemoteFetcher(std::chrono::seconds timeout) : timeout_(timeout)
{
}

bool HttpRemoteFetcher::splitUrl(const std::string &url, std::string &origin, std::string &path)
{
    static const std::regex URL_PATTERN(R"(^(https?)://([^/?#\s]+)([^#\s]*)(#.*)?$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, URL_PATTERN))
        return false;

    origin = match[1].str() + "://" + match[2].str();
    path = match[3].str();
    if (path.empty() || path[0] != '/')
        path = "/" + path;
    return true;
}

void HttpRemoteFetcher::fetch(const std::string &url, const fs::path &destination, size_t max_bytes)
{
    std::string origin, path;
    if (!splitUrl(url, origin, path))
        throw ValidationError("Invalid URL", "FETCH_FAILED");

    httplib::Client client(origin);
    client.set_follow_location(true);
    client.set_connection_timeout(timeout_.count(), 0);
    client.set_read_timeout(timeout_.count(), 0);

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out)
        throw InternalFailure("Cannot open " + destination.string() + " for writing");

    size_t received = 0;
    bool too_large = false;
    auto res = client.Get(path, [&](const char *data, size_t length)
                          {
        received += length;
        if (received > max_bytes) {
            too_large = true;
            return false;
        }
        out.write(data, static_cast<std::streamsize>(length));
        return static_cast<bool>(out); });
    out.close();

    if (too_large)
    {
        FileUtils::removeQuietly(destination);
        Logger::warn("Remote upload exceeded " + std::to_string(max_bytes) + " bytes: " + origin);
        throw PayloadTooLargeError("File is too large");
    }
    if (!res)
    {
        FileUtils::removeQuietly(destination);
        Logger::warn("Remote fetch from " + origin + " failed: " + httplib::to_string(res.error()));
        throw ValidationError("Could not fetch remote file", "FETCH_FAILED");
    }
    if (res->status < 200 || res->status >= 300)
    {
        FileUtils::removeQuietly(destination);
        Logger::warn("Remote fetch from " + origin + " answered " + std::to_string(res->status));
        throw ValidationError("Could not fetch remote file", "FETCH_FAILED");
    }
    if (!out)
    {
        FileUtils::removeQuietly(destination);
        throw InternalFailure("Failed writing remote upload to " + destination.string());
    }

    Logger::debug("Fetched " + std::to_string(received) + " bytes from " + origin);
}
