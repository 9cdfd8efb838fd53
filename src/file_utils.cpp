#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <openssl/rand.h>
#include <sstream>
#include <system_error>

std::string FileUtils::generateRandomString(size_t length)
{
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    constexpr size_t alphabet_size = sizeof(alphabet) - 1;
    // Largest multiple of alphabet_size below 256, to keep the draw unbiased
    constexpr unsigned int limit = 256 - (256 % alphabet_size);

    std::string result;
    result.reserve(length);
    unsigned char buffer[64];
    while (result.size() < length)
    {
        if (RAND_bytes(buffer, sizeof(buffer)) != 1)
            throw InternalFailure("RAND_bytes failed");
        for (unsigned char byte : buffer)
        {
            if (byte >= limit)
                continue;
            result.push_back(alphabet[byte % alphabet_size]);
            if (result.size() == length)
                break;
        }
    }
    return result;
}

std::string FileUtils::generateUuid4()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        throw InternalFailure("RAND_bytes failed");
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < sizeof(bytes); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            result.push_back('-');
        result.push_back(hex[bytes[i] >> 4]);
        result.push_back(hex[bytes[i] & 0x0f]);
    }
    return result;
}

void FileUtils::writeFileAtomic(const fs::path &target, const std::string &data)
{
    fs::path temp = target.parent_path() / ("." + target.filename().string() + ".tmp-" + generateRandomString(8));
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            throw InternalFailure("Could not open temp file for writing: " + temp.string());
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good())
        {
            out.close();
            removeQuietly(temp);
            throw InternalFailure("Failed writing temp file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec)
    {
        removeQuietly(temp);
        throw InternalFailure("Could not rename " + temp.string() + " to " + target.string() + ": " + ec.message());
    }
}

void FileUtils::moveFileAtomic(const fs::path &source, const fs::path &target)
{
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec)
        return;

    // Different filesystems: stage a copy next to the target, then rename
    Logger::debug("Rename failed (" + ec.message() + "), copying " + source.string() + " instead");
    writeFileAtomic(target, readFile(source));
    removeQuietly(source);
}

std::string FileUtils::readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw InternalFailure("Could not open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw InternalFailure("Failed reading file: " + path.string());
    return ss.str();
}

bool FileUtils::removeQuietly(const fs::path &path) noexcept
{
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec)
    {
        Logger::warn("Could not remove " + path.string() + ": " + ec.message());
        return false;
    }
    return removed;
}

size_t FileUtils::clearStaleFiles(const fs::path &dir, const std::string &prefix, std::chrono::seconds max_age)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return 0;

    size_t removed = 0;
    const auto now = fs::file_time_type::clock::now();
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto &entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec))
            continue;
        const std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0)
            continue;
        auto modified = entry.last_write_time(entry_ec);
        if (entry_ec)
            continue;
        if (now - modified > max_age && removeQuietly(entry.path()))
            ++removed;
    }

    if (removed > 0)
        Logger::debug("Removed " + std::to_string(removed) + " stale transient files from " + dir.string());
    return removed;
}

std::string FileUtils::getFileExtension(const std::string &file_name)
{
    std::string ext = fs::path(file_name).extension().string();
    if (ext.size() <= 1)
        return "";
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool FileUtils::ensureDirectory(const fs::path &dir)
{
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    fs::create_directories(dir, ec);
    if (ec)
    {
        Logger::error("Could not create directory " + dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}
