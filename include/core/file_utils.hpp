#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File utilities shared by the asset store, the cache and the upload path
 */
class FileUtils
{
public:
    /**
     * @brief Random lower-case alphanumeric string from OpenSSL's CSPRNG
     * @param length Number of characters
     * @throws InternalFailure if the random generator fails
     */
    static std::string generateRandomString(size_t length);

    /**
     * @brief RFC 4122 version 4 UUID in canonical lower-case form (8-4-4-4-12)
     * @throws InternalFailure if the random generator fails
     */
    static std::string generateUuid4();

    /**
     * @brief Write bytes so that readers never observe a partial file
     *
     * Data goes to a hidden temp file in the destination directory which is
     * then renamed over the target.
     * @throws InternalFailure on I/O errors (the temp file is removed)
     */
    static void writeFileAtomic(const fs::path &target, const std::string &data);

    /**
     * @brief Move a file into place atomically, copying across filesystems if needed
     */
    static void moveFileAtomic(const fs::path &source, const fs::path &target);

    /**
     * @brief Read a whole file
     * @throws InternalFailure if the file cannot be read
     */
    static std::string readFile(const fs::path &path);

    /**
     * @brief Remove a file, tolerating that it is already gone
     * @return true if a file was removed
     */
    static bool removeQuietly(const fs::path &path) noexcept;

    /**
     * @brief Remove regular files in dir whose name starts with prefix and that
     * were last modified more than max_age ago
     * @return Number of files removed
     */
    static size_t clearStaleFiles(const fs::path &dir, const std::string &prefix, std::chrono::seconds max_age);

    /**
     * @brief Lower-cased extension without the dot ("" when there is none)
     */
    static std::string getFileExtension(const std::string &file_name);

    /**
     * @brief Ensure a directory exists
     * @return false if it could not be created
     */
    static bool ensureDirectory(const fs::path &dir);
};

/**
 * @brief Owns a transient file and deletes it when going out of scope
 */
class ScopedTempFile
{
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(fs::path path) : path_(std::move(path)) {}
    ~ScopedTempFile() { reset(); }

    ScopedTempFile(const ScopedTempFile &) = delete;
    ScopedTempFile &operator=(const ScopedTempFile &) = delete;

    ScopedTempFile(ScopedTempFile &&other) noexcept : path_(std::move(other.path_))
    {
        other.path_.clear();
    }

    ScopedTempFile &operator=(ScopedTempFile &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    const fs::path &path() const { return path_; }

    // Stop owning the file (e.g. after it was moved into the store)
    fs::path release()
    {
        fs::path released = std::move(path_);
        path_.clear();
        return released;
    }

    void reset() noexcept
    {
        if (!path_.empty())
        {
            FileUtils::removeQuietly(path_);
            path_.clear();
        }
    }

private:
    fs::path path_;
};
