#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// How generateId() names new uploads
enum class NameStrategy
{
    RANDOM_STRING, // 10 lower-case alphanumerics
    UUID_V4
};

/**
 * @brief Filesystem namespace for original assets and their derivatives
 *
 * Originals live under the images directory, derivatives under the cache
 * directory. Every name coming from a client goes through resolve(), which
 * guarantees the resulting path stays inside the corresponding root.
 */
class AssetStore
{
public:
    /**
     * @param images_dir Root for original assets (created if missing)
     * @param cache_dir Root for derivative assets (created if missing)
     * @param name_strategy Id format used for new uploads
     * @throws InternalFailure if a root cannot be created
     */
    AssetStore(const fs::path &images_dir, const fs::path &cache_dir,
               NameStrategy name_strategy = NameStrategy::RANDOM_STRING);

    /**
     * @brief Map a configured strategy name ("randomstr" or "uuidv4")
     * @throws std::invalid_argument for any other name
     */
    static NameStrategy parseNameStrategy(const std::string &name);

    const fs::path &imagesDir() const { return images_dir_; }
    const fs::path &cacheDir() const { return cache_dir_; }

    /**
     * @brief Store bytes as an original asset
     * @param bytes File content
     * @param name Basename including extension
     * @return Path of the stored file
     */
    fs::path put(const std::string &bytes, const std::string &name);

    /**
     * @brief Move a prepared file into the originals namespace
     */
    fs::path putFile(const fs::path &source, const std::string &name);

    /**
     * @brief Store a derivative under its key
     */
    fs::path putDerivative(const std::string &bytes, const std::string &key);

    bool exists(const fs::path &path) const;

    /**
     * @brief Map a client supplied name to an existing original
     * @throws PathTraversalError if the name escapes the images root
     * @throws NotFoundError if no such original exists
     */
    fs::path resolve(const std::string &name) const;

    /**
     * @brief Map a derivative key to its (possibly not yet existing) path
     * @throws PathTraversalError if the key escapes the cache root
     */
    fs::path resolveDerivative(const std::string &key) const;

    /**
     * @brief Delete an original and every derivative generated from it
     * @return Number of derivative files removed
     * @throws PathTraversalError, NotFoundError
     */
    size_t remove(const std::string &name);

    /**
     * @brief Fresh random id, in the configured format, not used by any stored original
     */
    std::string generateId() const;

    // True if some original's basename (without extension) equals id
    bool idInUse(const std::string &id) const;

private:
    fs::path containedPath(const fs::path &root, const std::string &name) const;
    static bool isDerivativeName(const std::string &file_name, const std::string &stem, const std::string &extension);

    fs::path images_dir_;
    fs::path cache_dir_;
    NameStrategy name_strategy_;
};
