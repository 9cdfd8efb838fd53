#include "core/asset_store.hpp"
#include "core/file_utils.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace
{
    constexpr size_t RANDOM_ID_LENGTH = 10;

    bool isWithin(const fs::path &root, const fs::path &candidate)
    {
        auto root_it = root.begin();
        auto cand_it = candidate.begin();
        for (; root_it != root.end(); ++root_it, ++cand_it)
        {
            // A trailing separator shows up as an empty element
            if (root_it->empty())
                continue;
            if (cand_it == candidate.end() || *root_it != *cand_it)
                return false;
        }
        return true;
    }
}

AssetStore::AssetStore(const fs::path &images_dir, const fs::path &cache_dir, NameStrategy name_strategy)
    : name_strategy_(name_strategy)
{
    if (!FileUtils::ensureDirectory(images_dir))
        throw InternalFailure("Cannot create images directory: " + images_dir.string());
    if (!FileUtils::ensureDirectory(cache_dir))
        throw InternalFailure("Cannot create cache directory: " + cache_dir.string());

    images_dir_ = fs::canonical(images_dir);
    cache_dir_ = fs::canonical(cache_dir);
    Logger::info("AssetStore: originals in " + images_dir_.string() + ", derivatives in " + cache_dir_.string());
}

fs::path AssetStore::put(const std::string &bytes, const std::string &name)
{
    fs::path target = containedPath(images_dir_, name);
    FileUtils::ensureDirectory(target.parent_path());
    FileUtils::writeFileAtomic(target, bytes);
    Logger::debug("AssetStore: stored original " + name + " (" + std::to_string(bytes.size()) + " bytes)");
    return target;
}

fs::path AssetStore::putFile(const fs::path &source, const std::string &name)
{
    fs::path target = containedPath(images_dir_, name);
    FileUtils::ensureDirectory(target.parent_path());
    FileUtils::moveFileAtomic(source, target);
    Logger::debug("AssetStore: stored original " + name);
    return target;
}

fs::path AssetStore::putDerivative(const std::string &bytes, const std::string &key)
{
    fs::path target = resolveDerivative(key);
    FileUtils::ensureDirectory(target.parent_path());
    FileUtils::writeFileAtomic(target, bytes);
    return target;
}

bool AssetStore::exists(const fs::path &path) const
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

fs::path AssetStore::resolve(const std::string &name) const
{
    fs::path path = containedPath(images_dir_, name);
    if (!exists(path))
        throw NotFoundError();
    return path;
}

fs::path AssetStore::resolveDerivative(const std::string &key) const
{
    return containedPath(cache_dir_, key);
}

size_t AssetStore::remove(const std::string &name)
{
    fs::path original = resolve(name);

    std::error_code ec;
    bool removed_original = fs::remove(original, ec);
    if (ec)
        throw InternalFailure("Could not remove original " + original.string() + ": " + ec.message());
    if (!removed_original)
        throw NotFoundError();

    // Derivatives mirror the original's relative location inside the cache root
    fs::path relative = original.lexically_relative(images_dir_);
    fs::path derivative_dir = cache_dir_ / relative.parent_path();
    const std::string stem = original.stem().string();
    const std::string extension = original.extension().string();

    size_t removed = 0;
    if (fs::is_directory(derivative_dir, ec))
    {
        for (fs::directory_iterator it(derivative_dir, ec), end; !ec && it != end; it.increment(ec))
        {
            const auto &entry = *it;
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec))
                continue;
            if (!isDerivativeName(entry.path().filename().string(), stem, extension))
                continue;
            if (FileUtils::removeQuietly(entry.path()))
                ++removed;
        }
    }

    Logger::info("AssetStore: deleted " + name + " and " + std::to_string(removed) + " cached derivatives");
    return removed;
}

NameStrategy AssetStore::parseNameStrategy(const std::string &name)
{
    if (name == "randomstr")
        return NameStrategy::RANDOM_STRING;
    if (name == "uuidv4")
        return NameStrategy::UUID_V4;
    throw std::invalid_argument("Unknown name strategy: " + name);
}

std::string AssetStore::generateId() const
{
    for (;;)
    {
        std::string id = name_strategy_ == NameStrategy::UUID_V4 ? FileUtils::generateUuid4()
                                                                 : FileUtils::generateRandomString(RANDOM_ID_LENGTH);
        if (!idInUse(id))
            return id;
        Logger::debug("AssetStore: generated id collided, retrying");
    }
}

bool AssetStore::idInUse(const std::string &id) const
{
    std::error_code ec;
    for (fs::directory_iterator it(images_dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->path().stem().string() == id)
            return true;
    }
    return false;
}

fs::path AssetStore::containedPath(const fs::path &root, const std::string &name) const
{
    if (name.empty() || name.find('\0') != std::string::npos)
        throw PathTraversalError();

    fs::path requested(name);
    if (requested.is_absolute() || requested.has_root_name() || requested.has_root_directory())
        throw PathTraversalError();
    for (const auto &part : requested)
    {
        if (part == "..")
            throw PathTraversalError();
    }

    fs::path candidate = (root / requested).lexically_normal();
    if (!isWithin(root, candidate) || candidate == root)
        throw PathTraversalError();

    // Follow symlinks of the parts that already exist
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec || !isWithin(root, resolved))
    {
        Logger::warn("AssetStore: rejected name escaping its root: " + name);
        throw PathTraversalError();
    }
    return resolved;
}

bool AssetStore::isDerivativeName(const std::string &file_name, const std::string &stem, const std::string &extension)
{
    // {stem}_{digits}x{digits}{extension}
    const std::string prefix = stem + "_";
    if (file_name.size() <= prefix.size() + extension.size())
        return false;
    if (file_name.compare(0, prefix.size(), prefix) != 0)
        return false;
    if (file_name.compare(file_name.size() - extension.size(), extension.size(), extension) != 0)
        return false;

    const std::string dims = file_name.substr(prefix.size(), file_name.size() - prefix.size() - extension.size());
    auto x = dims.find('x');
    if (x == std::string::npos || dims.find('x', x + 1) != std::string::npos)
        return false;
    return std::all_of(dims.begin(), dims.end(), [](unsigned char c)
                       { return c == 'x' || std::isdigit(c); });
}
