#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include "core/asset_store.hpp"
#include "core/image_transcoder.hpp"
#include "core/key_codec.hpp"

namespace fs = std::filesystem;

/**
 * @brief Lazily materialized resized renditions of stored originals
 *
 * A derivative is generated on the first request for its key and reused
 * afterwards; originals are immutable so there is no freshness check.
 * Concurrent misses on the same key are collapsed into one generation, and
 * a key stays claimed until its resize returns, even after a timeout.
 */
class DerivativeCache
{
public:
    DerivativeCache(AssetStore &store, const KeyCodec &codec, std::shared_ptr<ImageTranscoder> transcoder,
                    std::chrono::seconds resize_timeout);

    /**
     * @brief Path to serve for an original and the requested size
     * @param original_name Name relative to the images root
     * @param width Raw width value, empty if unspecified
     * @param height Raw height value, empty if unspecified
     * @return The derivative, or the original when no size is requested or
     *         the original is a video or vector asset
     * @throws InvalidSizeError, PathTraversalError, NotFoundError, InternalFailure
     */
    fs::path getOrCreate(const std::string &original_name, const std::string &width, const std::string &height);

    fs::path getOrCreate(const std::string &original_name, const DerivativeSize &size);

    // Number of derivatives generated by this instance (hits excluded)
    size_t generatedCount() const;

private:
    struct InFlight
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::unordered_set<std::string> keys;
    };
    struct KeyClaim;

    fs::path generate(const fs::path &original, const DerivativeSize &size, const std::shared_ptr<KeyClaim> &claim);

    AssetStore &store_;
    const KeyCodec &codec_;
    std::shared_ptr<ImageTranscoder> transcoder_;
    std::chrono::seconds resize_timeout_;

    // Shared with resize workers, which may outlive a timed-out request
    std::shared_ptr<InFlight> in_flight_;

    mutable std::mutex mutex_;
    size_t generated_ = 0;
};
