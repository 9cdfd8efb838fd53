#include "core/derivative_cache.hpp"
#include "core/error_recovery.hpp"
#include "core/media_classifier.hpp"
#include "core/media_errors.hpp"
#include "logging/logger.hpp"

namespace
{
    // Video and vector originals are never resized
    bool servedRaw(const fs::path &original)
    {
        MediaKind kind = MediaClassifier::kindFromExtension(original.extension().string());
        return kind == MediaKind::VIDEO || kind == MediaKind::VECTOR;
    }
}

// Holds a key in flight until every owner (request and resize worker) lets go
struct DerivativeCache::KeyClaim
{
    std::shared_ptr<InFlight> in_flight;
    std::string key;

    ~KeyClaim()
    {
        {
            std::lock_guard<std::mutex> lock(in_flight->mutex);
            in_flight->keys.erase(key);
        }
        in_flight->cv.notify_all();
    }
};

DerivativeCache::DerivativeCache(AssetStore &store, const KeyCodec &codec, std::shared_ptr<ImageTranscoder> transcoder,
                                 std::chrono::seconds resize_timeout)
    : store_(store), codec_(codec), transcoder_(std::move(transcoder)), resize_timeout_(resize_timeout),
      in_flight_(std::make_shared<InFlight>())
{
}

fs::path DerivativeCache::getOrCreate(const std::string &original_name, const std::string &width,
                                      const std::string &height)
{
    // Size is parsed only for originals that exist and can be resized
    fs::path original = store_.resolve(original_name);
    if (servedRaw(original))
        return original;
    return getOrCreate(original_name, codec_.parseDimensions(width, height));
}

fs::path DerivativeCache::getOrCreate(const std::string &original_name, const DerivativeSize &size)
{
    fs::path original = store_.resolve(original_name);
    if (!KeyCodec::requiresDerivative(size) || servedRaw(original))
        return original;

    const std::string key = KeyCodec::derive(original_name, size);
    fs::path derivative = store_.resolveDerivative(key);
    if (store_.exists(derivative))
    {
        Logger::debug("DerivativeCache: hit " + key);
        return derivative;
    }

    {
        std::unique_lock<std::mutex> lock(in_flight_->mutex);
        bool released = in_flight_->cv.wait_for(lock, resize_timeout_, [this, &key]()
                                                { return in_flight_->keys.count(key) == 0; });
        if (!released)
        {
            Logger::warn("DerivativeCache: gave up waiting for in-flight " + key);
            throw InternalFailure("Timed out waiting for " + key);
        }
        // Another request may have produced it while we waited
        if (store_.exists(derivative))
            return derivative;
        in_flight_->keys.insert(key);
    }

    std::shared_ptr<KeyClaim> claim(new KeyClaim{in_flight_, key});
    return generate(original, size, claim);
}

size_t DerivativeCache::generatedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generated_;
}

fs::path DerivativeCache::generate(const fs::path &original, const DerivativeSize &size,
                                   const std::shared_ptr<KeyClaim> &claim)
{
    const std::string &key = claim->key;
    Logger::debug("DerivativeCache: miss " + key + ", generating");

    // The worker keeps its own claim, so a timed-out resize still blocks the key until it returns
    std::shared_ptr<ImageTranscoder> transcoder = transcoder_;
    std::string bytes = ErrorRecovery::callWithTimeout(
        [transcoder, original, size, claim]()
        { return transcoder->resize(original, size); },
        std::chrono::duration_cast<std::chrono::milliseconds>(resize_timeout_), "resize " + key);

    fs::path stored = store_.putDerivative(bytes, key);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generated_;
    }
    Logger::info("DerivativeCache: generated " + key + " (" + std::to_string(bytes.size()) + " bytes)");
    return stored;
}
