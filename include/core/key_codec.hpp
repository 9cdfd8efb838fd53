#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Requested derivative dimensions; an empty side follows the aspect ratio
 */
struct DerivativeSize
{
    std::optional<int> width;
    std::optional<int> height;

    bool any() const { return width.has_value() || height.has_value(); }

    // "200x" / "x100" / "200x100"
    std::string toString() const;
};

/**
 * @brief Size parsing and derivative key derivation
 *
 * Keys have the form {stem}_{width}x{height}{extension}, with an unspecified
 * side rendered as the empty string. The same (name, width, height) always
 * yields the same key.
 */
class KeyCodec
{
public:
    explicit KeyCodec(std::vector<int> valid_sizes);

    /**
     * @brief Parse a textual size value
     * @param text Raw query value; empty means unspecified
     * @return The size, or nullopt when unspecified
     * @throws InvalidSizeError if the value is not a positive integer on the allow-list
     */
    std::optional<int> parseSize(const std::string &text) const;

    DerivativeSize parseDimensions(const std::string &width, const std::string &height) const;

    /**
     * @brief Derive the derivative key for an original name
     * @param original_name Name relative to the images root (e.g. "abc123.png")
     * @param size At least one side must be set
     */
    static std::string derive(const std::string &original_name, const DerivativeSize &size);

    // False when both sides are unspecified and the original should be served
    static bool requiresDerivative(const DerivativeSize &size) { return size.any(); }

    const std::vector<int> &validSizes() const { return valid_sizes_; }

    // "[100, 200, 400]"
    std::string describeValidSizes() const;

private:
    std::vector<int> valid_sizes_;
};
