#include "core/key_codec.hpp"
#include "core/media_errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

std::string DerivativeSize::toString() const
{
    return (width ? std::to_string(*width) : "") + "x" + (height ? std::to_string(*height) : "");
}

KeyCodec::KeyCodec(std::vector<int> valid_sizes) : valid_sizes_(std::move(valid_sizes))
{
}

std::optional<int> KeyCodec::parseSize(const std::string &text) const
{
    if (text.empty())
        return std::nullopt;

    auto invalid = [this]()
    {
        if (valid_sizes_.empty())
            return InvalidSizeError("size value must be a positive integer");
        return InvalidSizeError("size value must be one of " + describeValidSizes());
    };

    if (text.size() > 9 || !std::all_of(text.begin(), text.end(), [](unsigned char c)
                                        { return std::isdigit(c); }))
        throw invalid();

    int value = std::stoi(text);
    if (value <= 0)
        throw invalid();
    if (!valid_sizes_.empty() && std::find(valid_sizes_.begin(), valid_sizes_.end(), value) == valid_sizes_.end())
        throw invalid();
    return value;
}

DerivativeSize KeyCodec::parseDimensions(const std::string &width, const std::string &height) const
{
    DerivativeSize size;
    size.width = parseSize(width);
    size.height = parseSize(height);
    return size;
}

std::string KeyCodec::derive(const std::string &original_name, const DerivativeSize &size)
{
    if (!size.any())
        throw std::invalid_argument("derive() needs at least one dimension");

    std::filesystem::path original(original_name);
    std::filesystem::path key = original.parent_path() /
                                (original.stem().string() + "_" + size.toString() + original.extension().string());
    return key.generic_string();
}

std::string KeyCodec::describeValidSizes() const
{
    std::string result = "[";
    for (size_t i = 0; i < valid_sizes_.size(); ++i)
    {
        if (i > 0)
            result += ", ";
        result += std::to_string(valid_sizes_[i]);
    }
    return result + "]";
}
