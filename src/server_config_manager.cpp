#include "core/server_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string stripQuotes(const std::string &value)
    {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            return value.substr(1, value.size() - 2);
        return value;
    }

    // "None", "null" and the empty string all mean "unset"
    bool isUnset(const std::string &value)
    {
        return value.empty() || value == "None" || value == "null" || value == "~";
    }

    int parseInt(const std::string &key, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            int result = std::stoi(value, &consumed);
            if (consumed != value.size())
                throw std::invalid_argument(value);
            return result;
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid integer for " + key + ": " + value);
        }
    }

    double parseDouble(const std::string &key, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            double result = std::stod(value, &consumed);
            if (consumed != value.size())
                throw std::invalid_argument(value);
            return result;
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid number for " + key + ": " + value);
        }
    }

    template <typename T>
    void readScalar(const YAML::Node &node, const char *key, T &target)
    {
        if (node[key] && !node[key].IsNull())
        {
            try
            {
                target = node[key].as<T>();
            }
            catch (const YAML::Exception &e)
            {
                throw std::invalid_argument(std::string("Invalid value for ") + key + ": " + e.what());
            }
        }
    }

    template <typename T>
    void readOptional(const YAML::Node &node, const char *key, std::optional<T> &target)
    {
        if (!node[key])
            return;
        if (node[key].IsNull())
        {
            target.reset();
            return;
        }
        try
        {
            target = node[key].as<T>();
        }
        catch (const YAML::Exception &e)
        {
            throw std::invalid_argument(std::string("Invalid value for ") + key + ": " + e.what());
        }
    }

    template <typename T>
    void readList(const YAML::Node &node, const char *key, std::vector<T> &target)
    {
        if (!node[key] || node[key].IsNull())
            return;
        if (!node[key].IsSequence())
            throw std::invalid_argument(std::string("Expected a list for ") + key);
        try
        {
            target = node[key].as<std::vector<T>>();
        }
        catch (const YAML::Exception &e)
        {
            throw std::invalid_argument(std::string("Invalid value for ") + key + ": " + e.what());
        }
    }
}

ServerConfig ServerConfigManager::load(const std::string &file_path)
{
    ServerConfig config;

    if (!file_path.empty() && std::filesystem::exists(file_path))
    {
        try
        {
            config = fromYaml(YAML::LoadFile(file_path));
            Logger::info("Configuration loaded from file: " + file_path);
        }
        catch (const YAML::Exception &e)
        {
            throw std::invalid_argument("Failed to parse configuration file " + file_path + ": " + e.what());
        }
    }
    else
    {
        Logger::info("Configuration file not found (" + file_path + "), using defaults");
    }

    applyEnvironment(config);
    validate(config);
    return config;
}

ServerConfig ServerConfigManager::fromYaml(const YAML::Node &node)
{
    ServerConfig config;
    if (!node || node.IsNull())
        return config;
    if (!node.IsMap())
        throw std::invalid_argument("Configuration root must be a mapping");

    readScalar(node, "server_host", config.server_host);
    readScalar(node, "server_port", config.server_port);
    readScalar(node, "http_threads", config.http_threads);
    readScalar(node, "log_level", config.log_level);

    readScalar(node, "images_dir", config.images_dir);
    readScalar(node, "cache_dir", config.cache_dir);
    readScalar(node, "tmp_dir", config.tmp_dir);
    readOptional(node, "output_type", config.output_type);
    readScalar(node, "max_tmp_file_age_seconds", config.max_tmp_file_age_seconds);
    readScalar(node, "resize_timeout_seconds", config.resize_timeout_seconds);
    readScalar(node, "max_size_mb", config.max_size_mb);
    readScalar(node, "name_strategy", config.name_strategy);

    readScalar(node, "max_uploads_per_minute", config.max_uploads_per_minute);
    readScalar(node, "max_uploads_per_hour", config.max_uploads_per_hour);
    readScalar(node, "max_uploads_per_day", config.max_uploads_per_day);

    readList(node, "valid_sizes", config.valid_sizes);

    readOptional(node, "nude_filter_max_threshold", config.nude_filter_max_threshold);
    readScalar(node, "nude_filter_video_interval", config.nude_filter_video_interval);
    readScalar(node, "nude_filter_max_frames", config.nude_filter_max_frames);
    readScalar(node, "nude_filter_model_path", config.nude_filter_model_path);

    readScalar(node, "allow_video", config.allow_video);
    readList(node, "allowed_video_formats", config.allowed_video_formats);
    readScalar(node, "max_video_duration", config.max_video_duration);

    readScalar(node, "hide_upload_form", config.hide_upload_form);
    readOptional(node, "api_key", config.api_key);
    readScalar(node, "require_api_key_for_upload", config.require_api_key_for_upload);
    readScalar(node, "require_api_key_for_delete", config.require_api_key_for_delete);
    readScalar(node, "max_api_key_attempts_per_minute", config.max_api_key_attempts_per_minute);

    return config;
}

void ServerConfigManager::applyEnvironment(ServerConfig &config)
{
    using Setter = std::function<void(const std::string &)>;
    const std::vector<std::pair<const char *, Setter>> overrides = {
        {"SERVER_HOST", [&](const std::string &v)
         { config.server_host = v; }},
        {"SERVER_PORT", [&](const std::string &v)
         { config.server_port = parseInt("SERVER_PORT", v); }},
        {"HTTP_THREADS", [&](const std::string &v)
         { config.http_threads = parseInt("HTTP_THREADS", v); }},
        {"LOG_LEVEL", [&](const std::string &v)
         { config.log_level = v; }},
        {"IMAGES_DIR", [&](const std::string &v)
         { config.images_dir = v; }},
        {"CACHE_DIR", [&](const std::string &v)
         { config.cache_dir = v; }},
        {"TMP_DIR", [&](const std::string &v)
         { config.tmp_dir = v; }},
        {"OUTPUT_TYPE", [&](const std::string &v)
         {
             if (isUnset(v))
                 config.output_type.reset();
             else
                 config.output_type = v;
         }},
        {"MAX_TMP_FILE_AGE", [&](const std::string &v)
         { config.max_tmp_file_age_seconds = parseInt("MAX_TMP_FILE_AGE", v); }},
        {"RESIZE_TIMEOUT", [&](const std::string &v)
         { config.resize_timeout_seconds = parseInt("RESIZE_TIMEOUT", v); }},
        {"MAX_SIZE_MB", [&](const std::string &v)
         { config.max_size_mb = parseInt("MAX_SIZE_MB", v); }},
        {"NAME_STRATEGY", [&](const std::string &v)
         { config.name_strategy = v; }},
        {"MAX_UPLOADS_PER_MINUTE", [&](const std::string &v)
         { config.max_uploads_per_minute = parseInt("MAX_UPLOADS_PER_MINUTE", v); }},
        {"MAX_UPLOADS_PER_HOUR", [&](const std::string &v)
         { config.max_uploads_per_hour = parseInt("MAX_UPLOADS_PER_HOUR", v); }},
        {"MAX_UPLOADS_PER_DAY", [&](const std::string &v)
         { config.max_uploads_per_day = parseInt("MAX_UPLOADS_PER_DAY", v); }},
        {"VALID_SIZES", [&](const std::string &v)
         { config.valid_sizes = parseIntList(v); }},
        {"NUDE_FILTER_MAX_THRESHOLD", [&](const std::string &v)
         {
             if (isUnset(v))
                 config.nude_filter_max_threshold.reset();
             else
                 config.nude_filter_max_threshold = parseDouble("NUDE_FILTER_MAX_THRESHOLD", v);
         }},
        {"NUDE_FILTER_VIDEO_INTERVAL", [&](const std::string &v)
         { config.nude_filter_video_interval = parseDouble("NUDE_FILTER_VIDEO_INTERVAL", v); }},
        {"NUDE_FILTER_MAX_FRAMES", [&](const std::string &v)
         { config.nude_filter_max_frames = parseInt("NUDE_FILTER_MAX_FRAMES", v); }},
        {"NUDE_FILTER_MODEL_PATH", [&](const std::string &v)
         { config.nude_filter_model_path = v; }},
        {"ALLOW_VIDEO", [&](const std::string &v)
         { config.allow_video = parseBool(v); }},
        {"ALLOWED_VIDEO_FORMATS", [&](const std::string &v)
         { config.allowed_video_formats = parseStringList(v); }},
        {"MAX_VIDEO_DURATION", [&](const std::string &v)
         { config.max_video_duration = parseDouble("MAX_VIDEO_DURATION", v); }},
        {"HIDE_UPLOAD_FORM", [&](const std::string &v)
         { config.hide_upload_form = parseBool(v); }},
        {"API_KEY", [&](const std::string &v)
         {
             if (isUnset(v))
                 config.api_key.reset();
             else
                 config.api_key = v;
         }},
        {"REQUIRE_API_KEY_FOR_UPLOAD", [&](const std::string &v)
         { config.require_api_key_for_upload = parseBool(v); }},
        {"REQUIRE_API_KEY_FOR_DELETE", [&](const std::string &v)
         { config.require_api_key_for_delete = parseBool(v); }},
        {"MAX_API_KEY_ATTEMPTS_PER_MINUTE", [&](const std::string &v)
         { config.max_api_key_attempts_per_minute = parseInt("MAX_API_KEY_ATTEMPTS_PER_MINUTE", v); }},
    };

    for (const auto &entry : overrides)
    {
        const char *raw = std::getenv(entry.first);
        if (raw == nullptr)
            continue;
        entry.second(stripQuotes(trim(raw)));
        Logger::debug(std::string("Configuration override from environment: ") + entry.first);
    }
}

void ServerConfigManager::validate(const ServerConfig &config)
{
    if (config.server_port <= 0 || config.server_port > 65535)
        throw std::invalid_argument("server_port must be between 1 and 65535");
    if (config.http_threads <= 0)
        throw std::invalid_argument("http_threads must be positive");
    if (config.images_dir.empty() || config.cache_dir.empty() || config.tmp_dir.empty())
        throw std::invalid_argument("images_dir, cache_dir and tmp_dir must be set");
    if (config.max_uploads_per_minute <= 0 || config.max_uploads_per_hour <= 0 || config.max_uploads_per_day <= 0)
        throw std::invalid_argument("upload quotas must be positive");
    if (config.max_api_key_attempts_per_minute <= 0)
        throw std::invalid_argument("max_api_key_attempts_per_minute must be positive");
    if (config.resize_timeout_seconds <= 0)
        throw std::invalid_argument("resize_timeout_seconds must be positive");
    if (config.max_size_mb <= 0)
        throw std::invalid_argument("max_size_mb must be positive");
    if (config.name_strategy != "randomstr" && config.name_strategy != "uuidv4")
        throw std::invalid_argument("name_strategy must be randomstr or uuidv4, got " + config.name_strategy);
    if (config.max_tmp_file_age_seconds < 0)
        throw std::invalid_argument("max_tmp_file_age_seconds must not be negative");
    for (int size : config.valid_sizes)
    {
        if (size <= 0)
            throw std::invalid_argument("valid_sizes entries must be positive, got " + std::to_string(size));
    }
    if (config.nude_filter_max_threshold &&
        (*config.nude_filter_max_threshold <= 0.0 || *config.nude_filter_max_threshold > 1.0))
        throw std::invalid_argument("nude_filter_max_threshold must be in (0, 1]");
    if (config.nude_filter_video_interval <= 0.0)
        throw std::invalid_argument("nude_filter_video_interval must be positive");
    if (config.nude_filter_max_frames < 0)
        throw std::invalid_argument("nude_filter_max_frames must not be negative");
    if (config.max_video_duration <= 0.0)
        throw std::invalid_argument("max_video_duration must be positive");
}

bool ServerConfigManager::parseBool(const std::string &value)
{
    std::string lowered = trim(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on")
        return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off" || lowered.empty())
        return false;
    throw std::invalid_argument("Invalid boolean value: " + value);
}

std::vector<int> ServerConfigManager::parseIntList(const std::string &value)
{
    std::vector<int> result;
    for (const auto &item : parseStringList(value))
        result.push_back(parseInt("list", item));
    return result;
}

std::vector<std::string> ServerConfigManager::parseStringList(const std::string &value)
{
    std::string body = trim(value);
    if (!body.empty() && body.front() == '[' && body.back() == ']')
        body = body.substr(1, body.size() - 2);

    std::vector<std::string> result;
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = stripQuotes(trim(item));
        if (!item.empty())
            result.push_back(item);
    }
    return result;
}
