#pragma once

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @brief Immutable server configuration
 *
 * Built once at startup by ServerConfigManager and handed to each component by
 * reference. Nothing in the core reads process-wide state directly.
 */
struct ServerConfig
{
    // HTTP listener
    std::string server_host = "0.0.0.0";
    int server_port = 5000;
    int http_threads = 8;
    std::string log_level = "INFO";

    // Storage
    std::string images_dir = "/images/";
    std::string cache_dir = "/cache/";
    std::string tmp_dir = "/tmp/";
    std::optional<std::string> output_type;
    int max_tmp_file_age_seconds = 5 * 60;
    int resize_timeout_seconds = 5;
    int max_size_mb = 16;
    // Id format for new uploads: "randomstr" or "uuidv4"
    std::string name_strategy = "randomstr";

    // Upload quotas per client address
    int max_uploads_per_minute = 20;
    int max_uploads_per_hour = 100;
    int max_uploads_per_day = 1000;

    // Derivative sizes; empty means any positive size
    std::vector<int> valid_sizes;

    // Moderation
    std::optional<double> nude_filter_max_threshold;
    double nude_filter_video_interval = 1.0;
    int nude_filter_max_frames = 10;
    std::string nude_filter_model_path = "/models/classifier_model.onnx";

    // Video
    bool allow_video = false;
    std::vector<std::string> allowed_video_formats{"mp4"};
    double max_video_duration = 60.0;

    // Access control
    bool hide_upload_form = false;
    std::optional<std::string> api_key;
    bool require_api_key_for_upload = false;
    bool require_api_key_for_delete = true;
    int max_api_key_attempts_per_minute = 5;
};

/**
 * @brief Loads ServerConfig from YAML and the environment
 *
 * Precedence: built-in defaults < YAML file < environment variables named after
 * the upper-cased key (e.g. MAX_UPLOADS_PER_MINUTE, VALID_SIZES, API_KEY).
 */
class ServerConfigManager
{
public:
    /**
     * @brief Load configuration from a file, then apply environment overrides
     * @param file_path YAML file; a missing file leaves the defaults in place
     * @return Validated configuration
     * @throws std::invalid_argument on malformed values
     */
    static ServerConfig load(const std::string &file_path);

    /**
     * @brief Build configuration from an already parsed YAML document
     */
    static ServerConfig fromYaml(const YAML::Node &node);

    /**
     * @brief Apply overrides from the process environment
     */
    static void applyEnvironment(ServerConfig &config);

    /**
     * @brief Check ranges and consistency
     * @throws std::invalid_argument describing the first offending key
     */
    static void validate(const ServerConfig &config);

    // Parsing helpers shared with the environment override path
    static bool parseBool(const std::string &value);
    static std::vector<int> parseIntList(const std::string &value);
    static std::vector<std::string> parseStringList(const std::string &value);
};
