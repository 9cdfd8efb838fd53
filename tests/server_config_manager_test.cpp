#include "test_base.hpp"
#include "core/server_config_manager.hpp"
#include <cstdlib>

namespace
{
    // Sets an environment variable for the lifetime of the object
    class ScopedEnv
    {
    public:
        ScopedEnv(const char *name, const char *value) : name_(name)
        {
            setenv(name, value, 1);
        }
        ~ScopedEnv() { unsetenv(name_); }

    private:
        const char *name_;
    };
}

class ServerConfigManagerTest : public TestBase
{
protected:
    fs::path writeConfig(const std::string &yaml)
    {
        fs::path path = root_ / "config.yaml";
        writeFile(path, yaml);
        return path;
    }
};

TEST_F(ServerConfigManagerTest, DefaultsWhenFileIsMissing)
{
    ServerConfig config = ServerConfigManager::load((root_ / "nope.yaml").string());
    EXPECT_EQ(config.server_port, 5000);
    EXPECT_EQ(config.max_uploads_per_minute, 20);
    EXPECT_EQ(config.max_api_key_attempts_per_minute, 5);
    EXPECT_FALSE(config.allow_video);
    EXPECT_FALSE(config.nude_filter_max_threshold.has_value());
    EXPECT_FALSE(config.api_key.has_value());
    EXPECT_TRUE(config.valid_sizes.empty());
    ASSERT_EQ(config.allowed_video_formats.size(), 1u);
    EXPECT_EQ(config.allowed_video_formats[0], "mp4");
    EXPECT_EQ(config.name_strategy, "randomstr");
}

TEST_F(ServerConfigManagerTest, ReadsYamlValues)
{
    fs::path path = writeConfig(R"(
server_port: 8080
images_dir: /data/images
output_type: webp
valid_sizes: [100, 200, 400]
nude_filter_max_threshold: 0.6
allow_video: true
allowed_video_formats: [mp4, webm]
max_video_duration: 30
api_key: hunter2
require_api_key_for_upload: true
)");

    ServerConfig config = ServerConfigManager::load(path.string());
    EXPECT_EQ(config.server_port, 8080);
    EXPECT_EQ(config.images_dir, "/data/images");
    EXPECT_EQ(config.output_type.value_or(""), "webp");
    EXPECT_EQ(config.valid_sizes, (std::vector<int>{100, 200, 400}));
    ASSERT_TRUE(config.nude_filter_max_threshold.has_value());
    EXPECT_DOUBLE_EQ(*config.nude_filter_max_threshold, 0.6);
    EXPECT_TRUE(config.allow_video);
    EXPECT_EQ(config.allowed_video_formats, (std::vector<std::string>{"mp4", "webm"}));
    EXPECT_DOUBLE_EQ(config.max_video_duration, 30.0);
    EXPECT_EQ(config.api_key.value_or(""), "hunter2");
    EXPECT_TRUE(config.require_api_key_for_upload);
}

TEST_F(ServerConfigManagerTest, NullYamlValuesStayUnset)
{
    fs::path path = writeConfig("output_type: ~\napi_key: null\n");
    ServerConfig config = ServerConfigManager::load(path.string());
    EXPECT_FALSE(config.output_type.has_value());
    EXPECT_FALSE(config.api_key.has_value());
}

TEST_F(ServerConfigManagerTest, EnvironmentOverridesFile)
{
    fs::path path = writeConfig("max_uploads_per_minute: 7\nallow_video: false\n");
    ScopedEnv uploads("MAX_UPLOADS_PER_MINUTE", "3");
    ScopedEnv video("ALLOW_VIDEO", "True");
    ScopedEnv sizes("VALID_SIZES", "[50, 150]");
    ScopedEnv age("MAX_TMP_FILE_AGE", "60");
    ScopedEnv timeout("RESIZE_TIMEOUT", "9");

    ServerConfig config = ServerConfigManager::load(path.string());
    EXPECT_EQ(config.max_uploads_per_minute, 3);
    EXPECT_TRUE(config.allow_video);
    EXPECT_EQ(config.valid_sizes, (std::vector<int>{50, 150}));
    EXPECT_EQ(config.max_tmp_file_age_seconds, 60);
    EXPECT_EQ(config.resize_timeout_seconds, 9);
}

TEST_F(ServerConfigManagerTest, EnvironmentCanUnsetOptionalValues)
{
    fs::path path = writeConfig("api_key: abc\nnude_filter_max_threshold: 0.5\n");
    ScopedEnv key("API_KEY", "None");
    ScopedEnv threshold("NUDE_FILTER_MAX_THRESHOLD", "");

    ServerConfig config = ServerConfigManager::load(path.string());
    EXPECT_FALSE(config.api_key.has_value());
    EXPECT_FALSE(config.nude_filter_max_threshold.has_value());
}

TEST_F(ServerConfigManagerTest, NameStrategyFromFileAndEnvironment)
{
    fs::path path = writeConfig("name_strategy: uuidv4\n");
    EXPECT_EQ(ServerConfigManager::load(path.string()).name_strategy, "uuidv4");

    ScopedEnv strategy("NAME_STRATEGY", "randomstr");
    EXPECT_EQ(ServerConfigManager::load(path.string()).name_strategy, "randomstr");
}

TEST_F(ServerConfigManagerTest, UnknownNameStrategyIsRejected)
{
    ScopedEnv strategy("NAME_STRATEGY", "sequential");
    EXPECT_THROW(ServerConfigManager::load((root_ / "nope.yaml").string()), std::invalid_argument);
}

TEST_F(ServerConfigManagerTest, MalformedEnvironmentValueIsRejected)
{
    ScopedEnv uploads("MAX_UPLOADS_PER_HOUR", "lots");
    EXPECT_THROW(ServerConfigManager::load((root_ / "nope.yaml").string()), std::invalid_argument);
}

TEST_F(ServerConfigManagerTest, MalformedYamlIsRejected)
{
    fs::path path = writeConfig("server_port: [unterminated\n");
    EXPECT_THROW(ServerConfigManager::load(path.string()), std::invalid_argument);

    fs::path wrong_type = writeConfig("server_port: eighty\n");
    EXPECT_THROW(ServerConfigManager::load(wrong_type.string()), std::invalid_argument);

    fs::path not_list = writeConfig("valid_sizes: 100\n");
    EXPECT_THROW(ServerConfigManager::load(not_list.string()), std::invalid_argument);
}

TEST_F(ServerConfigManagerTest, ValidationCatchesOutOfRangeValues)
{
    ServerConfig config;
    EXPECT_NO_THROW(ServerConfigManager::validate(config));

    ServerConfig bad_port;
    bad_port.server_port = 0;
    EXPECT_THROW(ServerConfigManager::validate(bad_port), std::invalid_argument);

    ServerConfig bad_sizes;
    bad_sizes.valid_sizes = {100, -1};
    EXPECT_THROW(ServerConfigManager::validate(bad_sizes), std::invalid_argument);

    ServerConfig bad_threshold;
    bad_threshold.nude_filter_max_threshold = 1.5;
    EXPECT_THROW(ServerConfigManager::validate(bad_threshold), std::invalid_argument);

    ServerConfig bad_quota;
    bad_quota.max_uploads_per_day = 0;
    EXPECT_THROW(ServerConfigManager::validate(bad_quota), std::invalid_argument);
}

TEST_F(ServerConfigManagerTest, ListParsing)
{
    EXPECT_EQ(ServerConfigManager::parseIntList("[100, 200]"), (std::vector<int>{100, 200}));
    EXPECT_EQ(ServerConfigManager::parseIntList("100,200,"), (std::vector<int>{100, 200}));
    EXPECT_TRUE(ServerConfigManager::parseIntList("[]").empty());
    EXPECT_THROW(ServerConfigManager::parseIntList("[1, two]"), std::invalid_argument);
    EXPECT_EQ(ServerConfigManager::parseStringList("['mp4', \"webm\"]"),
              (std::vector<std::string>{"mp4", "webm"}));
}

TEST_F(ServerConfigManagerTest, BooleanParsing)
{
    EXPECT_TRUE(ServerConfigManager::parseBool("true"));
    EXPECT_TRUE(ServerConfigManager::parseBool("YES"));
    EXPECT_TRUE(ServerConfigManager::parseBool("1"));
    EXPECT_FALSE(ServerConfigManager::parseBool("False"));
    EXPECT_FALSE(ServerConfigManager::parseBool("0"));
    EXPECT_THROW(ServerConfigManager::parseBool("maybe"), std::invalid_argument);
}
