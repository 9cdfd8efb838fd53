#include "auth/access_guard.hpp"
#include "auth/rate_limiter.hpp"
#include "core/asset_store.hpp"
#include "core/derivative_cache.hpp"
#include "core/http_server_manager.hpp"
#include "core/image_transcoder.hpp"
#include "core/ingestion_pipeline.hpp"
#include "core/key_codec.hpp"
#include "core/media_classifier.hpp"
#include "core/nudity_model.hpp"
#include "core/remote_fetcher.hpp"
#include "core/server_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "core/video_sampler.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <iostream>
#include <memory>
#include <unistd.h>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "mediapush - media upload and resize server" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>  YAML configuration (default: config/config.yaml)" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
        std::cout << "Every key can be overridden by an upper-case environment variable, e.g. API_KEY." << std::endl;
    }
}

int main(int argc, char *argv[])
{
    // Block shutdown signals before any worker thread exists
    ShutdownManager::getInstance().installSignalHandlers();

    std::string config_path = "config/config.yaml";
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    ServerConfig config;
    try
    {
        config = ServerConfigManager::load(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    Logger::init(config.log_level);
    Logger::info("Starting mediapush (PID: " + std::to_string(getpid()) + ")...");

    try
    {
        AssetStore store(config.images_dir, config.cache_dir,
                         AssetStore::parseNameStrategy(config.name_strategy));
        KeyCodec codec(config.valid_sizes);

        std::shared_ptr<NudityModel> model;
        if (config.nude_filter_max_threshold)
            model = std::make_shared<OnnxNudityModel>(config.nude_filter_model_path);
        else
            Logger::info("Nudity filter disabled");

        auto sampler = std::make_shared<OpenCvVideoSampler>(config.tmp_dir);
        MediaClassifier classifier(config, model, sampler);

        auto transcoder = std::make_shared<OpenCvImageTranscoder>();
        DerivativeCache cache(store, codec, transcoder, std::chrono::seconds(config.resize_timeout_seconds));

        AccessGuard guard(config, std::make_shared<RateLimiter>());
        IngestionPipeline pipeline(config, store, classifier, transcoder, std::make_shared<HttpRemoteFetcher>());

        ServiceContext ctx{config, store, cache, guard, pipeline};
        HttpServerManager server([&ctx](httplib::Server &svr)
                                 { RouteHandlers::setupRoutes(svr, ctx); });

        HttpServerManager::Options options;
        options.host = config.server_host;
        options.port = config.server_port;
        options.threads = config.http_threads;
        options.payload_max_length = static_cast<size_t>(config.max_size_mb) * 1024 * 1024;
        server.start(options);

        auto &shutdown_manager = ShutdownManager::getInstance();
        while (!shutdown_manager.waitForShutdown(std::chrono::seconds(1)))
        {
            if (!server.isRunning())
                shutdown_manager.requestShutdown("HTTP server exited");
        }

        Logger::info("Shutting down: " + shutdown_manager.getReason());
        server.stop();
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    Logger::info("mediapush stopped");
    return 0;
}
