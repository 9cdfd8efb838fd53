#pragma once

#include "auth/access_guard.hpp"
#include "core/derivative_cache.hpp"
#include "core/ingestion_pipeline.hpp"
#include "core/media_errors.hpp"
#include "core/server_config_manager.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

/**
 * @brief Everything the HTTP routes need, owned by main()
 */
struct ServiceContext
{
    const ServerConfig &config;
    AssetStore &store;
    DerivativeCache &cache;
    AccessGuard &guard;
    IngestionPipeline &pipeline;
};

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, ServiceContext &ctx);

    static void handleIndex(const httplib::Request &req, httplib::Response &res, const ServiceContext &ctx);
    static void handleUpload(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx);
    static void handleGetAsset(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx);
    static void handleDeleteAsset(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx);

    // Translate a core failure into {"error", "code"} with the matching status
    static void sendError(httplib::Response &res, const MediaError &error);
    static void sendInternalError(httplib::Response &res, const std::string &detail);

    // Content-Type for a lower-case extension without dot
    static std::string mimeType(const std::string &extension);

private:
    static const char *UPLOAD_FORM;
};
