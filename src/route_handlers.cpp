#include "web/route_handlers.hpp"
#include "core/file_utils.hpp"
#include <unordered_map>

const char *RouteHandlers::UPLOAD_FORM = R"(
<form action="/" method="post" enctype="multipart/form-data">
    <input type="file" name="file" id="file">
    <input type="submit" value="Upload" name="submit">
</form>
)";

namespace
{
    const char *errorMessageForStatus(int status)
    {
        switch (status)
        {
        case 400:
            return "Bad request";
        case 404:
            return "Not found";
        case 405:
            return "Method not allowed";
        case 413:
            return "File is too large";
        default:
            return "Internal server error";
        }
    }

    // Run a handler and map every failure to a JSON error response
    template <typename Handler>
    void guarded(httplib::Response &res, const std::string &route, Handler handler)
    {
        try
        {
            handler();
        }
        catch (const InternalFailure &e)
        {
            RouteHandlers::sendInternalError(res, route + ": " + e.what());
        }
        catch (const MediaError &e)
        {
            RouteHandlers::sendError(res, e);
        }
        catch (const std::exception &e)
        {
            RouteHandlers::sendInternalError(res, route + ": " + e.what());
        }
    }
}

void RouteHandlers::setupRoutes(httplib::Server &svr, ServiceContext &ctx)
{
    svr.Get("/", [&ctx](const httplib::Request &req, httplib::Response &res)
            { handleIndex(req, res, ctx); });

    svr.Get("/liveness", [](const httplib::Request &, httplib::Response &res)
            { res.status = 200; });

    svr.Post("/", [&ctx](const httplib::Request &req, httplib::Response &res)
             { handleUpload(req, res, ctx); });

    svr.Get(R"(/(.+))", [&ctx](const httplib::Request &req, httplib::Response &res)
            { handleGetAsset(req, res, ctx); });

    svr.Delete(R"(/(.+))", [&ctx](const httplib::Request &req, httplib::Response &res)
               { handleDeleteAsset(req, res, ctx); });

    // Framework generated errors (413, unmatched routes) get the same JSON shape
    svr.set_error_handler([](const httplib::Request &, httplib::Response &res)
                          {
        if (res.body.empty()) {
            std::string code = res.status == 413 ? "PAYLOAD_TOO_LARGE" : "HTTP_" + std::to_string(res.status);
            res.set_content(json{{"error", errorMessageForStatus(res.status)}, {"code", code}}.dump(), "application/json");
        } });

    svr.set_post_routing_handler([](const httplib::Request &, httplib::Response &res)
                                 { res.set_header("Referrer-Policy", "no-referrer-when-downgrade"); });

    Logger::info("RouteHandlers: routes registered");
}

void RouteHandlers::handleIndex(const httplib::Request &, httplib::Response &res, const ServiceContext &ctx)
{
    res.set_content(std::string(ctx.config.hide_upload_form ? "" : UPLOAD_FORM), "text/html");
}

void RouteHandlers::handleUpload(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx)
{
    guarded(res, "POST /", [&]()
            {
        ctx.guard.checkUpload(req.remote_addr, req.get_header_value("Authorization")).enforce();

        UploadSource source;
        if (req.is_multipart_form_data() && req.has_file("file") && !req.get_file_value("file").filename.empty())
        {
            auto file = req.get_file_value("file");
            source = UploadSource::fromFile(file.content, file.filename);
        }
        else
        {
            auto body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object() || !body.contains("url") || !body["url"].is_string())
                throw ValidationError("File is missing!", "FILE_MISSING");
            source = UploadSource::fromUrl(body["url"].get<std::string>());
        }

        StoredUpload stored = ctx.pipeline.ingest(source);
        res.set_content(json{{"filename", stored.filename}}.dump(), "application/json"); });
}

void RouteHandlers::handleGetAsset(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx)
{
    const std::string name = req.matches[1];
    guarded(res, "GET /" + name, [&]()
            {
        const std::string width = req.has_param("w") ? req.get_param_value("w") : "";
        const std::string height = req.has_param("h") ? req.get_param_value("h") : "";

        fs::path path = ctx.cache.getOrCreate(name, width, height);
        res.set_content(FileUtils::readFile(path), mimeType(FileUtils::getFileExtension(path.string()))); });
}

void RouteHandlers::handleDeleteAsset(const httplib::Request &req, httplib::Response &res, ServiceContext &ctx)
{
    const std::string name = req.matches[1];
    guarded(res, "DELETE /" + name, [&]()
            {
        ctx.guard.checkDelete(req.remote_addr, req.get_header_value("Authorization")).enforce();

        size_t removed = ctx.store.remove(name);
        res.set_content(json{{"status", "deleted"}, {"cached_files_removed", removed}}.dump(), "application/json"); });
}

void RouteHandlers::sendError(httplib::Response &res, const MediaError &error)
{
    res.status = error.httpStatus();
    res.set_content(json{{"error", error.what()}, {"code", error.code()}}.dump(), "application/json");
}

void RouteHandlers::sendInternalError(httplib::Response &res, const std::string &detail)
{
    Logger::error("Request failed: " + detail);
    res.status = 500;
    res.set_content(json{{"error", "Internal server error"}, {"code", "INTERNAL_ERROR"}}.dump(), "application/json");
}

std::string RouteHandlers::mimeType(const std::string &extension)
{
    static const std::unordered_map<std::string, std::string> TYPES = {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"bmp", "image/bmp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"svg", "image/svg+xml"},
        {"mp4", "video/mp4"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
        {"avi", "video/x-msvideo"},
    };

    auto it = TYPES.find(extension);
    return it != TYPES.end() ? it->second : "application/octet-stream";
}
