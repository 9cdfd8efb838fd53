#include "core/http_server_manager.hpp"
#include <stdexcept>

HttpServerManager::HttpServerManager(RouteSetupCallback route_setup) : route_setup_(std::move(route_setup))
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

void HttpServerManager::start(const Options &options)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running on " + current_host_ + ":" +
                     std::to_string(bound_port_.load()));
        return;
    }

    auto server = std::make_unique<httplib::Server>();
    const size_t threads = static_cast<size_t>(options.threads > 0 ? options.threads : 1);
    server->new_task_queue = [threads]()
    { return new httplib::ThreadPool(threads); };
    server->set_payload_max_length(options.payload_max_length);

    if (route_setup_)
        route_setup_(*server);

    int port = options.port;
    if (port == 0)
    {
        port = server->bind_to_any_port(options.host);
        if (port < 0)
            throw std::runtime_error("Failed to bind " + options.host + " to any port");
    }
    else if (!server->bind_to_port(options.host, port))
    {
        throw std::runtime_error("Failed to bind " + options.host + ":" + std::to_string(port));
    }

    server_ = std::move(server);
    current_host_ = options.host;
    bound_port_.store(port);
    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on " + options.host + ":" + std::to_string(port) + " with " +
                 std::to_string(threads) + " worker threads");
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (!server_)
        return;

    running_.store(false);
    server_->stop();

    if (server_thread_.joinable())
        server_thread_.join();

    server_.reset();
    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_host_;
}

void HttpServerManager::serverThread()
{
    try
    {
        if (!server_->listen_after_bind())
            Logger::error("HttpServerManager: Accept loop ended with an error");
        else
            Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
