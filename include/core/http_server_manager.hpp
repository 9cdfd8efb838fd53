#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Owns the httplib::Server and the thread running its accept loop
 *
 * Requests are dispatched on a worker pool of http_threads threads; no request
 * blocks another except through the components it calls into.
 */
class HttpServerManager
{
public:
    struct Options
    {
        std::string host = "0.0.0.0";
        int port = 5000; // 0 binds any free port
        int threads = 8;
        size_t payload_max_length = 16 * 1024 * 1024;
    };

    using RouteSetupCallback = std::function<void(httplib::Server &)>;

    explicit HttpServerManager(RouteSetupCallback route_setup);
    ~HttpServerManager();

    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @throws std::runtime_error if the address cannot be bound
     */
    void start(const Options &options);

    void stop();
    bool isRunning() const;

    // Port actually bound (differs from Options::port when that was 0)
    int getBoundPort() const { return bound_port_.load(); }
    std::string getCurrentHost() const;

private:
    void serverThread();

    RouteSetupCallback route_setup_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
    std::string current_host_;

    mutable std::mutex server_mutex_;
};
