#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <pthread.h>

namespace
{
    sigset_t shutdownSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGQUIT);
        return set;
    }
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopSignalThread();
}

void ShutdownManager::installSignalHandlers()
{
    if (signal_thread_.joinable())
        return;

    sigset_t set = shutdownSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        Logger::error("ShutdownManager: pthread_sigmask failed with " + std::to_string(rc));
        return;
    }

    signal_thread_ = std::thread([this, set]()
                                 {
        for (;;)
        {
            int sig = 0;
            if (sigwait(&set, &sig) != 0)
                continue;
            if (stopping_.load())
                break;
            requestShutdown("Signal received", sig);
        } });

    Logger::info("ShutdownManager: waiting for SIGINT/SIGTERM/SIGQUIT");
}

void ShutdownManager::stopSignalThread() noexcept
{
    if (!signal_thread_.joinable())
        return;

    stopping_.store(true);
    pthread_kill(signal_thread_.native_handle(), SIGTERM);
    signal_thread_.join();
    stopping_.store(false);
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
            return;
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    else
        Logger::info("ShutdownManager: shutdown requested - " + reason);
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdown(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    reason_.clear();
}
