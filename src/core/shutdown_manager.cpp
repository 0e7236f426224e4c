#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);
    signal(SIGQUIT, &ShutdownManager::handleSignal);

    // A client hanging up mid-response must not kill the service
    signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    watcher_running_.store(false);

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: programmatic shutdown requested - " + reason);
    }

    cancelActiveConversions();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

std::shared_ptr<CancellationToken> ShutdownManager::trackConversion()
{
    auto token = std::make_shared<CancellationToken>();
    std::lock_guard<std::mutex> lk(tokens_mutex_);
    // Checked under the lock so a concurrent cancelActiveConversions() cannot miss it
    if (shutdown_requested_.load())
    {
        token->cancel();
    }
    active_tokens_.push_back(token);
    return token;
}

void ShutdownManager::release(const std::shared_ptr<CancellationToken> &token)
{
    std::lock_guard<std::mutex> lk(tokens_mutex_);
    active_tokens_.erase(std::remove(active_tokens_.begin(), active_tokens_.end(), token), active_tokens_.end());
}

size_t ShutdownManager::getActiveConversionCount() const
{
    std::lock_guard<std::mutex> lk(tokens_mutex_);
    return active_tokens_.size();
}

void ShutdownManager::cancelActiveConversions() noexcept
{
    std::lock_guard<std::mutex> lk(tokens_mutex_);
    if (active_tokens_.empty())
    {
        return;
    }
    for (auto &token : active_tokens_)
    {
        token->cancel();
    }
    Logger::info("ShutdownManager: cancelled " + std::to_string(active_tokens_.size()) + " in-flight conversion(s)");
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }
    {
        std::lock_guard<std::mutex> lk(tokens_mutex_);
        active_tokens_.clear();
    }
}
