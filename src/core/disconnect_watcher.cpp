#include "core/disconnect_watcher.hpp"
#include "logging/logger.hpp"
#include <utility>

DisconnectWatcher::DisconnectWatcher(std::function<bool()> caller_gone, CancellationToken &token,
                                     std::chrono::milliseconds interval)
    : caller_gone_(std::move(caller_gone)), token_(token), interval_(interval)
{
    if (caller_gone_)
    {
        thread_ = std::thread(&DisconnectWatcher::watch, this);
    }
}

DisconnectWatcher::~DisconnectWatcher()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable())
    {
        thread_.join();
    }
}

bool DisconnectWatcher::callerWentAway() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return caller_went_away_;
}

void DisconnectWatcher::watch()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        lock.unlock();
        bool gone = caller_gone_();
        lock.lock();
        if (gone)
        {
            caller_went_away_ = true;
            token_.cancel();
            Logger::info("DisconnectWatcher: caller disconnected, cancelling conversion");
            return;
        }
        stop_cv_.wait_for(lock, interval_, [this]()
                          { return stopping_; });
    }
}
