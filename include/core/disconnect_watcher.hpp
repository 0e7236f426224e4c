#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include "core/cancellation_token.hpp"

/**
 * @brief Cancels a conversion once its caller has gone away
 *
 * A background thread polls `caller_gone` every interval until the watcher is
 * destroyed. The first time it answers true the token is cancelled and the
 * thread stops.
 */
class DisconnectWatcher
{
public:
    DisconnectWatcher(std::function<bool()> caller_gone, CancellationToken &token,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    ~DisconnectWatcher();

    DisconnectWatcher(const DisconnectWatcher &) = delete;
    DisconnectWatcher &operator=(const DisconnectWatcher &) = delete;

    bool callerWentAway() const;

private:
    void watch();

    std::function<bool()> caller_gone_;
    CancellationToken &token_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    bool caller_went_away_ = false;
    std::thread thread_;
};
