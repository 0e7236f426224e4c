#pragma once

#include <atomic>

/**
 * @brief Cooperative cancellation flag shared between a caller and a running conversion
 *
 * The caller (HTTP handler, shutdown path) calls cancel(); the process executor
 * checks isCancelled() on every poll and kills the running stage.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
