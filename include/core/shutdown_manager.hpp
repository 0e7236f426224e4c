#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/cancellation_token.hpp"

/**
 * Centralized shutdown manager.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - Exposes a single observable state for shutdown across the process
 * - Cancels in-flight conversions so their child processes are killed and
 *   their scratch areas released before the service exits
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request shutdown (safe to call from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    /**
     * @brief Create a token that is cancelled when shutdown is requested
     *
     * If shutdown was already requested the token comes back cancelled.
     * Call release() once the conversion is finished.
     */
    std::shared_ptr<CancellationToken> trackConversion();
    void release(const std::shared_ptr<CancellationToken> &token);

    size_t getActiveConversionCount() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    // Background watcher to translate signal flags into a proper shutdown request
    void startWatcher();
    void stopWatcher();

    void cancelActiveConversions() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    mutable std::mutex tokens_mutex_;
    std::vector<std::shared_ptr<CancellationToken>> active_tokens_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};

/**
 * @brief Tracks one conversion with the ShutdownManager for the lifetime of the object
 *
 * The token is released on every path out of the scope, exceptions included.
 */
class ScopedConversion
{
public:
    explicit ScopedConversion(ShutdownManager &manager)
        : manager_(manager), token_(manager.trackConversion())
    {
    }

    ~ScopedConversion() { manager_.release(token_); }

    ScopedConversion(const ScopedConversion &) = delete;
    ScopedConversion &operator=(const ScopedConversion &) = delete;

    CancellationToken &getToken() const { return *token_; }

private:
    ShutdownManager &manager_;
    std::shared_ptr<CancellationToken> token_;
};
