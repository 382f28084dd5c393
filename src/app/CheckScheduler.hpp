#pragma once

#include "core/types/Status.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace hostwatch::app {

/**
 * @brief Runs check cycles periodically and on demand.
 *
 * Cycles run on the AsioContext worker thread, one after the other, and each
 * one holds a CycleLock so that a cycle started by another process is never
 * overlapped. A cycle that cannot take the lock in time is skipped with a
 * warning. Exceptions thrown by a cycle are logged and the schedule goes on.
 */
class CheckScheduler {
public:
    /// Runs one cycle; the argument is the connection type chosen by the trigger, if any.
    using CycleFunction = std::function<void(std::optional<core::ConnectionType>)>;

    /**
     * @brief Constructs a CheckScheduler.
     * @param context Context whose worker thread runs the cycles (one thread).
     * @param cycle Function running one check cycle.
     * @param interval Time between periodic cycles.
     * @param lockPath Lock file shared with other processes.
     * @param lockWait How long a cycle waits for the lock before being skipped.
     */
    CheckScheduler(infra::AsioContext& context, CycleFunction cycle,
                   std::chrono::seconds interval, std::filesystem::path lockPath,
                   std::chrono::milliseconds lockWait);

    /**
     * @brief Destructor. Stops the schedule.
     */
    ~CheckScheduler();

    CheckScheduler(const CheckScheduler&) = delete;
    CheckScheduler& operator=(const CheckScheduler&) = delete;

    /**
     * @brief Runs a cycle now and then one every interval.
     */
    void start();

    /**
     * @brief Cancels the periodic timer and ignores further triggers.
     *
     * Waits for handlers already queued on the context to drain unless called
     * from the worker thread itself.
     */
    void stop();

    /**
     * @brief Queues one extra cycle using the live connection type.
     */
    void startCheck();

    /**
     * @brief Queues one extra cycle with an explicit connection type.
     */
    void startCheck(core::ConnectionType connectionType);

    bool isRunning() const { return running_.load(); }

    /// Cycles that ran to the end.
    size_t completedCycles() const { return completedCycles_.load(); }

    /// Cycles that threw.
    size_t failedCycles() const { return failedCycles_.load(); }

    /// Cycles dropped because the cycle lock was held elsewhere.
    size_t skippedCycles() const { return skippedCycles_.load(); }

private:
    void post(std::optional<core::ConnectionType> connectionType);
    void scheduleNext();
    void runGuarded(std::optional<core::ConnectionType> connectionType);

    infra::AsioContext& context_;
    CycleFunction cycle_;
    std::chrono::seconds interval_;
    std::filesystem::path lockPath_;
    std::chrono::milliseconds lockWait_;

    std::unique_ptr<asio::steady_timer> timer_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> completedCycles_{0};
    std::atomic<size_t> failedCycles_{0};
    std::atomic<size_t> skippedCycles_{0};
    std::mutex mutex_;
};

} // namespace hostwatch::app
