#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Owns an Asio I/O context and the worker threads running it.
 *
 * Uses executor_work_guard to keep the context running until explicitly
 * stopped. With a single worker thread every posted handler runs in order,
 * which is how check cycles are kept from overlapping.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = 1);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * A handler already executing runs to completion; handlers still queued
     * are discarded.
     */
    void stop();

    /**
     * @brief Checks whether the worker threads are running.
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns a reference to the underlying Asio io_context.
     */
    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on a worker thread.
     * @tparam Handler Callable type.
     * @param handler The handler to execute.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace hostwatch::infra
