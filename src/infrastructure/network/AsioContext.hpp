#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace linkrelay::infra {

/**
 * @brief Owns the Asio I/O context and the worker threads that drive it.
 *
 * The relay accept loop, every per-connection read, event dispatch and the
 * termination signal wait all run as asynchronous operations on this context.
 * A work guard keeps the workers alive while no operation is pending.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = 2);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Pending handlers are abandoned. The context can be started again.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    size_t threadCount() const { return threadCount_; }

    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace linkrelay::infra
