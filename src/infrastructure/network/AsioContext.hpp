#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vlanvision::infra {

/**
 * @brief Named asio::io_context driven by its own pool of worker threads.
 *
 * The daemon runs two of these: one whose threads execute blocking probes and
 * one for timers, the REST acceptor and signal handling, so that slow probes
 * never delay API reads.
 *
 * @note Non-copyable. Handlers still queued when stop() is called are discarded.
 */
class AsioContext {
public:
    /**
     * @brief Constructs a context.
     * @param name Label used in log messages.
     * @param threadCount Number of worker threads, at least one.
     */
    explicit AsioContext(std::string name, size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     */
    void stop();

    asio::io_context& getContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace vlanvision::infra
