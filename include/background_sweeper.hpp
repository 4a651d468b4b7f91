#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace reservation {

class SeatRegistry;

/**
 * @brief Periodically reclaims expired locks on its own thread.
 *
 * @details
 * Complements the lazy sweep every registry operation performs. Each tick
 * goes through SeatRegistry::sweep_expired(), which takes the registry mutex,
 * so it is serialized with Lock/Confirm/Release like any other caller.
 *
 * start() and stop() are idempotent; the destructor stops the thread.
 * stop() interrupts the wait between ticks, so shutdown is prompt.
 */
class BackgroundSweeper {
public:
    /**
     * @brief Binds the sweeper to a registry without starting it.
     *
     * @param registry Registry to sweep; must outlive the sweeper.
     * @param interval Time between ticks, in (0, kMaxSweepInterval].
     * @throws std::invalid_argument if @p interval is out of range.
     */
    BackgroundSweeper(SeatRegistry& registry, std::chrono::milliseconds interval);
    ~BackgroundSweeper();

    BackgroundSweeper(const BackgroundSweeper&) = delete;
    BackgroundSweeper& operator=(const BackgroundSweeper&) = delete;

    /** @brief Starts the sweep thread; does nothing if it is already running. */
    void start();

    /**
     * @brief Wakes the sweep thread and joins it.
     *
     * Does nothing if the sweeper is not running. A tick already in
     * progress finishes before this returns.
     */
    void stop();

    /** @brief True between start() and stop(). */
    bool is_running() const { return running_.load(); }

    /** @brief Locks reclaimed by this sweeper since construction. */
    std::size_t reclaimed_total() const { return reclaimed_total_.load(); }

private:
    SeatRegistry& registry_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> reclaimed_total_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false; // guarded by wait_mutex_

    std::thread worker_;

    void run_loop();
};

} // namespace reservation
