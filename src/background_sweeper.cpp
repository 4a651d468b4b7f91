#include "background_sweeper.hpp"

#include "config.hpp"
#include "logger.hpp"
#include "seat_registry.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace reservation {

BackgroundSweeper::BackgroundSweeper(SeatRegistry& registry, std::chrono::milliseconds interval)
    : registry_(registry), interval_(interval) {
    if (interval_.count() <= 0 || interval_ > kMaxSweepInterval) {
        throw std::invalid_argument("sweep interval must be in [1ms, " + std::to_string(kMaxSweepInterval.count()) +
                                    "ms]");
    }
}

BackgroundSweeper::~BackgroundSweeper() {
    stop();
}

void BackgroundSweeper::start() {
    if (is_running()) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            run_loop();
        } catch (const std::exception& e) {
            Logger::get()->error("[BackgroundSweeper] Sweeper stopped on error: {}", e.what());
        }
        running_.store(false);
    });

    Logger::get()->info("[BackgroundSweeper] Started, sweeping every {} ms", interval_.count());
}

void BackgroundSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    // the thread may already have exited on error; it still needs joining
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        Logger::get()->info("[BackgroundSweeper] Stopped after reclaiming {} lock(s)", reclaimed_total());
    }
    running_.store(false);
}

void BackgroundSweeper::run_loop() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (!stop_requested_) {
        lock.unlock();
        reclaimed_total_.fetch_add(registry_.sweep_expired());
        lock.lock();

        wait_cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }
}

} // namespace reservation
