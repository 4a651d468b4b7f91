#pragma once

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

namespace YAML { class Node; }

namespace reservation {

/**
 * @brief Longest accepted lock TTL and background sweep interval.
 *
 * Keeps every "now + ttl" and every remaining-seconds count well inside the
 * range of the clock's time_point and of int.
 */
constexpr std::chrono::seconds kMaxLockTtl{24 * 60 * 60};
constexpr std::chrono::milliseconds kMaxSweepInterval{24 * 60 * 60 * 1000};

/**
 * @brief Shape of the seat grid.
 */
struct GridConfig {
    int rows = 10;           /**< 1..26, one letter per row. */
    int seats_per_row = 10;  /**< >= 1. */
};

/**
 * @brief Lock lifetime.
 */
struct LockConfig {
    std::chrono::seconds ttl{60}; /**< In (0, kMaxLockTtl]. */
};

/**
 * @brief Optional periodic sweep on top of the lazy one every operation performs.
 */
struct SweeperConfig {
    bool background = false;
    std::chrono::milliseconds interval{1000}; /**< In (0, kMaxSweepInterval]. */
};

/**
 * @brief Logger level and optional rotating log file.
 */
struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file; /**< Empty = console only. */
};

/**
 * @brief Complete service configuration, one member per YAML section.
 */
struct Config {
    GridConfig grid;
    LockConfig locks;
    SweeperConfig sweeper;
    LoggingConfig logging;

    /**
     * @brief Throws std::invalid_argument naming the first out-of-range key.
     */
    void validate() const;
};

/**
 * @brief Builds a Config from a parsed YAML document.
 *
 * Missing sections and keys keep their defaults. Values of the wrong type
 * surface as YAML::Exception, out-of-range values as std::invalid_argument.
 */
Config parse_config(const YAML::Node& root);

/**
 * @brief Reads and validates the YAML config file at @p path.
 */
Config load_config(const std::string& path);

} // namespace reservation
