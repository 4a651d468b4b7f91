#include "config.hpp"
#include "config_yaml.hpp"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace reservation {

namespace {

template <typename T> void decode_section(const YAML::Node& root, const char* key, T& section) {
    if (auto node = root[key]) {
        if (!YAML::convert<T>::decode(node, section)) {
            throw std::invalid_argument(std::string(key) + ": expected a mapping");
        }
    }
}

} // namespace

void Config::validate() const {
    if (grid.rows < 1 || grid.rows > 26) {
        throw std::invalid_argument("grid.rows must be in [1, 26], got " + std::to_string(grid.rows));
    }
    if (grid.seats_per_row < 1) {
        throw std::invalid_argument("grid.seats_per_row must be >= 1, got " + std::to_string(grid.seats_per_row));
    }
    if (locks.ttl.count() <= 0 || locks.ttl > kMaxLockTtl) {
        throw std::invalid_argument("locks.ttl_seconds must be in [1, " + std::to_string(kMaxLockTtl.count()) +
                                    "], got " + std::to_string(locks.ttl.count()));
    }
    if (sweeper.interval.count() <= 0 || sweeper.interval > kMaxSweepInterval) {
        throw std::invalid_argument("sweeper.interval_ms must be in [1, " +
                                    std::to_string(kMaxSweepInterval.count()) + "], got " +
                                    std::to_string(sweeper.interval.count()));
    }
}

Config parse_config(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg; // empty document: all defaults
    if (!root.IsMap()) throw std::invalid_argument("config: top level must be a mapping");

    decode_section(root, "grid", cfg.grid);
    decode_section(root, "locks", cfg.locks);
    decode_section(root, "sweeper", cfg.sweeper);
    decode_section(root, "logging", cfg.logging);

    cfg.validate();
    return cfg;
}

Config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

} // namespace reservation
