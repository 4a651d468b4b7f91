#pragma once

#include "config.hpp"

#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

namespace reservation {

template <typename T> T get_or_default(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

} // namespace reservation

namespace YAML {

template<>
struct convert<reservation::GridConfig> {
    static Node encode(const reservation::GridConfig& rhs) {
        Node node;
        node["rows"] = rhs.rows;
        node["seats_per_row"] = rhs.seats_per_row;
        return node;
    }

    static bool decode(const Node& node, reservation::GridConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rows = reservation::get_or_default<int>(node, "rows", rhs.rows);
        rhs.seats_per_row = reservation::get_or_default<int>(node, "seats_per_row", rhs.seats_per_row);
        return true;
    }
};

template<>
struct convert<reservation::LockConfig> {
    static Node encode(const reservation::LockConfig& rhs) {
        Node node;
        node["ttl_seconds"] = static_cast<long long>(rhs.ttl.count());
        return node;
    }

    static bool decode(const Node& node, reservation::LockConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ttl = std::chrono::seconds(
            reservation::get_or_default<long long>(node, "ttl_seconds", rhs.ttl.count()));
        return true;
    }
};

template<>
struct convert<reservation::SweeperConfig> {
    static Node encode(const reservation::SweeperConfig& rhs) {
        Node node;
        node["background"] = rhs.background;
        node["interval_ms"] = static_cast<long long>(rhs.interval.count());
        return node;
    }

    static bool decode(const Node& node, reservation::SweeperConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.background = reservation::get_or_default<bool>(node, "background", rhs.background);
        rhs.interval = std::chrono::milliseconds(
            reservation::get_or_default<long long>(node, "interval_ms", rhs.interval.count()));
        return true;
    }
};

template<>
struct convert<reservation::LoggingConfig> {
    static Node encode(const reservation::LoggingConfig& rhs) {
        Node node;
        const auto level = spdlog::level::to_string_view(rhs.level);
        node["level"] = std::string(level.data(), level.size());
        node["file"] = rhs.file;
        return node;
    }

    static bool decode(const Node& node, reservation::LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["level"]) {
            const auto name = node["level"].as<std::string>();
            const auto level = spdlog::level::from_str(name);
            // from_str maps unknown names to "off"
            if (level == spdlog::level::off && name != "off") {
                throw std::invalid_argument("logging.level: unknown level '" + name + "'");
            }
            rhs.level = level;
        }
        rhs.file = reservation::get_or_default<std::string>(node, "file", rhs.file);
        return true;
    }
};

} // namespace YAML
