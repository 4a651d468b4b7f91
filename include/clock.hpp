#pragma once

#include "seat.hpp"

/**
 * @file clock.hpp
 * @brief Time source injected into the registry.
 *
 * Lock expiry is the only timing concept in the system, so every "now"
 * the registry uses comes from a Clock. Tests substitute a manual clock.
 */

namespace reservation {

/**
 * @brief Abstract time source.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /** @brief Returns the current time. */
    virtual TimePoint now() const = 0;
};

/**
 * @brief Wall clock backed by std::chrono::system_clock.
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace reservation
