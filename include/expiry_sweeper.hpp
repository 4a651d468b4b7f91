#pragma once

#include "seat.hpp"

#include <cstddef>
#include <vector>

/**
 * @file expiry_sweeper.hpp
 * @brief Lazy reclamation of locks whose hold has elapsed.
 */

namespace reservation {

/**
 * @brief Expiry policy applied at the start of every registry operation.
 *
 * @details
 * For every Locked seat with `now >= lock_expires_at` the seat is returned to
 * Available with holder and timestamps cleared, the same end state as a
 * voluntary release. The sweeper owns no state and takes no lock itself: the
 * caller must hold whatever serializes access to @p seats, so the sweep is
 * part of the caller's atomic step.
 */
class ExpirySweeper {
public:
    /**
     * @brief True if @p seat is Locked and its lock has run out at @p now.
     */
    static bool is_expired(const Seat& seat, TimePoint now);

    /**
     * @brief Reclaims every expired lock in @p seats.
     *
     * @param seats Seat table; the caller holds exclusive access.
     * @param now Instant the sweep is evaluated at.
     * @return Number of locks reclaimed.
     */
    std::size_t sweep(std::vector<Seat>& seats, TimePoint now) const;
};

} // namespace reservation
