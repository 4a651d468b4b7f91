#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "expiry_sweeper.hpp"
#include "reservation_result.hpp"
#include "seat.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @file seat_registry.hpp
 * @brief Public API for the in-memory seat reservation registry.
 *
 * Concurrency model:
 * - One registry-wide mutex serializes every operation, reads included.
 * - Each operation runs "sweep expired locks, then act" as a single critical
 *   section, so no caller ever observes or acts on a lock past its expiry.
 * - Contention never blocks on a seat: a losing actor gets Conflict or
 *   Forbidden immediately.
 *
 * Actor ids are trusted as supplied; the registry does no authentication.
 */

namespace reservation {

/**
 * @brief Optional filters for @ref SeatRegistry::list_seats.
 */
struct SeatFilter {
    std::optional<SeatStatus> status; /**< Only seats in this status. */
    std::string actor_id;             /**< Only seats locked or booked by this actor; empty = any. */
};

/**
 * @brief Sole owner of seat state and of every transition on it.
 *
 * @details
 * The registry is built once over a fixed rows x seats_per_row grid, all
 * seats Available, and is shared by reference with the request layer and
 * the optional background sweeper.
 *
 * ### Transitions
 * - Available -> Locked (lock_seat)
 * - Locked -> Locked, expiry pushed out (lock_seat by the same actor)
 * - Locked -> Booked (confirm_seat by the holder)
 * - Locked -> Available (release_seat by the holder, or lock expiry)
 * - any -> Available (reset, administrative)
 *
 * ### Thread-safety
 * All public member functions may be called concurrently.
 */
class SeatRegistry {
public:
    /**
     * @brief Builds the seat grid.
     *
     * @param grid Grid shape; rows in [1..26], seats_per_row >= 1.
     * @param lock_ttl Lifetime of a lock; must be positive.
     * @param clock Time source for every lock and booking timestamp.
     *
     * @throws std::invalid_argument if the grid or TTL is out of range, or clock is null.
     */
    SeatRegistry(const GridConfig& grid, std::chrono::seconds lock_ttl,
                 std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    SeatRegistry(const SeatRegistry&) = delete;
    SeatRegistry& operator=(const SeatRegistry&) = delete;

    /**
     * @brief Acquires a lock on a seat, or extends the actor's existing one.
     *
     * @param seat_id Seat identifier, e.g. "A1".
     * @param actor_id Requesting actor; must be non-empty.
     * @return LockResult; on success @c extended tells a new lock from an extension.
     *
     * @details
     * - InvalidArgument: empty actor id
     * - NotFound: unknown seat
     * - Conflict: seat booked, or locked by another actor (@c lock_expires_in
     *   then carries the other lock's remaining seconds)
     * - Same actor: lock_expires_at = now + TTL, lock_acquired_at unchanged
     */
    LockResult lock_seat(const std::string& seat_id, const std::string& actor_id);

    /**
     * @brief Turns the actor's lock into a permanent booking.
     *
     * @details
     * - InvalidArgument: empty actor id
     * - NotFound: unknown seat
     * - Conflict: seat already booked
     * - PreconditionFailed: seat Available (nothing to confirm)
     * - Forbidden: seat locked by another actor
     */
    ConfirmResult confirm_seat(const std::string& seat_id, const std::string& actor_id);

    /**
     * @brief Gives up the actor's lock before it expires.
     *
     * @details
     * - InvalidArgument: empty actor id
     * - NotFound: unknown seat
     * - PreconditionFailed: seat not Locked
     * - Forbidden: seat locked by another actor
     */
    OperationResult release_seat(const std::string& seat_id, const std::string& actor_id);

    /**
     * @brief Returns the current projection of one seat (NotFound if unknown).
     */
    SeatResult get_seat(const std::string& seat_id);

    /**
     * @brief Lists seats in grid order, filtered, with whole-grid counts.
     */
    SeatListing list_seats(const SeatFilter& filter = {});

    /**
     * @brief Lists bookings in grid order, optionally only those owned by @p actor_id.
     *
     * @param actor_id Booking owner; empty = every booking.
     */
    std::vector<BookingRecord> list_bookings(const std::string& actor_id = "");

    /**
     * @brief Forces every seat back to Available, bookings included.
     *
     * @warning Destructive: meant for test and maintenance workflows only.
     */
    OperationResult reset();

    /**
     * @brief Reclaims expired locks now.
     *
     * @return Number of locks reclaimed.
     *
     * @details
     * Every other public operation already sweeps first; this entry point
     * exists for periodic sweeping from a background thread.
     */
    std::size_t sweep_expired();

    int rows() const { return rows_; }
    int seats_per_row() const { return seats_per_row_; }
    std::size_t seat_count() const { return seats_.size(); }
    std::chrono::seconds lock_ttl() const { return lock_ttl_; }

private:
    int rows_;
    int seats_per_row_;
    std::chrono::seconds lock_ttl_;
    std::shared_ptr<const Clock> clock_;
    ExpirySweeper sweeper_;

    /**
     * @brief Guards @ref seats_. Held for the whole sweep-then-act step of every operation.
     */
    std::mutex mutex_;

    /**
     * @brief Seat table in grid order: index = (row - 1) * seats_per_row + (number - 1).
     */
    std::vector<Seat> seats_;

    /**
     * @brief Looks up a seat by id. Caller holds @ref mutex_.
     *
     * @return Pointer into @ref seats_, or nullptr if the id is malformed or off the grid.
     */
    Seat* find_seat(const std::string& seat_id);

    /** @brief Projection of @p seat at @p now. */
    static SeatView make_view(const Seat& seat, TimePoint now);

    /** @brief Whole seconds from @p now until @p deadline, rounded up, never negative. */
    static int seconds_until(TimePoint deadline, TimePoint now);
};

} // namespace reservation
