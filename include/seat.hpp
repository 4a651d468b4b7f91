#pragma once

#include <chrono>
#include <string>

/**
 * @file seat.hpp
 * @brief Seat domain types shared by the registry, the sweeper and the request layer.
 *
 * This header defines:
 * - SeatStatus: the three-state lifecycle (available, locked, booked)
 * - Seat: the mutable record owned by the registry
 * - SeatView / BookingRecord / SeatStats: read-only projections handed to callers
 *
 * Seat ids are "<row letter><number>", e.g. "A1".."J10" for a 10 x 10 grid.
 */

namespace reservation {

/**
 * @brief Timestamp type used for every lock and booking time.
 */
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Lifecycle state of a seat.
 */
enum class SeatStatus {
    Available, /**< Free to be locked by anyone. */
    Locked,    /**< Temporarily held by one actor until the lock expires. */
    Booked     /**< Permanently booked; only a reset returns it to Available. */
};

/**
 * @brief Returns the boundary name of a status ("available", "locked", "booked").
 */
const char* to_string(SeatStatus status);

/**
 * @brief Parses a boundary status name (case-sensitive).
 *
 * @param text Input text, e.g. "locked".
 * @param out_status Parsed status on success.
 * @return True if @p text names a status; false otherwise.
 */
bool try_parse_status(const std::string& text, SeatStatus& out_status);

/**
 * @brief The registry's record of one physical seat.
 *
 * @details
 * Identity (id, row, number) is fixed at construction. Which of the
 * remaining fields are meaningful depends on @ref status:
 * - Available: holder empty, no timestamps
 * - Locked: holder set, lock_acquired_at and lock_expires_at set
 * - Booked: holder set, booked_at set
 *
 * Unset timestamps hold the default-constructed (epoch) value.
 */
struct Seat {
    std::string id;                        /**< Stable identifier, e.g. "A1". */
    int row = 0;                           /**< 1-based row number. */
    int number = 0;                        /**< 1-based seat number inside the row. */
    SeatStatus status = SeatStatus::Available;
    std::string holder;                    /**< Lock holder or booking owner; empty when Available. */
    TimePoint lock_acquired_at{};          /**< First acquisition of the current lock. */
    TimePoint lock_expires_at{};           /**< lock_acquired_at + TTL, pushed out on extension. */
    TimePoint booked_at{};                 /**< Time of confirmation. */

    /** @brief Returns the seat to Available and clears holder and all timestamps. */
    void make_available();
};

/**
 * @brief Read-only projection of a seat at a given instant.
 */
struct SeatView {
    std::string id;
    int row = 0;
    int number = 0;
    SeatStatus status = SeatStatus::Available;
    std::string locked_by;     /**< Lock holder; empty unless Locked. */
    TimePoint locked_at{};     /**< Valid only while Locked. */
    int lock_expires_in = -1;  /**< Whole seconds left on the lock; -1 unless Locked. */
    std::string booked_by;     /**< Booking owner; empty unless Booked. */
    TimePoint booked_at{};     /**< Valid only while Booked. */
};

/**
 * @brief A confirmed booking.
 */
struct BookingRecord {
    std::string seat_id;
    std::string actor_id;
    TimePoint booked_at{};
};

/**
 * @brief Aggregate seat counts over the whole grid.
 */
struct SeatStats {
    int total = 0;
    int available = 0;
    int locked = 0;
    int booked = 0;
};

/**
 * @brief Builds a seat id from a 1-based row and seat number.
 *
 * @param row 1-based row in [1..26].
 * @param number 1-based seat number.
 * @return Seat id, e.g. (1, 1) -> "A1", (10, 10) -> "J10".
 */
std::string seat_id_from_position(int row, int number);

/**
 * @brief Parses a seat id into its 1-based row and seat number.
 *
 * @param id Seat id ("A1", "J10"); the row letter must be upper case.
 * @param out_row Parsed row on success.
 * @param out_number Parsed seat number on success.
 * @return True if @p id is well formed; false otherwise.
 *
 * @note Only the shape is checked here. Whether the position exists is up to the grid.
 */
bool try_parse_seat_id(const std::string& id, int& out_row, int& out_number);

/**
 * @brief Renders a timestamp as ISO 8601 UTC with milliseconds ("2026-10-18T12:00:00.000Z").
 */
std::string format_timestamp(TimePoint tp);

} // namespace reservation
