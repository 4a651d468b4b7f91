#pragma once

#include "seat.hpp"

#include <string>
#include <vector>

/**
 * @file reservation_result.hpp
 * @brief Result types returned by the seat registry.
 *
 * Every rejected operation is an expected, caller-recoverable outcome, so
 * none of them throw: the registry reports them through an ErrorCode and a
 * human-readable message, and always leaves seat state consistent.
 */

namespace reservation {

/**
 * @brief Why an operation was rejected.
 */
enum class ErrorCode {
    None,               /**< Operation succeeded. */
    NotFound,           /**< Seat id is not part of the grid. */
    Conflict,           /**< Seat is booked, or locked by another actor. */
    Forbidden,          /**< Actor is not the holder of the lock it tries to confirm or release. */
    PreconditionFailed, /**< Seat is not in the state the operation starts from. */
    InvalidArgument     /**< Missing or empty actor id. */
};

/**
 * @brief Returns the enumerator name of an error code ("NotFound", ...).
 */
const char* to_string(ErrorCode code);

/**
 * @brief Maps an error code onto the HTTP status a request layer reports for it.
 *
 * @details
 * NotFound 404, Conflict 409, Forbidden 403, PreconditionFailed and
 * InvalidArgument 400, None 200.
 */
int http_status(ErrorCode code);

/**
 * @brief Outcome shared by all mutating operations.
 */
struct OperationResult {
    ErrorCode error = ErrorCode::None; /**< ErrorCode::None on success. */
    std::string message;               /**< Human-readable result description (useful for CLI & tests). */

    bool success() const { return error == ErrorCode::None; }
};

/**
 * @brief Result of Lock (acquire or extend).
 */
struct LockResult : OperationResult {
    SeatView seat;            /**< Seat after the operation (on Conflict: id and status only). */
    bool extended = false;    /**< True if an existing lock of the same actor was extended. */
    int lock_expires_in = -1; /**< Seconds left on the lock; on a contested Conflict, on the other actor's lock. */
};

/**
 * @brief Result of Confirm.
 */
struct ConfirmResult : OperationResult {
    BookingRecord booking; /**< Valid only on success. */
};

/**
 * @brief Result of Get.
 */
struct SeatResult : OperationResult {
    SeatView seat; /**< Valid only on success. */
};

/**
 * @brief Result of List: filtered seats plus whole-grid counts.
 */
struct SeatListing {
    std::vector<SeatView> seats;
    SeatStats stats;
};

} // namespace reservation
