#include "seat_registry.hpp"

#include "logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace reservation {

SeatRegistry::SeatRegistry(const GridConfig& grid, std::chrono::seconds lock_ttl,
                           std::shared_ptr<const Clock> clock)
    : rows_(grid.rows), seats_per_row_(grid.seats_per_row), lock_ttl_(lock_ttl), clock_(std::move(clock)) {
    if (rows_ < 1 || rows_ > 26) throw std::invalid_argument("rows must be in [1, 26]");
    if (seats_per_row_ < 1) throw std::invalid_argument("seats_per_row must be >= 1");
    if (lock_ttl_.count() <= 0 || lock_ttl_ > kMaxLockTtl) {
        throw std::invalid_argument("lock ttl must be in [1s, " + std::to_string(kMaxLockTtl.count()) + "s]");
    }
    if (!clock_) throw std::invalid_argument("clock must not be null");

    seats_.reserve(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(seats_per_row_));
    for (int row = 1; row <= rows_; ++row) {
        for (int number = 1; number <= seats_per_row_; ++number) {
            Seat seat;
            seat.id = seat_id_from_position(row, number);
            seat.row = row;
            seat.number = number;
            seats_.push_back(std::move(seat));
        }
    }
}

LockResult SeatRegistry::lock_seat(const std::string& seat_id, const std::string& actor_id) {
    LockResult result;
    if (actor_id.empty()) {
        result.error = ErrorCode::InvalidArgument;
        result.message = "actor id is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    const TimePoint now = clock_->now();
    sweeper_.sweep(seats_, now);

    Seat* seat = find_seat(seat_id);
    if (!seat) {
        result.error = ErrorCode::NotFound;
        result.message = "Seat " + seat_id + " not found";
        return result;
    }

    if (seat->status == SeatStatus::Booked) {
        result.error = ErrorCode::Conflict;
        result.message = "Seat " + seat->id + " is already booked";
        result.seat.id = seat->id;
        result.seat.status = seat->status;
        Logger::get()->debug("[SeatRegistry] Lock on {} by {} rejected: booked", seat->id, actor_id);
        return result;
    }

    if (seat->status == SeatStatus::Locked && seat->holder != actor_id) {
        result.error = ErrorCode::Conflict;
        result.lock_expires_in = seconds_until(seat->lock_expires_at, now);
        result.message = "Seat " + seat->id + " is currently locked by another user, retry in " +
                         std::to_string(result.lock_expires_in) + "s";
        result.seat.id = seat->id;
        result.seat.status = seat->status;
        Logger::get()->debug("[SeatRegistry] Lock on {} by {} rejected: held by another actor", seat->id, actor_id);
        return result;
    }

    if (seat->status == SeatStatus::Locked) {
        // same actor: push the deadline out, keep the first acquisition time
        seat->lock_expires_at = now + lock_ttl_;
        result.extended = true;
        result.message = "Lock extended for seat " + seat->id;
        Logger::get()->info("[SeatRegistry] Lock on {} extended by {}", seat->id, actor_id);
    } else {
        seat->status = SeatStatus::Locked;
        seat->holder = actor_id;
        seat->lock_acquired_at = now;
        seat->lock_expires_at = now + lock_ttl_;
        result.message = "Seat " + seat->id + " locked successfully";
        Logger::get()->info("[SeatRegistry] Seat {} locked by {}", seat->id, actor_id);
    }

    result.seat = make_view(*seat, now);
    result.lock_expires_in = result.seat.lock_expires_in;
    return result;
}

ConfirmResult SeatRegistry::confirm_seat(const std::string& seat_id, const std::string& actor_id) {
    ConfirmResult result;
    if (actor_id.empty()) {
        result.error = ErrorCode::InvalidArgument;
        result.message = "actor id is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    const TimePoint now = clock_->now();
    sweeper_.sweep(seats_, now);

    Seat* seat = find_seat(seat_id);
    if (!seat) {
        result.error = ErrorCode::NotFound;
        result.message = "Seat " + seat_id + " not found";
        return result;
    }

    switch (seat->status) {
        case SeatStatus::Booked:
            result.error = ErrorCode::Conflict;
            result.message = "Seat " + seat->id + " is already booked";
            break;
        case SeatStatus::Available:
            result.error = ErrorCode::PreconditionFailed;
            result.message = "Seat " + seat->id + " must be locked before confirmation";
            break;
        case SeatStatus::Locked:
            if (seat->holder != actor_id) {
                result.error = ErrorCode::Forbidden;
                result.message = "Seat " + seat->id + " is locked by another user; only the holder can confirm";
            }
            break;
    }
    if (!result.success()) {
        Logger::get()->debug("[SeatRegistry] Confirm of {} by {} rejected: {}", seat->id, actor_id,
                             to_string(result.error));
        return result;
    }

    seat->status = SeatStatus::Booked;
    seat->booked_at = now;
    seat->lock_acquired_at = TimePoint{};
    seat->lock_expires_at = TimePoint{};

    result.message = "Seat " + seat->id + " booked successfully";
    result.booking = BookingRecord{seat->id, seat->holder, seat->booked_at};
    Logger::get()->info("[SeatRegistry] Seat {} booked by {}", seat->id, actor_id);
    return result;
}

OperationResult SeatRegistry::release_seat(const std::string& seat_id, const std::string& actor_id) {
    OperationResult result;
    if (actor_id.empty()) {
        result.error = ErrorCode::InvalidArgument;
        result.message = "actor id is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    sweeper_.sweep(seats_, clock_->now());

    Seat* seat = find_seat(seat_id);
    if (!seat) {
        result.error = ErrorCode::NotFound;
        result.message = "Seat " + seat_id + " not found";
        return result;
    }
    if (seat->status != SeatStatus::Locked) {
        result.error = ErrorCode::PreconditionFailed;
        result.message = "Seat " + seat->id + " is not locked";
        return result;
    }
    if (seat->holder != actor_id) {
        result.error = ErrorCode::Forbidden;
        result.message = "You can only release seats that you have locked";
        Logger::get()->debug("[SeatRegistry] Release of {} by {} rejected: held by another actor", seat->id,
                             actor_id);
        return result;
    }

    seat->make_available();
    result.message = "Seat " + seat->id + " released successfully";
    Logger::get()->info("[SeatRegistry] Seat {} released by {}", seat->id, actor_id);
    return result;
}

SeatResult SeatRegistry::get_seat(const std::string& seat_id) {
    SeatResult result;

    std::lock_guard<std::mutex> guard(mutex_);
    const TimePoint now = clock_->now();
    sweeper_.sweep(seats_, now);

    const Seat* seat = find_seat(seat_id);
    if (!seat) {
        result.error = ErrorCode::NotFound;
        result.message = "Seat " + seat_id + " not found";
        Logger::get()->debug("[SeatRegistry] Read of unknown seat {}", seat_id);
        return result;
    }

    result.seat = make_view(*seat, now);
    result.message = "Seat " + seat->id + " is " + to_string(seat->status);
    Logger::get()->debug("[SeatRegistry] Read seat {} ({})", seat->id, to_string(seat->status));
    return result;
}

SeatListing SeatRegistry::list_seats(const SeatFilter& filter) {
    SeatListing listing;

    std::lock_guard<std::mutex> guard(mutex_);
    const TimePoint now = clock_->now();
    sweeper_.sweep(seats_, now);

    for (const auto& seat : seats_) {
        ++listing.stats.total;
        switch (seat.status) {
            case SeatStatus::Available: ++listing.stats.available; break;
            case SeatStatus::Locked: ++listing.stats.locked; break;
            case SeatStatus::Booked: ++listing.stats.booked; break;
        }

        if (filter.status && seat.status != *filter.status) continue;
        // holder is both the lock holder and the booking owner
        if (!filter.actor_id.empty() && seat.holder != filter.actor_id) continue;

        listing.seats.push_back(make_view(seat, now));
    }

    Logger::get()->debug("[SeatRegistry] Listed {} of {} seats", listing.seats.size(), listing.stats.total);
    return listing;
}

std::vector<BookingRecord> SeatRegistry::list_bookings(const std::string& actor_id) {
    std::vector<BookingRecord> bookings;

    std::lock_guard<std::mutex> guard(mutex_);
    sweeper_.sweep(seats_, clock_->now());

    for (const auto& seat : seats_) {
        if (seat.status != SeatStatus::Booked) continue;
        if (!actor_id.empty() && seat.holder != actor_id) continue;
        bookings.push_back(BookingRecord{seat.id, seat.holder, seat.booked_at});
    }

    Logger::get()->debug("[SeatRegistry] Listed {} booking(s)", bookings.size());
    return bookings;
}

OperationResult SeatRegistry::reset() {
    std::lock_guard<std::mutex> guard(mutex_);

    for (auto& seat : seats_) {
        seat.make_available();
    }

    Logger::get()->warn("[SeatRegistry] All {} seats reset to available", seats_.size());
    return OperationResult{ErrorCode::None, "All seats have been reset to available"};
}

std::size_t SeatRegistry::sweep_expired() {
    std::lock_guard<std::mutex> guard(mutex_);
    return sweeper_.sweep(seats_, clock_->now());
}

Seat* SeatRegistry::find_seat(const std::string& seat_id) {
    int row = 0;
    int number = 0;
    if (!try_parse_seat_id(seat_id, row, number)) return nullptr;
    if (row > rows_ || number > seats_per_row_) return nullptr;

    const auto index = static_cast<std::size_t>(row - 1) * static_cast<std::size_t>(seats_per_row_) +
                       static_cast<std::size_t>(number - 1);
    return &seats_[index];
}

SeatView SeatRegistry::make_view(const Seat& seat, TimePoint now) {
    SeatView view;
    view.id = seat.id;
    view.row = seat.row;
    view.number = seat.number;
    view.status = seat.status;

    if (seat.status == SeatStatus::Locked) {
        view.locked_by = seat.holder;
        view.locked_at = seat.lock_acquired_at;
        view.lock_expires_in = seconds_until(seat.lock_expires_at, now);
    } else if (seat.status == SeatStatus::Booked) {
        view.booked_by = seat.holder;
        view.booked_at = seat.booked_at;
    }
    return view;
}

int SeatRegistry::seconds_until(TimePoint deadline, TimePoint now) {
    if (deadline <= now) return 0;
    const auto left = std::chrono::ceil<std::chrono::seconds>(deadline - now);
    // deadlines are at most kMaxLockTtl ahead, so this always fits an int
    return static_cast<int>(std::min(left, kMaxLockTtl).count());
}

} // namespace reservation
