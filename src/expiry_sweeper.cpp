#include "expiry_sweeper.hpp"

#include "logger.hpp"

namespace reservation {

bool ExpirySweeper::is_expired(const Seat& seat, TimePoint now) {
    return seat.status == SeatStatus::Locked && now >= seat.lock_expires_at;
}

std::size_t ExpirySweeper::sweep(std::vector<Seat>& seats, TimePoint now) const {
    std::size_t reclaimed = 0;

    for (auto& seat : seats) {
        if (!is_expired(seat, now)) continue;

        Logger::get()->debug("[ExpirySweeper] Lock on seat {} held by {} expired", seat.id, seat.holder);
        seat.make_available();
        ++reclaimed;
    }

    if (reclaimed > 0) {
        Logger::get()->info("[ExpirySweeper] Reclaimed {} expired lock(s)", reclaimed);
    }
    return reclaimed;
}

} // namespace reservation
