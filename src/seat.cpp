#include "seat.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace reservation {

namespace {
constexpr int kMaxRows = 26; // one letter per row, A..Z
}

const char* to_string(SeatStatus status) {
    switch (status) {
        case SeatStatus::Available: return "available";
        case SeatStatus::Locked: return "locked";
        case SeatStatus::Booked: return "booked";
    }
    return "unknown";
}

bool try_parse_status(const std::string& text, SeatStatus& out_status) {
    if (text == "available") {
        out_status = SeatStatus::Available;
    } else if (text == "locked") {
        out_status = SeatStatus::Locked;
    } else if (text == "booked") {
        out_status = SeatStatus::Booked;
    } else {
        return false;
    }
    return true;
}

void Seat::make_available() {
    status = SeatStatus::Available;
    holder.clear();
    lock_acquired_at = TimePoint{};
    lock_expires_at = TimePoint{};
    booked_at = TimePoint{};
}

std::string seat_id_from_position(int row, int number) {
    return std::string(1, static_cast<char>('A' + row - 1)) + std::to_string(number);
}

bool try_parse_seat_id(const std::string& id, int& out_row, int& out_number) {
    // Expected format: <letter><number>, e.g. A1, J10; ids are matched exactly, so "a1" is not a seat
    if (id.size() < 2) return false;

    const char letter = id[0];
    if (letter < 'A' || letter >= 'A' + kMaxRows) return false;

    // stoi would accept "+1", " 1" and "01"; only plain digits without a leading zero are ids
    if (!std::isdigit(static_cast<unsigned char>(id[1])) || id[1] == '0') return false;

    try {
        std::size_t pos = 0;
        const int num = std::stoi(id.substr(1), &pos);
        if (pos != id.size() - 1) return false; // trailing garbage, e.g. "A1x"

        out_row = letter - 'A' + 1;
        out_number = num;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string format_timestamp(TimePoint tp) {
    using namespace std::chrono;

    const auto ms_since_epoch = duration_cast<milliseconds>(tp.time_since_epoch());
    const std::time_t secs = static_cast<std::time_t>(duration_cast<seconds>(ms_since_epoch).count());
    const auto millis = ms_since_epoch.count() % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << 'Z';
    return oss.str();
}

} // namespace reservation
