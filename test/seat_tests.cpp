#include <gtest/gtest.h>

#include "reservation_result.hpp"
#include "seat.hpp"

#include <chrono>

using namespace reservation;

// ---------- Tests: seat id parsing / formatting ----------
TEST(SeatIdParsing, ValidIds) {
    int row = 0, number = 0;
    EXPECT_TRUE(try_parse_seat_id("A1", row, number));
    EXPECT_EQ(row, 1);
    EXPECT_EQ(number, 1);

    EXPECT_TRUE(try_parse_seat_id("J10", row, number));
    EXPECT_EQ(row, 10);
    EXPECT_EQ(number, 10);

    EXPECT_TRUE(try_parse_seat_id("Z26", row, number));
    EXPECT_EQ(row, 26);
    EXPECT_EQ(number, 26);
}

TEST(SeatIdParsing, InvalidIds) {
    int row = 0, number = 0;
    EXPECT_FALSE(try_parse_seat_id("", row, number));
    EXPECT_FALSE(try_parse_seat_id("A", row, number));
    EXPECT_FALSE(try_parse_seat_id("1A", row, number));
    EXPECT_FALSE(try_parse_seat_id("A0", row, number));
    EXPECT_FALSE(try_parse_seat_id("A01", row, number));
    EXPECT_FALSE(try_parse_seat_id("A+1", row, number));
    EXPECT_FALSE(try_parse_seat_id("A-1", row, number));
    EXPECT_FALSE(try_parse_seat_id("A 1", row, number));
    EXPECT_FALSE(try_parse_seat_id("A1x", row, number));
    EXPECT_FALSE(try_parse_seat_id("@1", row, number));
    EXPECT_FALSE(try_parse_seat_id("a1", row, number)); // ids are case-sensitive
    EXPECT_FALSE(try_parse_seat_id("j10", row, number));
    EXPECT_FALSE(try_parse_seat_id("A99999999999999", row, number));
}

TEST(SeatIdFormatting, PositionToId) {
    EXPECT_EQ(seat_id_from_position(1, 1), "A1");
    EXPECT_EQ(seat_id_from_position(10, 10), "J10");
    EXPECT_EQ(seat_id_from_position(26, 3), "Z3");
}

TEST(SeatStatusNames, RoundTripBoundaryNames) {
    SeatStatus status = SeatStatus::Available;
    EXPECT_TRUE(try_parse_status("locked", status));
    EXPECT_EQ(status, SeatStatus::Locked);
    EXPECT_STREQ(to_string(SeatStatus::Booked), "booked");

    EXPECT_FALSE(try_parse_status("Locked", status));
    EXPECT_FALSE(try_parse_status("", status));
}

TEST(SeatRecord, MakeAvailableClearsEverything) {
    Seat seat;
    seat.id = "B2";
    seat.status = SeatStatus::Booked;
    seat.holder = "u1";
    seat.booked_at = std::chrono::system_clock::now();

    seat.make_available();

    EXPECT_EQ(seat.id, "B2");
    EXPECT_EQ(seat.status, SeatStatus::Available);
    EXPECT_TRUE(seat.holder.empty());
    EXPECT_EQ(seat.booked_at, TimePoint{});
    EXPECT_EQ(seat.lock_expires_at, TimePoint{});
}

TEST(Timestamps, IsoFormatWithMilliseconds) {
    // 2021-01-01T00:00:00Z plus 42 ms
    const TimePoint tp = TimePoint(std::chrono::seconds(1609459200)) + std::chrono::milliseconds(42);
    EXPECT_EQ(format_timestamp(tp), "2021-01-01T00:00:00.042Z");
}

TEST(ErrorCodes, MapToHttpStatus) {
    EXPECT_EQ(http_status(ErrorCode::None), 200);
    EXPECT_EQ(http_status(ErrorCode::NotFound), 404);
    EXPECT_EQ(http_status(ErrorCode::Conflict), 409);
    EXPECT_EQ(http_status(ErrorCode::Forbidden), 403);
    EXPECT_EQ(http_status(ErrorCode::PreconditionFailed), 400);
    EXPECT_EQ(http_status(ErrorCode::InvalidArgument), 400);
    EXPECT_STREQ(to_string(ErrorCode::PreconditionFailed), "PreconditionFailed");
}
