#include "background_sweeper.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "seat_registry.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

using namespace reservation;

namespace {

void print_help() {
    std::cout
        << "Commands:\n"
        << "  seats [status=available|locked|booked] [user=<id>]\n"
        << "  seat <seat_id>\n"
        << "  lock <seat_id> <user>\n"
        << "  confirm <seat_id> <user>\n"
        << "  release <seat_id> <user>\n"
        << "  bookings [user]\n"
        << "  reset\n"
        << "  config\n"
        << "  exit\n";
}

void print_outcome(const OperationResult& r, int success_status = 200) {
    if (r.success()) {
        std::cout << "OK [" << success_status << "]: " << r.message << "\n";
    } else {
        std::cout << "FAIL [" << http_status(r.error) << " " << to_string(r.error) << "]: " << r.message << "\n";
    }
}

void print_seat(const SeatView& s) {
    std::cout << "  " << s.id << " (row " << s.row << ", seat " << s.number << "): " << to_string(s.status);
    if (s.status == SeatStatus::Locked) {
        std::cout << " by " << s.locked_by << " since " << format_timestamp(s.locked_at) << ", expires in "
                  << s.lock_expires_in << "s";
    } else if (s.status == SeatStatus::Booked) {
        std::cout << " by " << s.booked_by << " at " << format_timestamp(s.booked_at);
    }
    std::cout << "\n";
}

void print_booking(const BookingRecord& b) {
    std::cout << "  " << b.seat_id << " -> " << b.actor_id << " at " << format_timestamp(b.booked_at) << "\n";
}

void print_config(const Config& cfg) {
    std::cout << "Rows: " << cfg.grid.rows << " (A-" << static_cast<char>('A' + cfg.grid.rows - 1) << ")\n"
              << "Seats per row: " << cfg.grid.seats_per_row << "\n"
              << "Total seats: " << cfg.grid.rows * cfg.grid.seats_per_row << "\n"
              << "Lock timeout: " << cfg.locks.ttl.count() << " seconds\n"
              << "Background sweep: "
              << (cfg.sweeper.background ? "every " + std::to_string(cfg.sweeper.interval.count()) + " ms" : "off")
              << "\n";
}

// Parses "status=<s>" / "user=<id>" tokens; returns false on an unknown token or status
bool parse_seat_filter(std::istringstream& iss, SeatFilter& filter) {
    std::string token;
    while (iss >> token) {
        const auto eq = token.find('=');
        if (eq == std::string::npos) return false;

        const std::string key = token.substr(0, eq);
        const std::string value = token.substr(eq + 1);
        if (key == "status") {
            SeatStatus status;
            if (!try_parse_status(value, status)) return false;
            filter.status = status;
        } else if (key == "user") {
            filter.actor_id = value;
        } else {
            return false;
        }
    }
    return true;
}

void run_shell(SeatRegistry& registry, const Config& cfg) {
    std::cout << "Seat Reservation CLI\n";
    print_help();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            print_help();
        } else if (cmd == "seats") {
            SeatFilter filter;
            if (!parse_seat_filter(iss, filter)) {
                std::cout << "Usage: seats [status=available|locked|booked] [user=<id>]\n";
                continue;
            }
            const SeatListing listing = registry.list_seats(filter);
            std::cout << "Total " << listing.stats.total << ", available " << listing.stats.available
                      << ", locked " << listing.stats.locked << ", booked " << listing.stats.booked << "\n";
            for (const auto& s : listing.seats) print_seat(s);
        } else if (cmd == "seat") {
            std::string seat_id;
            iss >> seat_id;
            const SeatResult r = registry.get_seat(seat_id);
            print_outcome(r);
            if (r.success()) print_seat(r.seat);
        } else if (cmd == "lock") {
            std::string seat_id, user;
            iss >> seat_id >> user;
            const LockResult r = registry.lock_seat(seat_id, user);
            print_outcome(r, r.extended ? 200 : 201);
            if (r.success()) {
                print_seat(r.seat);
            } else if (r.lock_expires_in >= 0) {
                std::cout << "  lock expires in " << r.lock_expires_in << "s\n";
            }
        } else if (cmd == "confirm") {
            std::string seat_id, user;
            iss >> seat_id >> user;
            const ConfirmResult r = registry.confirm_seat(seat_id, user);
            print_outcome(r);
            if (r.success()) print_booking(r.booking);
        } else if (cmd == "release") {
            std::string seat_id, user;
            iss >> seat_id >> user;
            print_outcome(registry.release_seat(seat_id, user));
        } else if (cmd == "bookings") {
            std::string user;
            iss >> user;
            const std::vector<BookingRecord> bookings = registry.list_bookings(user);
            std::cout << "Bookings (" << bookings.size() << "):\n";
            for (const auto& b : bookings) print_booking(b);
        } else if (cmd == "reset") {
            print_outcome(registry.reset());
        } else if (cmd == "config") {
            print_config(cfg);
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    Config cfg;
    try {
        if (argc > 1) cfg = load_config(argv[1]);
    } catch (const YAML::Exception& e) {
        std::cerr << "Failed to read config " << argv[1] << ": " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid config " << argv[1] << ": " << e.what() << "\n";
        return 1;
    }

    try {
        Logger::init(cfg.logging.level, cfg.logging.file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialise logging: " << e.what() << "\n";
        return 1;
    }

    SeatRegistry registry(cfg.grid, cfg.locks.ttl);
    Logger::get()->info("Seat reservation started: {} rows x {} seats = {} seats, lock timeout {}s",
                        registry.rows(), registry.seats_per_row(), registry.seat_count(),
                        registry.lock_ttl().count());

    std::unique_ptr<BackgroundSweeper> sweeper;
    if (cfg.sweeper.background) {
        sweeper = std::make_unique<BackgroundSweeper>(registry, cfg.sweeper.interval);
        sweeper->start();
    }

    run_shell(registry, cfg);

    if (sweeper) sweeper->stop();
    Logger::get()->info("Seat reservation stopped");
    return 0;
}
