#include <BookingManager.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace NReservation;

int main(int argc, char** argv) {
    TReservationConfig config;
    try {
        if (argc > 1) {
            config = LoadConfig(argv[1]);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    auto logger = std::make_shared<TLogger>(std::clog, config.LogLevel);
    std::unique_ptr<TBookingManager> mgr;
    try {
        mgr = std::make_unique<TBookingManager>(config, logger);
    } catch (const std::exception& ex) {
        logger->Error("cli", "failed to open store", {{"reason", ex.what()}});
        return 1;
    }

    std::cout << "Reservation CLI. Commands:\n"
              << "  seed <room_type> <start YYYY-MM-DD> <end YYYY-MM-DD> <available>\n"
              << "  reserve <user> <room_type> <start> <end> <rooms> <price> [key]\n"
              << "  confirm <id>\n"
              << "  cancel <id>\n"
              << "  complete <id>\n"
              << "  get <id>\n"
              << "  snapshot <room_type> <start> <end>\n"
              << "  verify <room_type>\n"
              << "  sweep\n"
              << "  expire <minutes>\n"
              << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "seed") {
                RoomTypeId rt;
                std::string start;
                std::string end;
                int64_t available;
                iss >> rt >> start >> end >> available;
                if (!iss) {
                    std::cout << "Usage: seed <room_type> <start> <end> <available>\n";
                    continue;
                }
                mgr->SeedInventory(rt, TDate::Parse(start), TDate::Parse(end), available);
                std::cout << "Seeded room_type=" << rt << "\n";
                continue;
            }

            if (cmd == "reserve") {
                TReserveRequest req;
                std::string start;
                std::string end;
                iss >> req.User >> req.RoomType >> start >> end >> req.RoomsBooked >> req.TotalPrice;
                if (!iss) {
                    std::cout << "Usage: reserve <user> <room_type> <start> <end> <rooms> <price> [key]\n";
                    continue;
                }
                req.StartDate = TDate::Parse(start);
                req.EndDate = TDate::Parse(end);
                std::optional<std::string> key;
                std::string k;
                if (iss >> k) {
                    key = k;
                }
                std::cout << mgr->Reserve(req, key).ToJson().dump() << "\n";
                continue;
            }

            if (cmd == "confirm" || cmd == "cancel" || cmd == "complete") {
                BookingId id;
                iss >> id;
                if (!iss) {
                    std::cout << "Usage: " << cmd << " <id>\n";
                    continue;
                }
                TBookingResult res = cmd == "confirm" ? mgr->Confirm(id)
                                   : cmd == "cancel"  ? mgr->Cancel(id)
                                                      : mgr->Complete(id);
                std::cout << res.ToJson().dump() << "\n";
                continue;
            }

            if (cmd == "get") {
                BookingId id;
                iss >> id;
                if (!iss) {
                    std::cout << "Usage: get <id>\n";
                    continue;
                }
                auto b = mgr->GetBooking(id);
                if (!b) {
                    std::cout << "Not found id=" << id << "\n";
                    continue;
                }
                json j;
                ToJSON(j, *b);
                std::cout << j.dump() << "\n";
                continue;
            }

            if (cmd == "snapshot") {
                RoomTypeId rt;
                std::string start;
                std::string end;
                iss >> rt >> start >> end;
                if (!iss) {
                    std::cout << "Usage: snapshot <room_type> <start> <end>\n";
                    continue;
                }
                for (auto const& e : mgr->Snapshot(rt, TDate::Parse(start), TDate::Parse(end))) {
                    std::cout << e.Date.ToString() << " available=" << e.AvailableRooms << "\n";
                }
                continue;
            }

            if (cmd == "verify") {
                RoomTypeId rt;
                iss >> rt;
                if (!iss) {
                    std::cout << "Usage: verify <room_type>\n";
                    continue;
                }
                std::cout << (mgr->VerifyIntegrity(rt) ? "OK" : "NEGATIVE INVENTORY") << "\n";
                continue;
            }

            if (cmd == "sweep") {
                std::cout << "Removed " << mgr->SweepIdempotencyKeys() << " keys\n";
                continue;
            }

            if (cmd == "expire") {
                int64_t minutes;
                iss >> minutes;
                if (!iss) {
                    std::cout << "Usage: expire <minutes>\n";
                    continue;
                }
                auto result = mgr->ExpireProvisional(std::chrono::minutes(minutes));
                std::cout << "Expired " << result.Expired << " bookings\n";
                for (auto const& [id, error] : result.Failed) {
                    std::cout << "Booking " << id << ": " << error.ToJson().dump() << "\n";
                }
                continue;
            }

            std::cout << "Unknown command\n";
        } catch (const TReservationError& ex) {
            std::cout << ex.GetResponse().ToJson().dump() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    return 0;
}
