#include <Common.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace NReservation {

    namespace {

        // Howard Hinnant's days_from_civil / civil_from_days
        int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }

        void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
            z += 719468;
            const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            y = static_cast<int64_t>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y += m <= 2;
        }

        bool IsLeap(int y) {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        unsigned DaysInMonth(int y, unsigned m) {
            static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && IsLeap(y)) {
                return 29;
            }
            return table[m - 1];
        }

    } // namespace

    TDate TDate::FromCivil(int year, unsigned month, unsigned day) {
        if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
            throw std::invalid_argument("Invalid calendar date");
        }
        return TDate{DaysFromCivil(year, month, day)};
    }

    TDate TDate::FromTimePoint(TTimePoint tp) {
        using namespace std::chrono;
        auto secs = duration_cast<seconds>(tp.time_since_epoch()).count();
        int64_t days = secs / 86400;
        if (secs % 86400 < 0) {
            --days;
        }
        return TDate{days};
    }

    TDate TDate::Parse(const std::string& text) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        char tail = 0;
        auto digits = [&text](size_t from, size_t to) {
            for (size_t i = from; i < to; ++i) {
                if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                    return false;
                }
            }
            return true;
        };
        if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
            !digits(0, 4) || !digits(5, 7) || !digits(8, 10) ||
            std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
            throw std::invalid_argument("Invalid date, expected YYYY-MM-DD: " + text);
        }
        return FromCivil(y, m, d);
    }

    std::string TDate::ToString() const {
        int64_t y = 0;
        unsigned m = 0;
        unsigned d = 0;
        CivilFromDays(Days, y, m, d);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
        return buf;
    }

    std::string TDate::ToIsoString() const {
        return ToString() + "T00:00:00.000Z";
    }

    std::string ToString(EBookingStatus status) {
        switch (status) {
            case EBookingStatus::Provisional:
                return "PROVISIONAL";
            case EBookingStatus::Confirmed:
                return "CONFIRMED";
            case EBookingStatus::Cancelled:
                return "CANCELLED";
            case EBookingStatus::Completed:
                return "COMPLETED";
        }
        return "UNKNOWN";
    }

    EBookingStatus StatusFromString(const std::string& text) {
        if (text == "PROVISIONAL") {
            return EBookingStatus::Provisional;
        }
        if (text == "CONFIRMED") {
            return EBookingStatus::Confirmed;
        }
        if (text == "CANCELLED") {
            return EBookingStatus::Cancelled;
        }
        if (text == "COMPLETED") {
            return EBookingStatus::Completed;
        }
        throw std::invalid_argument("Unknown booking status: " + text);
    }

    void ToJSON(json& j, const TBooking& b) {
        j = json{{"id", b.Id},
                 {"user_id", b.User},
                 {"room_type_id", b.RoomType},
                 {"start_date", b.StartDate.ToString()},
                 {"end_date", b.EndDate.ToString()},
                 {"rooms_booked", b.RoomsBooked},
                 {"status", ToString(b.Status)},
                 {"total_price", b.TotalPrice},
                 {"created_at", ToEpochSeconds(b.CreatedAt)},
                 {"updated_at", ToEpochSeconds(b.UpdatedAt)}};
    }

    void FromJsonInternal(const json& j, TBooking& b) {
        b.Id = j.at("id").get<BookingId>();
        b.User = j.at("user_id").get<UserId>();
        b.RoomType = j.at("room_type_id").get<RoomTypeId>();
        b.StartDate = TDate::Parse(j.at("start_date").get<std::string>());
        b.EndDate = TDate::Parse(j.at("end_date").get<std::string>());
        b.RoomsBooked = j.at("rooms_booked").get<uint32_t>();
        b.Status = StatusFromString(j.at("status").get<std::string>());
        b.TotalPrice = j.value("total_price", int64_t{0});
        b.CreatedAt = FromEpochSeconds(j.value("created_at", int64_t{0}));
        b.UpdatedAt = FromEpochSeconds(j.value("updated_at", int64_t{0}));
    }

    void ToJSON(json& j, const TInventoryRecord& r) {
        j = json{{"room_type_id", r.RoomType}, {"date", r.Date.ToString()}, {"available_rooms", r.AvailableRooms}};
    }

    void FromJsonInternal(const json& j, TInventoryRecord& r) {
        r.RoomType = j.at("room_type_id").get<RoomTypeId>();
        r.Date = TDate::Parse(j.at("date").get<std::string>());
        r.AvailableRooms = j.at("available_rooms").get<int64_t>();
    }

    void ToJSON(json& j, const TIdempotencyRecord& r) {
        j = json{{"key", r.Key}, {"booking_id", r.Booking}, {"metadata", r.Metadata}, {"created_at", ToEpochSeconds(r.CreatedAt)}};
    }

    void FromJsonInternal(const json& j, TIdempotencyRecord& r) {
        r.Key = j.at("key").get<std::string>();
        r.Booking = j.at("booking_id").get<BookingId>();
        r.Metadata = j.value("metadata", std::string());
        r.CreatedAt = FromEpochSeconds(j.value("created_at", int64_t{0}));
    }

} // namespace NReservation
