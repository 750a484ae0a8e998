#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace NReservation {

    using json = nlohmann::json;

    using BookingId = uint64_t;
    using RoomTypeId = uint64_t;
    using UserId = uint64_t;

    using TTimePoint = std::chrono::system_clock::time_point;

    // Civil calendar date, stored as days since 1970-01-01.
    struct TDate {
        int64_t Days = 0;

        static TDate FromCivil(int year, unsigned month, unsigned day);
        static TDate FromTimePoint(TTimePoint tp);
        // Accepts "YYYY-MM-DD", throws std::invalid_argument otherwise
        static TDate Parse(const std::string& text);

        std::string ToString() const;
        // "YYYY-MM-DDT00:00:00.000Z"
        std::string ToIsoString() const;

        TDate Next() const {
            return TDate{Days + 1};
        }

        friend bool operator==(TDate a, TDate b) {
            return a.Days == b.Days;
        }
        friend bool operator!=(TDate a, TDate b) {
            return a.Days != b.Days;
        }
        friend bool operator<(TDate a, TDate b) {
            return a.Days < b.Days;
        }
        friend bool operator<=(TDate a, TDate b) {
            return a.Days <= b.Days;
        }
        friend bool operator>(TDate a, TDate b) {
            return a.Days > b.Days;
        }
    };

    enum class EBookingStatus {
        Provisional,
        Confirmed,
        Cancelled,
        Completed
    };

    std::string ToString(EBookingStatus status);
    EBookingStatus StatusFromString(const std::string& text);

    struct TInventoryRecord {
        RoomTypeId RoomType = 0;
        TDate Date;
        int64_t AvailableRooms = 0;
    };

    struct TBooking {
        BookingId Id = 0;
        UserId User = 0;
        RoomTypeId RoomType = 0;
        TDate StartDate;
        TDate EndDate;
        uint32_t RoomsBooked = 0;
        EBookingStatus Status = EBookingStatus::Provisional;
        int64_t TotalPrice = 0;
        TTimePoint CreatedAt;
        TTimePoint UpdatedAt;
    };

    struct TIdempotencyRecord {
        std::string Key;
        BookingId Booking = 0;
        std::string Metadata; // serialized JSON
        TTimePoint CreatedAt;
    };

    struct TReserveRequest {
        UserId User = 0;
        RoomTypeId RoomType = 0;
        TDate StartDate;
        TDate EndDate;
        uint32_t RoomsBooked = 1;
        int64_t TotalPrice = 0; // priced by the caller
        bool Confirmed = false; // create CONFIRMED instead of PROVISIONAL
        std::optional<std::string> ClientIp;
        std::optional<std::string> UserAgent;
    };

    struct TInventorySnapshotEntry {
        TDate Date;
        int64_t AvailableRooms = 0;
    };

    inline int64_t ToEpochSeconds(TTimePoint tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    inline TTimePoint FromEpochSeconds(int64_t s) {
        return TTimePoint(std::chrono::seconds(s));
    }

    void ToJSON(json& j, const TBooking& b);
    void FromJsonInternal(const json& j, TBooking& b);

    void ToJSON(json& j, const TInventoryRecord& r);
    void FromJsonInternal(const json& j, TInventoryRecord& r);

    void ToJSON(json& j, const TIdempotencyRecord& r);
    void FromJsonInternal(const json& j, TIdempotencyRecord& r);

} // namespace NReservation
