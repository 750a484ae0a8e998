#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Common.hpp"
#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    using TClock = std::function<TTimePoint()>;

    struct TKeyLookup {
        TIdempotencyRecord Record;
        std::optional<TBooking> Booking;
    };

    class TIdempotencyKeyManager {
    public:
        TIdempotencyKeyManager(std::chrono::hours retention, TClock clock, std::shared_ptr<TLogger> logger);

        // Lowercase hex SHA-256 of "user|roomType|startISO|endISO|rooms".
        static std::string DeriveKey(UserId user, RoomTypeId roomType, TDate start, TDate end, uint32_t roomsBooked);
        static std::string DeriveKey(const TReserveRequest& request);
        static bool IsValidKeyFormat(const std::string& candidate);

        // A well-formed client key is used verbatim, anything else falls back to DeriveKey.
        std::string AcceptClientSuppliedKey(const TReserveRequest& request, const std::optional<std::string>& candidate) const;

        std::optional<TKeyLookup> Lookup(ITransaction& tx, const std::string& key) const;
        void Bind(ITransaction& tx, const std::string& key, BookingId booking, const std::string& metadata) const;

        std::string MakeMetadata(const TReserveRequest& request) const;
        static bool MatchesRequest(const TBooking& booking, const TReserveRequest& request);

        // Deletes keys created before now - retention. Bookings and inventory are untouched.
        size_t SweepExpired(IReservationStore& store, TTimePoint now) const;

        TTimePoint Now() const {
            return Clock();
        }

    private:
        std::chrono::hours Retention;
        TClock Clock;
        std::shared_ptr<TLogger> Logger;
    };

} // namespace NReservation
