#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Common.hpp"
#include "Errors.hpp"

namespace NReservation {

    // An exclusive, atomic execution context. Every operation that touches
    // inventory, bookings or idempotency keys receives one explicitly.
    // Destroying an unfinished transaction rolls it back.
    class ITransaction {
    public:
        virtual ~ITransaction() = default;

        // Exclusive row locks, taken in the order given (callers pass dates ascending).
        // Returns the records that exist, ascending by date.
        virtual std::vector<TInventoryRecord> SelectInventoryForUpdate(RoomTypeId roomType, const std::vector<TDate>& dates) = 0;
        virtual void UpdateAvailableRooms(RoomTypeId roomType, TDate date, int64_t availableRooms) = 0;
        virtual void UpsertInventory(const TInventoryRecord& record) = 0;

        virtual BookingId InsertBooking(const TBooking& booking) = 0;
        virtual std::optional<TBooking> FindBooking(BookingId id) = 0;
        virtual std::optional<TBooking> SelectBookingForUpdate(BookingId id) = 0;
        virtual void UpdateBooking(const TBooking& booking) = 0;
        virtual std::vector<BookingId> FindBookingIds(EBookingStatus status, TTimePoint createdBefore) = 0;

        virtual std::optional<TIdempotencyRecord> FindIdempotencyKey(const std::string& key) = 0;
        // Throws TUniqueViolation when the key (or the booking) is already bound.
        virtual void InsertIdempotencyKey(const TIdempotencyRecord& record) = 0;
        virtual size_t DeleteIdempotencyKeysBefore(TTimePoint cutoff) = 0;

        virtual void Commit() = 0;
        virtual void Rollback() = 0;
    };

    class IReservationStore {
    public:
        virtual ~IReservationStore() = default;

        // Lock wait beyond the store's timeout raises TReservationError(ConcurrencyAbort).
        virtual std::unique_ptr<ITransaction> Begin() = 0;

        // Committed, non-locking reads.
        virtual std::vector<TInventoryRecord> ReadInventory(RoomTypeId roomType, const std::vector<TDate>& dates) = 0;
        virtual std::vector<TInventoryRecord> ReadAllInventory(RoomTypeId roomType) = 0;
        virtual std::optional<TBooking> ReadBooking(BookingId id) = 0;
    };

} // namespace NReservation
