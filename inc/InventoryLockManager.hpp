#pragma once
#include <map>
#include <memory>
#include <vector>

#include "Common.hpp"
#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    struct TInventoryValidation {
        bool Ok = false;
        std::vector<TDate> InsufficientDates;
        // Smallest availability among the insufficient dates, 0 for a missing record.
        int64_t MinAvailable = 0;
    };

    // The only writer of available rooms. Every mutation runs under row locks
    // taken in ascending date order inside the caller's transaction.
    class TInventoryLockManager {
    public:
        explicit TInventoryLockManager(std::shared_ptr<TLogger> logger)
            : Logger(std::move(logger)) {
        }

        std::vector<TInventoryRecord> LockForUpdate(ITransaction& tx, RoomTypeId roomType, std::vector<TDate> dates) const;

        static TInventoryValidation Validate(const std::vector<TInventoryRecord>& locked,
                                             uint32_t requestedRooms,
                                             const std::vector<TDate>& requestedDates);

        // Call only after Validate succeeded on the same locked records.
        void Decrement(ITransaction& tx, const std::vector<TInventoryRecord>& locked, uint32_t roomsBooked) const;
        void Increment(ITransaction& tx, RoomTypeId roomType, const std::vector<TDate>& dates, uint32_t roomsBooked) const;

        void Seed(ITransaction& tx, RoomTypeId roomType, const std::vector<TDate>& dates, int64_t availableRooms) const;

        // Committed, non-locking. Not for reservation decisions.
        static std::map<TDate, int64_t> Snapshot(IReservationStore& store, RoomTypeId roomType, const std::vector<TDate>& dates);
        static bool VerifyIntegrity(IReservationStore& store, RoomTypeId roomType);

    private:
        std::shared_ptr<TLogger> Logger;
    };

} // namespace NReservation
