#pragma once
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "Errors.hpp"
#include "InventoryLockManager.hpp"
#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    struct TExpireResult {
        size_t Expired = 0;
        // Bookings whose expiry transaction failed; they stay PROVISIONAL.
        std::vector<std::pair<BookingId, TErrorResponse>> Failed;
    };

    // PROVISIONAL -> CONFIRMED | CANCELLED, CONFIRMED -> CANCELLED | COMPLETED.
    // CANCELLED and COMPLETED are terminal.
    class TBookingStateMachine {
    public:
        TBookingStateMachine(std::shared_ptr<IReservationStore> store,
                             std::shared_ptr<TInventoryLockManager> inventory,
                             std::shared_ptr<TLogger> logger);

        static bool CanTransition(EBookingStatus from, EBookingStatus to);

        TBookingResult Confirm(BookingId id, TTimePoint now);
        // Restores inventory. Cancelling a cancelled booking returns it unchanged.
        TBookingResult Cancel(BookingId id, TTimePoint now);
        TBookingResult Complete(BookingId id, TTimePoint now);

        // Cancels every PROVISIONAL booking created before the cutoff, one transaction each.
        // A failing scan throws; a failing booking is reported in Failed.
        TExpireResult ExpireProvisional(TTimePoint createdBefore, TTimePoint now);

    private:
        TBookingResult Transition(BookingId id, EBookingStatus target, TTimePoint now);

    private:
        std::shared_ptr<IReservationStore> Store;
        std::shared_ptr<TInventoryLockManager> Inventory;
        std::shared_ptr<TLogger> Logger;
    };

} // namespace NReservation
