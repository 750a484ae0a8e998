#pragma once
#include <memory>
#include <optional>
#include <vector>

#include "BookingOrchestrator.hpp"
#include "BookingStateMachine.hpp"
#include "Common.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "IdempotencyKeyManager.hpp"
#include "InventoryLockManager.hpp"
#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    // Builds the store selected by config.Store.
    std::shared_ptr<IReservationStore> MakeStore(const TReservationConfig& config, std::shared_ptr<TLogger> logger);

    class TBookingManager {
    public:
        TBookingManager(const TReservationConfig& config,
                        std::shared_ptr<TLogger> logger,
                        TClock clock = TClock());

        TBookingManager(std::shared_ptr<IReservationStore> store,
                        const TReservationConfig& config,
                        std::shared_ptr<TLogger> logger,
                        TClock clock = TClock());

        TBookingResult Reserve(const TReserveRequest& request, const std::optional<std::string>& clientKey = std::nullopt);
        TBookingResult Confirm(BookingId id);
        TBookingResult Cancel(BookingId id);
        TBookingResult Complete(BookingId id);

        std::optional<TBooking> GetBooking(BookingId id);

        // Dates without an inventory record are omitted.
        std::vector<TInventorySnapshotEntry> Snapshot(RoomTypeId roomType, TDate start, TDate end);
        void SeedInventory(RoomTypeId roomType, TDate start, TDate end, int64_t availableRooms);

        size_t SweepIdempotencyKeys();
        TExpireResult ExpireProvisional(std::chrono::seconds olderThan);
        bool VerifyIntegrity(RoomTypeId roomType);

    private:
        std::shared_ptr<IReservationStore> Store;
        std::shared_ptr<TLogger> Logger;
        std::shared_ptr<TIdempotencyKeyManager> Keys;
        std::shared_ptr<TInventoryLockManager> Inventory;
        std::unique_ptr<TBookingOrchestrator> Orchestrator;
        std::unique_ptr<TBookingStateMachine> StateMachine;
    };

} // namespace NReservation
