#pragma once
#include <memory>
#include <optional>
#include <string>

#include "Errors.hpp"
#include "IdempotencyKeyManager.hpp"
#include "InventoryLockManager.hpp"
#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    // Creates bookings. One transaction per attempt:
    // replay check -> lock -> validate -> decrement -> insert booking -> bind key -> commit.
    class TBookingOrchestrator {
    public:
        TBookingOrchestrator(std::shared_ptr<IReservationStore> store,
                             std::shared_ptr<TIdempotencyKeyManager> keys,
                             std::shared_ptr<TInventoryLockManager> inventory,
                             std::shared_ptr<TLogger> logger);

        TBookingResult Reserve(const TReserveRequest& request, const std::optional<std::string>& clientKey = std::nullopt);

    private:
        TBookingResult ReserveInTransaction(const TReserveRequest& request, const std::string& key);
        TBookingResult ResolveExisting(const TKeyLookup& existing, const TReserveRequest& request, const std::string& key);
        TBookingResult RecoverFromKeyRace(const TReserveRequest& request, const std::string& key);
        TBookingResult Fail(const TErrorResponse& error, const std::string& key);

    private:
        std::shared_ptr<IReservationStore> Store;
        std::shared_ptr<TIdempotencyKeyManager> Keys;
        std::shared_ptr<TInventoryLockManager> Inventory;
        std::shared_ptr<TLogger> Logger;
    };

} // namespace NReservation
