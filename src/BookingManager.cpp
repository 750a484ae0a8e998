#include <BookingManager.hpp>

#include <DateRangeResolver.hpp>
#include <FileJsonStorage.hpp>
#include <MemoryStore.hpp>
#include <SqliteStore.hpp>
#include <Storage.hpp>

namespace NReservation {

    std::shared_ptr<IReservationStore> MakeStore(const TReservationConfig& config, std::shared_ptr<TLogger> logger) {
        if (config.Store.Backend == EStoreBackend::Sqlite) {
            return std::make_shared<TSqliteStore>(config.Store.SqlitePath, config.LockWaitTimeout, std::move(logger));
        }
        std::shared_ptr<IStorage> storage;
        if (config.Store.SnapshotPath.empty() || config.Store.JournalPath.empty()) {
            storage = std::make_shared<TMemoryStorage>();
        } else {
            storage = std::make_shared<TFileJsonStorage>(config.Store.SnapshotPath, config.Store.JournalPath);
        }
        return std::make_shared<TMemoryStore>(storage, config.LockWaitTimeout, std::move(logger));
    }

    TBookingManager::TBookingManager(const TReservationConfig& config,
                                     std::shared_ptr<TLogger> logger,
                                     TClock clock)
        : TBookingManager(MakeStore(config, logger), config, logger, std::move(clock)) {
    }

    TBookingManager::TBookingManager(std::shared_ptr<IReservationStore> store,
                                     const TReservationConfig& config,
                                     std::shared_ptr<TLogger> logger,
                                     TClock clock)
        : Store(std::move(store))
        , Logger(logger ? std::move(logger) : std::make_shared<TLogger>()) {
        if (!Store) {
            throw std::invalid_argument("TBookingManager requires a store");
        }
        Keys = std::make_shared<TIdempotencyKeyManager>(config.IdempotencyRetention, std::move(clock), Logger);
        Inventory = std::make_shared<TInventoryLockManager>(Logger);
        Orchestrator = std::make_unique<TBookingOrchestrator>(Store, Keys, Inventory, Logger);
        StateMachine = std::make_unique<TBookingStateMachine>(Store, Inventory, Logger);
    }

    TBookingResult TBookingManager::Reserve(const TReserveRequest& request, const std::optional<std::string>& clientKey) {
        return Orchestrator->Reserve(request, clientKey);
    }

    TBookingResult TBookingManager::Confirm(BookingId id) {
        return StateMachine->Confirm(id, Keys->Now());
    }

    TBookingResult TBookingManager::Cancel(BookingId id) {
        return StateMachine->Cancel(id, Keys->Now());
    }

    TBookingResult TBookingManager::Complete(BookingId id) {
        return StateMachine->Complete(id, Keys->Now());
    }

    std::optional<TBooking> TBookingManager::GetBooking(BookingId id) {
        return Store->ReadBooking(id);
    }

    std::vector<TInventorySnapshotEntry> TBookingManager::Snapshot(RoomTypeId roomType, TDate start, TDate end) {
        std::vector<TInventorySnapshotEntry> out;
        for (auto const& [date, available] : TInventoryLockManager::Snapshot(*Store, roomType, ResolveDateRange(start, end))) {
            out.push_back(TInventorySnapshotEntry{date, available});
        }
        return out;
    }

    void TBookingManager::SeedInventory(RoomTypeId roomType, TDate start, TDate end, int64_t availableRooms) {
        auto dates = ResolveDateRange(start, end);
        auto tx = Store->Begin();
        Inventory->Seed(*tx, roomType, dates, availableRooms);
        tx->Commit();
        Logger->Info("manager", "inventory seeded",
                     {{"room_type_id", roomType},
                      {"start", start.ToString()},
                      {"end", end.ToString()},
                      {"available_rooms", availableRooms}});
    }

    size_t TBookingManager::SweepIdempotencyKeys() {
        return Keys->SweepExpired(*Store, Keys->Now());
    }

    TExpireResult TBookingManager::ExpireProvisional(std::chrono::seconds olderThan) {
        auto now = Keys->Now();
        return StateMachine->ExpireProvisional(now - olderThan, now);
    }

    bool TBookingManager::VerifyIntegrity(RoomTypeId roomType) {
        bool ok = TInventoryLockManager::VerifyIntegrity(*Store, roomType);
        if (!ok) {
            Logger->Error("manager", "negative inventory detected", {{"room_type_id", roomType}});
        }
        return ok;
    }

} // namespace NReservation
