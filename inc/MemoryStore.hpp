#pragma once
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Logging.hpp"
#include "Storage.hpp"
#include "Store.hpp"

namespace NReservation {

    using TransactionId = uint64_t;

    // Exclusive locks on named rows, held until the owning transaction ends.
    class TRowLockTable {
    public:
        explicit TRowLockTable(std::chrono::milliseconds waitTimeout)
            : WaitTimeout(waitTimeout) {
        }

        // Re-entrant for the owner. Throws TReservationError(ConcurrencyAbort) on timeout.
        void Acquire(TransactionId tx, const std::string& resource);
        void ReleaseAll(TransactionId tx);
        bool IsHeldBy(TransactionId tx, const std::string& resource);

    private:
        std::chrono::milliseconds WaitTimeout;
        std::mutex Mutex_;
        std::condition_variable Released;
        std::unordered_map<std::string, TransactionId> Owners;
        std::unordered_map<TransactionId, std::vector<std::string>> Held;
    };

    class TMemoryTransaction;

    // Relational store kept in process memory with row-level locking.
    // Each commit is appended to the IStorage journal first, then the snapshot
    // is rewritten. Reload replays journaled commits newer than the snapshot.
    class TMemoryStore: public IReservationStore {
    public:
        TMemoryStore(std::shared_ptr<IStorage> storage,
                     std::chrono::milliseconds lockWaitTimeout,
                     std::shared_ptr<TLogger> logger);

        std::unique_ptr<ITransaction> Begin() override;

        std::vector<TInventoryRecord> ReadInventory(RoomTypeId roomType, const std::vector<TDate>& dates) override;
        std::vector<TInventoryRecord> ReadAllInventory(RoomTypeId roomType) override;
        std::optional<TBooking> ReadBooking(BookingId id) override;

    private:
        friend class TMemoryTransaction;

        using TInventoryKey = std::pair<RoomTypeId, int64_t>;

        struct TWriteSet {
            std::map<TInventoryKey, int64_t> Inventory;
            std::map<BookingId, TBooking> Bookings;
            std::map<std::string, TIdempotencyRecord> KeyInserts;
            std::set<std::string> KeyDeletes;

            bool Empty() const {
                return Inventory.empty() && Bookings.empty() && KeyInserts.empty() && KeyDeletes.empty();
            }
        };

        // Previous values of every row a write set touched, std::nullopt for rows it created.
        struct TUndoSet {
            std::map<TInventoryKey, std::optional<int64_t>> Inventory;
            std::map<BookingId, std::optional<TBooking>> Bookings;
            std::map<std::string, std::optional<TIdempotencyRecord>> Keys;
        };

        void Reload();
        void Apply(TransactionId tx, const TWriteSet& writes);
        TUndoSet ApplyLocked(const TWriteSet& writes);
        void RevertLocked(const TUndoSet& undo);
        nlohmann::json SnapshotLocked() const;
        nlohmann::json JournalEntry(uint64_t seq, TransactionId tx, const TWriteSet& writes) const;
        static TWriteSet WriteSetFromJournal(const nlohmann::json& entry);

        static std::string InventoryResource(RoomTypeId roomType, TDate date);
        static std::string BookingResource(BookingId id);
        static std::string KeyResource(const std::string& key);

    private:
        std::shared_ptr<IStorage> Storage;
        std::shared_ptr<TLogger> Logger;
        TRowLockTable Locks;

        std::mutex Mutex_;
        TransactionId NextTransactionId = 1;
        BookingId NextBookingId = 1;
        // Sequence of the last commit handed to the journal.
        uint64_t LastCommit = 0;
        std::map<TInventoryKey, int64_t> Inventory;
        std::map<BookingId, TBooking> Bookings;
        std::map<std::string, TIdempotencyRecord> Keys;
    };

    class TMemoryTransaction: public ITransaction {
    public:
        TMemoryTransaction(TMemoryStore& store, TransactionId id)
            : Store(store)
            , Id(id) {
        }
        ~TMemoryTransaction() override;

        std::vector<TInventoryRecord> SelectInventoryForUpdate(RoomTypeId roomType, const std::vector<TDate>& dates) override;
        void UpdateAvailableRooms(RoomTypeId roomType, TDate date, int64_t availableRooms) override;
        void UpsertInventory(const TInventoryRecord& record) override;

        BookingId InsertBooking(const TBooking& booking) override;
        std::optional<TBooking> FindBooking(BookingId id) override;
        std::optional<TBooking> SelectBookingForUpdate(BookingId id) override;
        void UpdateBooking(const TBooking& booking) override;
        std::vector<BookingId> FindBookingIds(EBookingStatus status, TTimePoint createdBefore) override;

        std::optional<TIdempotencyRecord> FindIdempotencyKey(const std::string& key) override;
        void InsertIdempotencyKey(const TIdempotencyRecord& record) override;
        size_t DeleteIdempotencyKeysBefore(TTimePoint cutoff) override;

        void Commit() override;
        void Rollback() override;

    private:
        void EnsureActive() const;
        std::optional<int64_t> ReadInventoryRow(RoomTypeId roomType, TDate date);

    private:
        TMemoryStore& Store;
        TransactionId Id;
        TMemoryStore::TWriteSet Writes;
        bool Finished = false;
    };

} // namespace NReservation
