#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <sqlite3.h>

#include "Logging.hpp"
#include "Store.hpp"

namespace NReservation {

    struct TSqliteCloser {
        void operator()(sqlite3* db) const {
            sqlite3_close(db);
        }
    };
    using TSqliteHandle = std::unique_ptr<sqlite3, TSqliteCloser>;

    class TSqliteStatement {
    public:
        TSqliteStatement(sqlite3* db, const std::string& sql);
        ~TSqliteStatement();

        TSqliteStatement(const TSqliteStatement&) = delete;
        TSqliteStatement& operator=(const TSqliteStatement&) = delete;

        TSqliteStatement& Bind(int index, int64_t value);
        TSqliteStatement& Bind(int index, const std::string& value);

        // true while a row is available
        bool Step();
        void Reset();

        int64_t ColumnInt(int col) const;
        std::string ColumnText(int col) const;

    private:
        sqlite3* Db;
        sqlite3_stmt* Stmt = nullptr;
    };

    // Maps an SQLite result code to the reservation error taxonomy and throws.
    [[noreturn]] void ThrowSqliteError(sqlite3* db, int rc, const std::string& context);

    // SQLite has no SELECT ... FOR UPDATE. Every transaction starts with
    // BEGIN IMMEDIATE, which serializes writers on the whole database file.
    class TSqliteStore: public IReservationStore {
    public:
        TSqliteStore(std::filesystem::path path,
                     std::chrono::milliseconds lockWaitTimeout,
                     std::shared_ptr<TLogger> logger);

        std::unique_ptr<ITransaction> Begin() override;

        std::vector<TInventoryRecord> ReadInventory(RoomTypeId roomType, const std::vector<TDate>& dates) override;
        std::vector<TInventoryRecord> ReadAllInventory(RoomTypeId roomType) override;
        std::optional<TBooking> ReadBooking(BookingId id) override;

    private:
        TSqliteHandle Open() const;
        void CreateSchema();

    private:
        std::filesystem::path Path;
        std::chrono::milliseconds LockWaitTimeout;
        std::shared_ptr<TLogger> Logger;
    };

    class TSqliteTransaction: public ITransaction {
    public:
        TSqliteTransaction(TSqliteHandle db, std::shared_ptr<TLogger> logger);
        ~TSqliteTransaction() override;

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

    private:
        TSqliteHandle Db;
        std::shared_ptr<TLogger> Logger;
        bool Finished = false;
    };

} // namespace NReservation
