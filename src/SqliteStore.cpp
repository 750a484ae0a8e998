#include <SqliteStore.hpp>

#include <algorithm>
#include <stdexcept>

namespace NReservation {

    namespace {

        const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS room_inventory (
    room_type_id    INTEGER NOT NULL,
    date            TEXT    NOT NULL,
    available_rooms INTEGER NOT NULL CHECK (available_rooms >= 0),
    PRIMARY KEY (room_type_id, date)
);
CREATE TABLE IF NOT EXISTS bookings (
    id           INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id      INTEGER NOT NULL,
    room_type_id INTEGER NOT NULL,
    start_date   TEXT    NOT NULL,
    end_date     TEXT    NOT NULL,
    rooms_booked INTEGER NOT NULL CHECK (rooms_booked > 0),
    status       TEXT    NOT NULL,
    total_price  INTEGER NOT NULL,
    created_at   INTEGER NOT NULL,
    updated_at   INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS bookings_status_created_at_idx ON bookings (status, created_at);
CREATE TABLE IF NOT EXISTS idempotency_keys (
    key        TEXT    PRIMARY KEY,
    booking_id INTEGER NOT NULL UNIQUE REFERENCES bookings (id) ON DELETE CASCADE,
    metadata   TEXT,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idempotency_keys_created_at_idx ON idempotency_keys (created_at);
)sql";

        const char* BOOKING_COLUMNS =
            "id, user_id, room_type_id, start_date, end_date, rooms_booked, status, total_price, created_at, updated_at";

        void Exec(sqlite3* db, const std::string& sql) {
            char* err = nullptr;
            int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
            sqlite3_free(err);
            if (rc != SQLITE_OK) {
                ThrowSqliteError(db, rc, sql.substr(0, sql.find_first_of(" \n")));
            }
        }

        TBooking ReadBookingRow(const TSqliteStatement& st) {
            TBooking b;
            b.Id = static_cast<BookingId>(st.ColumnInt(0));
            b.User = static_cast<UserId>(st.ColumnInt(1));
            b.RoomType = static_cast<RoomTypeId>(st.ColumnInt(2));
            b.StartDate = TDate::Parse(st.ColumnText(3));
            b.EndDate = TDate::Parse(st.ColumnText(4));
            b.RoomsBooked = static_cast<uint32_t>(st.ColumnInt(5));
            b.Status = StatusFromString(st.ColumnText(6));
            b.TotalPrice = st.ColumnInt(7);
            b.CreatedAt = FromEpochSeconds(st.ColumnInt(8));
            b.UpdatedAt = FromEpochSeconds(st.ColumnInt(9));
            return b;
        }

    } // namespace

    void ThrowSqliteError(sqlite3* db, int rc, const std::string& context) {
        std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                throw TReservationError(MakeConcurrencyError("Database is busy, please retry (" + message + ")"));
            case SQLITE_CONSTRAINT:
                if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
                    throw TUniqueViolation(message);
                }
                throw std::runtime_error(message);
            default:
                throw std::runtime_error(message);
        }
    }

    TSqliteStatement::TSqliteStatement(sqlite3* db, const std::string& sql)
        : Db(db) {
        int rc = sqlite3_prepare_v2(Db, sql.c_str(), -1, &Stmt, nullptr);
        if (rc != SQLITE_OK) {
            ThrowSqliteError(Db, rc, "prepare");
        }
    }

    TSqliteStatement::~TSqliteStatement() {
        sqlite3_finalize(Stmt);
    }

    TSqliteStatement& TSqliteStatement::Bind(int index, int64_t value) {
        int rc = sqlite3_bind_int64(Stmt, index, value);
        if (rc != SQLITE_OK) {
            ThrowSqliteError(Db, rc, "bind");
        }
        return *this;
    }

    TSqliteStatement& TSqliteStatement::Bind(int index, const std::string& value) {
        int rc = sqlite3_bind_text(Stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            ThrowSqliteError(Db, rc, "bind");
        }
        return *this;
    }

    bool TSqliteStatement::Step() {
        int rc = sqlite3_step(Stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        ThrowSqliteError(Db, rc, "step");
    }

    void TSqliteStatement::Reset() {
        sqlite3_reset(Stmt);
        sqlite3_clear_bindings(Stmt);
    }

    int64_t TSqliteStatement::ColumnInt(int col) const {
        return sqlite3_column_int64(Stmt, col);
    }

    std::string TSqliteStatement::ColumnText(int col) const {
        auto text = sqlite3_column_text(Stmt, col);
        if (!text) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(Stmt, col)));
    }

    TSqliteStore::TSqliteStore(std::filesystem::path path,
                               std::chrono::milliseconds lockWaitTimeout,
                               std::shared_ptr<TLogger> logger)
        : Path(std::move(path))
        , LockWaitTimeout(lockWaitTimeout)
        , Logger(std::move(logger)) {
        CreateSchema();
    }

    TSqliteHandle TSqliteStore::Open() const {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(Path.string().c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        TSqliteHandle db(raw);
        if (rc != SQLITE_OK) {
            ThrowSqliteError(db.get(), rc, "open " + Path.string());
        }
        sqlite3_extended_result_codes(db.get(), 1);
        sqlite3_busy_timeout(db.get(), static_cast<int>(LockWaitTimeout.count()));
        Exec(db.get(), "PRAGMA foreign_keys = ON");
        return db;
    }

    void TSqliteStore::CreateSchema() {
        if (!Path.parent_path().empty()) {
            std::filesystem::create_directories(Path.parent_path());
        }
        auto db = Open();
        Exec(db.get(), "PRAGMA journal_mode = WAL");
        Exec(db.get(), SCHEMA_SQL);
        if (Logger) {
            Logger->Info("sqlite_store", "schema ready", {{"path", Path.string()}});
        }
    }

    std::unique_ptr<ITransaction> TSqliteStore::Begin() {
        auto db = Open();
        Exec(db.get(), "BEGIN IMMEDIATE");
        return std::make_unique<TSqliteTransaction>(std::move(db), Logger);
    }

    std::vector<TInventoryRecord> TSqliteStore::ReadInventory(RoomTypeId roomType, const std::vector<TDate>& dates) {
        auto db = Open();
        TSqliteStatement st(db.get(), "SELECT available_rooms FROM room_inventory WHERE room_type_id = ? AND date = ?");
        std::vector<TInventoryRecord> out;
        for (auto const& date : dates) {
            st.Reset();
            st.Bind(1, static_cast<int64_t>(roomType)).Bind(2, date.ToString());
            if (st.Step()) {
                out.push_back(TInventoryRecord{roomType, date, st.ColumnInt(0)});
            }
        }
        std::sort(out.begin(), out.end(), [](const TInventoryRecord& a, const TInventoryRecord& b) {
            return a.Date < b.Date;
        });
        return out;
    }

    std::vector<TInventoryRecord> TSqliteStore::ReadAllInventory(RoomTypeId roomType) {
        auto db = Open();
        TSqliteStatement st(db.get(), "SELECT date, available_rooms FROM room_inventory WHERE room_type_id = ? ORDER BY date ASC");
        st.Bind(1, static_cast<int64_t>(roomType));
        std::vector<TInventoryRecord> out;
        while (st.Step()) {
            out.push_back(TInventoryRecord{roomType, TDate::Parse(st.ColumnText(0)), st.ColumnInt(1)});
        }
        return out;
    }

    std::optional<TBooking> TSqliteStore::ReadBooking(BookingId id) {
        auto db = Open();
        TSqliteStatement st(db.get(), std::string("SELECT ") + BOOKING_COLUMNS + " FROM bookings WHERE id = ?");
        st.Bind(1, static_cast<int64_t>(id));
        if (!st.Step()) {
            return std::nullopt;
        }
        return ReadBookingRow(st);
    }

    TSqliteTransaction::TSqliteTransaction(TSqliteHandle db, std::shared_ptr<TLogger> logger)
        : Db(std::move(db))
        , Logger(std::move(logger)) {
    }

    TSqliteTransaction::~TSqliteTransaction() {
        Rollback();
    }

    void TSqliteTransaction::EnsureActive() const {
        if (Finished) {
            throw std::logic_error("SQLite transaction already finished");
        }
    }

    std::vector<TInventoryRecord> TSqliteTransaction::SelectInventoryForUpdate(RoomTypeId roomType, const std::vector<TDate>& dates) {
        EnsureActive();
        // The RESERVED lock from BEGIN IMMEDIATE already excludes other writers.
        TSqliteStatement st(Db.get(), "SELECT available_rooms FROM room_inventory WHERE room_type_id = ? AND date = ?");
        std::vector<TInventoryRecord> out;
        for (auto const& date : dates) {
            st.Reset();
            st.Bind(1, static_cast<int64_t>(roomType)).Bind(2, date.ToString());
            if (st.Step()) {
                out.push_back(TInventoryRecord{roomType, date, st.ColumnInt(0)});
            }
        }
        return out;
    }

    void TSqliteTransaction::UpdateAvailableRooms(RoomTypeId roomType, TDate date, int64_t availableRooms) {
        EnsureActive();
        TSqliteStatement st(Db.get(), "UPDATE room_inventory SET available_rooms = ? WHERE room_type_id = ? AND date = ?");
        st.Bind(1, availableRooms).Bind(2, static_cast<int64_t>(roomType)).Bind(3, date.ToString());
        st.Step();
        if (sqlite3_changes(Db.get()) != 1) {
            throw std::runtime_error("No inventory row for room type " + std::to_string(roomType) + " on " + date.ToString());
        }
    }

    void TSqliteTransaction::UpsertInventory(const TInventoryRecord& record) {
        EnsureActive();
        TSqliteStatement st(Db.get(),
                            "INSERT INTO room_inventory (room_type_id, date, available_rooms) VALUES (?, ?, ?) "
                            "ON CONFLICT (room_type_id, date) DO UPDATE SET available_rooms = excluded.available_rooms");
        st.Bind(1, static_cast<int64_t>(record.RoomType)).Bind(2, record.Date.ToString()).Bind(3, record.AvailableRooms);
        st.Step();
    }

    BookingId TSqliteTransaction::InsertBooking(const TBooking& booking) {
        EnsureActive();
        TSqliteStatement st(Db.get(),
                            "INSERT INTO bookings (user_id, room_type_id, start_date, end_date, rooms_booked, status, "
                            "total_price, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        st.Bind(1, static_cast<int64_t>(booking.User))
            .Bind(2, static_cast<int64_t>(booking.RoomType))
            .Bind(3, booking.StartDate.ToString())
            .Bind(4, booking.EndDate.ToString())
            .Bind(5, static_cast<int64_t>(booking.RoomsBooked))
            .Bind(6, ToString(booking.Status))
            .Bind(7, booking.TotalPrice)
            .Bind(8, ToEpochSeconds(booking.CreatedAt))
            .Bind(9, ToEpochSeconds(booking.UpdatedAt));
        st.Step();
        return static_cast<BookingId>(sqlite3_last_insert_rowid(Db.get()));
    }

    std::optional<TBooking> TSqliteTransaction::FindBooking(BookingId id) {
        EnsureActive();
        TSqliteStatement st(Db.get(), std::string("SELECT ") + BOOKING_COLUMNS + " FROM bookings WHERE id = ?");
        st.Bind(1, static_cast<int64_t>(id));
        if (!st.Step()) {
            return std::nullopt;
        }
        return ReadBookingRow(st);
    }

    std::optional<TBooking> TSqliteTransaction::SelectBookingForUpdate(BookingId id) {
        return FindBooking(id);
    }

    void TSqliteTransaction::UpdateBooking(const TBooking& booking) {
        EnsureActive();
        TSqliteStatement st(Db.get(),
                            "UPDATE bookings SET status = ?, rooms_booked = ?, total_price = ?, updated_at = ? WHERE id = ?");
        st.Bind(1, ToString(booking.Status))
            .Bind(2, static_cast<int64_t>(booking.RoomsBooked))
            .Bind(3, booking.TotalPrice)
            .Bind(4, ToEpochSeconds(booking.UpdatedAt))
            .Bind(5, static_cast<int64_t>(booking.Id));
        st.Step();
        if (sqlite3_changes(Db.get()) != 1) {
            throw std::runtime_error("No booking with id " + std::to_string(booking.Id));
        }
    }

    std::vector<BookingId> TSqliteTransaction::FindBookingIds(EBookingStatus status, TTimePoint createdBefore) {
        EnsureActive();
        TSqliteStatement st(Db.get(), "SELECT id FROM bookings WHERE status = ? AND created_at < ? ORDER BY id ASC");
        st.Bind(1, ToString(status)).Bind(2, ToEpochSeconds(createdBefore));
        std::vector<BookingId> out;
        while (st.Step()) {
            out.push_back(static_cast<BookingId>(st.ColumnInt(0)));
        }
        return out;
    }

    std::optional<TIdempotencyRecord> TSqliteTransaction::FindIdempotencyKey(const std::string& key) {
        EnsureActive();
        TSqliteStatement st(Db.get(), "SELECT key, booking_id, metadata, created_at FROM idempotency_keys WHERE key = ?");
        st.Bind(1, key);
        if (!st.Step()) {
            return std::nullopt;
        }
        TIdempotencyRecord r;
        r.Key = st.ColumnText(0);
        r.Booking = static_cast<BookingId>(st.ColumnInt(1));
        r.Metadata = st.ColumnText(2);
        r.CreatedAt = FromEpochSeconds(st.ColumnInt(3));
        return r;
    }

    void TSqliteTransaction::InsertIdempotencyKey(const TIdempotencyRecord& record) {
        EnsureActive();
        TSqliteStatement st(Db.get(), "INSERT INTO idempotency_keys (key, booking_id, metadata, created_at) VALUES (?, ?, ?, ?)");
        st.Bind(1, record.Key)
            .Bind(2, static_cast<int64_t>(record.Booking))
            .Bind(3, record.Metadata)
            .Bind(4, ToEpochSeconds(record.CreatedAt));
        st.Step();
    }

    size_t TSqliteTransaction::DeleteIdempotencyKeysBefore(TTimePoint cutoff) {
        EnsureActive();
        TSqliteStatement st(Db.get(), "DELETE FROM idempotency_keys WHERE created_at < ?");
        st.Bind(1, ToEpochSeconds(cutoff));
        st.Step();
        return static_cast<size_t>(sqlite3_changes(Db.get()));
    }

    void TSqliteTransaction::Commit() {
        EnsureActive();
        Exec(Db.get(), "COMMIT");
        Finished = true;
    }

    void TSqliteTransaction::Rollback() {
        if (Finished) {
            return;
        }
        Finished = true;
        int rc = sqlite3_exec(Db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK && Logger) {
            // Closing the connection still discards the open transaction.
            Logger->Warn("sqlite_store", "rollback failed", {{"reason", sqlite3_errmsg(Db.get())}});
        }
    }

} // namespace NReservation
