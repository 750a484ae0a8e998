#include <MemoryStore.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace NReservation {

    void TRowLockTable::Acquire(TransactionId tx, const std::string& resource) {
        std::unique_lock lk(Mutex_);
        auto it = Owners.find(resource);
        if (it != Owners.end() && it->second == tx) {
            return;
        }
        bool free = Released.wait_for(lk, WaitTimeout, [&] {
            return Owners.find(resource) == Owners.end();
        });
        if (!free) {
            throw TReservationError(MakeConcurrencyError("Lock wait timeout exceeded on " + resource));
        }
        Owners.emplace(resource, tx);
        Held[tx].push_back(resource);
    }

    void TRowLockTable::ReleaseAll(TransactionId tx) {
        {
            std::lock_guard lk(Mutex_);
            auto it = Held.find(tx);
            if (it == Held.end()) {
                return;
            }
            for (auto const& resource : it->second) {
                Owners.erase(resource);
            }
            Held.erase(it);
        }
        Released.notify_all();
    }

    bool TRowLockTable::IsHeldBy(TransactionId tx, const std::string& resource) {
        std::lock_guard lk(Mutex_);
        auto it = Owners.find(resource);
        return it != Owners.end() && it->second == tx;
    }

    TMemoryStore::TMemoryStore(std::shared_ptr<IStorage> storage,
                               std::chrono::milliseconds lockWaitTimeout,
                               std::shared_ptr<TLogger> logger)
        : Storage(std::move(storage))
        , Logger(std::move(logger))
        , Locks(lockWaitTimeout) {
        Reload();
    }

    std::string TMemoryStore::InventoryResource(RoomTypeId roomType, TDate date) {
        return "room_inventory/" + std::to_string(roomType) + "/" + date.ToString();
    }

    std::string TMemoryStore::BookingResource(BookingId id) {
        return "bookings/" + std::to_string(id);
    }

    std::string TMemoryStore::KeyResource(const std::string& key) {
        return "idempotency_keys/" + key;
    }

    void TMemoryStore::Reload() {
        std::lock_guard lk(Mutex_);
        Inventory.clear();
        Bookings.clear();
        Keys.clear();
        LastCommit = 0;
        if (!Storage) {
            return;
        }
        json snap = Storage->LoadState();
        if (snap.is_object()) {
            if (snap.contains("room_inventory") && snap["room_inventory"].is_array()) {
                for (auto const& jr : snap["room_inventory"]) {
                    TInventoryRecord r;
                    FromJsonInternal(jr, r);
                    Inventory[{r.RoomType, r.Date.Days}] = r.AvailableRooms;
                }
            }
            if (snap.contains("bookings") && snap["bookings"].is_array()) {
                for (auto const& jb : snap["bookings"]) {
                    TBooking b;
                    FromJsonInternal(jb, b);
                    Bookings[b.Id] = b;
                }
            }
            if (snap.contains("idempotency_keys") && snap["idempotency_keys"].is_array()) {
                for (auto const& jk : snap["idempotency_keys"]) {
                    TIdempotencyRecord k;
                    FromJsonInternal(jk, k);
                    Keys[k.Key] = k;
                }
            }
            NextBookingId = std::max(NextBookingId, snap.value("next_booking_id", BookingId{1}));
            LastCommit = snap.value("last_commit", uint64_t{0});
        }

        auto journal = Storage->LoadJournal();
        std::set<uint64_t> aborted;
        for (auto const& entry : journal) {
            if (entry.value("op", std::string()) == "abort") {
                aborted.insert(entry.value("seq", uint64_t{0}));
            }
        }
        size_t replayed = 0;
        uint64_t highest = LastCommit;
        for (auto const& entry : journal) {
            uint64_t seq = entry.value("seq", uint64_t{0});
            highest = std::max(highest, seq);
            if (entry.value("op", std::string()) != "commit" || seq <= LastCommit || aborted.count(seq)) {
                continue;
            }
            ApplyLocked(WriteSetFromJournal(entry));
            ++replayed;
        }
        LastCommit = highest;

        for (auto const& kv : Bookings) {
            NextBookingId = std::max(NextBookingId, kv.first + 1);
        }
        if (Logger) {
            Logger->Debug("memory_store", "state reloaded",
                          {{"inventory_rows", Inventory.size()},
                           {"bookings", Bookings.size()},
                           {"keys", Keys.size()},
                           {"replayed_commits", replayed}});
        }
    }

    json TMemoryStore::SnapshotLocked() const {
        json snap = json::object();
        snap["next_booking_id"] = NextBookingId;
        snap["last_commit"] = LastCommit;
        snap["room_inventory"] = json::array();
        for (auto const& [key, available] : Inventory) {
            json j;
            ToJSON(j, TInventoryRecord{key.first, TDate{key.second}, available});
            snap["room_inventory"].push_back(j);
        }
        snap["bookings"] = json::array();
        for (auto const& kv : Bookings) {
            json j;
            ToJSON(j, kv.second);
            snap["bookings"].push_back(j);
        }
        snap["idempotency_keys"] = json::array();
        for (auto const& kv : Keys) {
            json j;
            ToJSON(j, kv.second);
            snap["idempotency_keys"].push_back(j);
        }
        return snap;
    }

    json TMemoryStore::JournalEntry(uint64_t seq, TransactionId tx, const TWriteSet& writes) const {
        json je = {{"op", "commit"}, {"seq", seq}, {"tx", tx}};
        je["room_inventory"] = json::array();
        for (auto const& [key, available] : writes.Inventory) {
            json j;
            ToJSON(j, TInventoryRecord{key.first, TDate{key.second}, available});
            je["room_inventory"].push_back(j);
        }
        je["bookings"] = json::array();
        for (auto const& kv : writes.Bookings) {
            json j;
            ToJSON(j, kv.second);
            je["bookings"].push_back(j);
        }
        je["keys_inserted"] = json::array();
        for (auto const& kv : writes.KeyInserts) {
            json j;
            ToJSON(j, kv.second);
            je["keys_inserted"].push_back(j);
        }
        je["keys_deleted"] = json::array();
        for (auto const& key : writes.KeyDeletes) {
            je["keys_deleted"].push_back(key);
        }
        return je;
    }

    TMemoryStore::TWriteSet TMemoryStore::WriteSetFromJournal(const json& entry) {
        TWriteSet writes;
        for (auto const& jr : entry.value("room_inventory", json::array())) {
            TInventoryRecord r;
            FromJsonInternal(jr, r);
            writes.Inventory[{r.RoomType, r.Date.Days}] = r.AvailableRooms;
        }
        for (auto const& jb : entry.value("bookings", json::array())) {
            TBooking b;
            FromJsonInternal(jb, b);
            writes.Bookings[b.Id] = b;
        }
        for (auto const& jk : entry.value("keys_inserted", json::array())) {
            TIdempotencyRecord k;
            FromJsonInternal(jk, k);
            writes.KeyInserts[k.Key] = k;
        }
        for (auto const& key : entry.value("keys_deleted", json::array())) {
            writes.KeyDeletes.insert(key.get<std::string>());
        }
        return writes;
    }

    TMemoryStore::TUndoSet TMemoryStore::ApplyLocked(const TWriteSet& writes) {
        TUndoSet undo;
        for (auto const& [key, available] : writes.Inventory) {
            auto it = Inventory.find(key);
            undo.Inventory[key] = it == Inventory.end() ? std::nullopt : std::optional<int64_t>(it->second);
            Inventory[key] = available;
        }
        for (auto const& [id, booking] : writes.Bookings) {
            auto it = Bookings.find(id);
            undo.Bookings[id] = it == Bookings.end() ? std::nullopt : std::optional<TBooking>(it->second);
            Bookings[id] = booking;
        }
        for (auto const& key : writes.KeyDeletes) {
            auto it = Keys.find(key);
            if (it != Keys.end()) {
                undo.Keys[key] = it->second;
                Keys.erase(it);
            }
        }
        for (auto const& [key, record] : writes.KeyInserts) {
            if (!undo.Keys.count(key)) {
                auto it = Keys.find(key);
                undo.Keys[key] = it == Keys.end() ? std::nullopt : std::optional<TIdempotencyRecord>(it->second);
            }
            Keys[key] = record;
        }
        return undo;
    }

    void TMemoryStore::RevertLocked(const TUndoSet& undo) {
        for (auto const& [key, old] : undo.Inventory) {
            if (old) {
                Inventory[key] = *old;
            } else {
                Inventory.erase(key);
            }
        }
        for (auto const& [id, old] : undo.Bookings) {
            if (old) {
                Bookings[id] = *old;
            } else {
                Bookings.erase(id);
            }
        }
        for (auto const& [key, old] : undo.Keys) {
            if (old) {
                Keys[key] = *old;
            } else {
                Keys.erase(key);
            }
        }
    }

    void TMemoryStore::Apply(TransactionId tx, const TWriteSet& writes) {
        std::lock_guard lk(Mutex_);
        uint64_t seq = ++LastCommit;
        auto undo = ApplyLocked(writes);
        if (!Storage) {
            return;
        }

        try {
            Storage->AppendJournal(JournalEntry(seq, tx, writes));
        } catch (const std::exception& ex) {
            RevertLocked(undo);
            if (Logger) {
                Logger->Error("memory_store", "journal append failed", {{"seq", seq}, {"tx", tx}, {"reason", ex.what()}});
            }
            throw;
        }

        try {
            Storage->SaveState(SnapshotLocked());
        } catch (const std::exception& ex) {
            RevertLocked(undo);
            if (Logger) {
                Logger->Error("memory_store", "snapshot write failed, commit aborted", {{"seq", seq}, {"tx", tx}, {"reason", ex.what()}});
            }
            // Reload must not replay the journaled commit.
            Storage->AppendJournal(json{{"op", "abort"}, {"seq", seq}, {"tx", tx}});
            throw;
        }
    }

    std::unique_ptr<ITransaction> TMemoryStore::Begin() {
        TransactionId id = 0;
        {
            std::lock_guard lk(Mutex_);
            id = NextTransactionId++;
        }
        return std::make_unique<TMemoryTransaction>(*this, id);
    }

    std::vector<TInventoryRecord> TMemoryStore::ReadInventory(RoomTypeId roomType, const std::vector<TDate>& dates) {
        std::lock_guard lk(Mutex_);
        std::vector<TInventoryRecord> out;
        for (auto const& date : dates) {
            auto it = Inventory.find({roomType, date.Days});
            if (it != Inventory.end()) {
                out.push_back(TInventoryRecord{roomType, date, it->second});
            }
        }
        std::sort(out.begin(), out.end(), [](const TInventoryRecord& a, const TInventoryRecord& b) {
            return a.Date < b.Date;
        });
        return out;
    }

    std::vector<TInventoryRecord> TMemoryStore::ReadAllInventory(RoomTypeId roomType) {
        std::lock_guard lk(Mutex_);
        std::vector<TInventoryRecord> out;
        auto it = Inventory.lower_bound({roomType, std::numeric_limits<int64_t>::min()});
        for (; it != Inventory.end() && it->first.first == roomType; ++it) {
            out.push_back(TInventoryRecord{roomType, TDate{it->first.second}, it->second});
        }
        return out;
    }

    std::optional<TBooking> TMemoryStore::ReadBooking(BookingId id) {
        std::lock_guard lk(Mutex_);
        auto it = Bookings.find(id);
        if (it == Bookings.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    TMemoryTransaction::~TMemoryTransaction() {
        Rollback();
    }

    void TMemoryTransaction::EnsureActive() const {
        if (Finished) {
            throw std::logic_error("Transaction " + std::to_string(Id) + " already finished");
        }
    }

    std::optional<int64_t> TMemoryTransaction::ReadInventoryRow(RoomTypeId roomType, TDate date) {
        TMemoryStore::TInventoryKey key{roomType, date.Days};
        auto wit = Writes.Inventory.find(key);
        if (wit != Writes.Inventory.end()) {
            return wit->second;
        }
        std::lock_guard lk(Store.Mutex_);
        auto it = Store.Inventory.find(key);
        if (it == Store.Inventory.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<TInventoryRecord> TMemoryTransaction::SelectInventoryForUpdate(RoomTypeId roomType, const std::vector<TDate>& dates) {
        EnsureActive();
        std::vector<TInventoryRecord> out;
        for (auto const& date : dates) {
            Store.Locks.Acquire(Id, TMemoryStore::InventoryResource(roomType, date));
            auto available = ReadInventoryRow(roomType, date);
            if (available) {
                out.push_back(TInventoryRecord{roomType, date, *available});
            }
        }
        return out;
    }

    void TMemoryTransaction::UpdateAvailableRooms(RoomTypeId roomType, TDate date, int64_t availableRooms) {
        EnsureActive();
        Store.Locks.Acquire(Id, TMemoryStore::InventoryResource(roomType, date));
        if (!ReadInventoryRow(roomType, date)) {
            throw std::runtime_error("No inventory row for room type " + std::to_string(roomType) + " on " + date.ToString());
        }
        if (availableRooms < 0) {
            throw std::runtime_error("CHECK constraint failed: available_rooms >= 0");
        }
        Writes.Inventory[{roomType, date.Days}] = availableRooms;
    }

    void TMemoryTransaction::UpsertInventory(const TInventoryRecord& record) {
        EnsureActive();
        if (record.AvailableRooms < 0) {
            throw std::runtime_error("CHECK constraint failed: available_rooms >= 0");
        }
        Store.Locks.Acquire(Id, TMemoryStore::InventoryResource(record.RoomType, record.Date));
        Writes.Inventory[{record.RoomType, record.Date.Days}] = record.AvailableRooms;
    }

    BookingId TMemoryTransaction::InsertBooking(const TBooking& booking) {
        EnsureActive();
        TBooking nb = booking;
        {
            std::lock_guard lk(Store.Mutex_);
            nb.Id = Store.NextBookingId++;
        }
        Store.Locks.Acquire(Id, TMemoryStore::BookingResource(nb.Id));
        Writes.Bookings[nb.Id] = nb;
        return nb.Id;
    }

    std::optional<TBooking> TMemoryTransaction::FindBooking(BookingId id) {
        EnsureActive();
        auto wit = Writes.Bookings.find(id);
        if (wit != Writes.Bookings.end()) {
            return wit->second;
        }
        return Store.ReadBooking(id);
    }

    std::optional<TBooking> TMemoryTransaction::SelectBookingForUpdate(BookingId id) {
        EnsureActive();
        Store.Locks.Acquire(Id, TMemoryStore::BookingResource(id));
        return FindBooking(id);
    }

    void TMemoryTransaction::UpdateBooking(const TBooking& booking) {
        EnsureActive();
        Store.Locks.Acquire(Id, TMemoryStore::BookingResource(booking.Id));
        if (!FindBooking(booking.Id)) {
            throw std::runtime_error("No booking with id " + std::to_string(booking.Id));
        }
        Writes.Bookings[booking.Id] = booking;
    }

    std::vector<BookingId> TMemoryTransaction::FindBookingIds(EBookingStatus status, TTimePoint createdBefore) {
        EnsureActive();
        std::map<BookingId, TBooking> merged;
        {
            std::lock_guard lk(Store.Mutex_);
            merged = Store.Bookings;
        }
        for (auto const& kv : Writes.Bookings) {
            merged[kv.first] = kv.second;
        }
        std::vector<BookingId> out;
        for (auto const& [id, b] : merged) {
            if (b.Status == status && b.CreatedAt < createdBefore) {
                out.push_back(id);
            }
        }
        return out;
    }

    std::optional<TIdempotencyRecord> TMemoryTransaction::FindIdempotencyKey(const std::string& key) {
        EnsureActive();
        if (Writes.KeyDeletes.count(key)) {
            return std::nullopt;
        }
        auto wit = Writes.KeyInserts.find(key);
        if (wit != Writes.KeyInserts.end()) {
            return wit->second;
        }
        std::lock_guard lk(Store.Mutex_);
        auto it = Store.Keys.find(key);
        if (it == Store.Keys.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void TMemoryTransaction::InsertIdempotencyKey(const TIdempotencyRecord& record) {
        EnsureActive();
        // Blocks behind a concurrent insert of the same key until it commits or rolls back.
        Store.Locks.Acquire(Id, TMemoryStore::KeyResource(record.Key));
        if (FindIdempotencyKey(record.Key)) {
            throw TUniqueViolation("UNIQUE constraint failed: idempotency_keys.key");
        }
        for (auto const& kv : Writes.KeyInserts) {
            if (kv.second.Booking == record.Booking) {
                throw TUniqueViolation("UNIQUE constraint failed: idempotency_keys.booking_id");
            }
        }
        {
            std::lock_guard lk(Store.Mutex_);
            for (auto const& kv : Store.Keys) {
                if (kv.second.Booking == record.Booking && !Writes.KeyDeletes.count(kv.first)) {
                    throw TUniqueViolation("UNIQUE constraint failed: idempotency_keys.booking_id");
                }
            }
        }
        Writes.KeyInserts[record.Key] = record;
    }

    size_t TMemoryTransaction::DeleteIdempotencyKeysBefore(TTimePoint cutoff) {
        EnsureActive();
        std::vector<std::string> candidates;
        {
            std::lock_guard lk(Store.Mutex_);
            for (auto const& kv : Store.Keys) {
                if (kv.second.CreatedAt < cutoff) {
                    candidates.push_back(kv.first);
                }
            }
        }
        size_t removed = 0;
        for (auto const& key : candidates) {
            Store.Locks.Acquire(Id, TMemoryStore::KeyResource(key));
            auto current = FindIdempotencyKey(key);
            if (current && current->CreatedAt < cutoff) {
                Writes.KeyInserts.erase(key);
                Writes.KeyDeletes.insert(key);
                ++removed;
            }
        }
        return removed;
    }

    void TMemoryTransaction::Commit() {
        EnsureActive();
        if (!Writes.Empty()) {
            Store.Apply(Id, Writes);
        }
        Finished = true;
        Store.Locks.ReleaseAll(Id);
    }

    void TMemoryTransaction::Rollback() {
        if (Finished) {
            return;
        }
        Writes = TMemoryStore::TWriteSet{};
        Finished = true;
        Store.Locks.ReleaseAll(Id);
    }

} // namespace NReservation
