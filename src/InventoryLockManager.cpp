#include <InventoryLockManager.hpp>

#include <algorithm>
#include <limits>

#include <Errors.hpp>

namespace NReservation {

    namespace {

        void SortUnique(std::vector<TDate>& dates) {
            std::sort(dates.begin(), dates.end());
            dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
        }

    } // namespace

    std::vector<TInventoryRecord> TInventoryLockManager::LockForUpdate(ITransaction& tx, RoomTypeId roomType, std::vector<TDate> dates) const {
        // Ascending order at every call site rules out lock cycles between overlapping ranges.
        SortUnique(dates);
        auto locked = tx.SelectInventoryForUpdate(roomType, dates);
        if (Logger) {
            Logger->Debug("inventory", "rows locked",
                          {{"room_type_id", roomType}, {"requested", dates.size()}, {"found", locked.size()}});
        }
        return locked;
    }

    TInventoryValidation TInventoryLockManager::Validate(const std::vector<TInventoryRecord>& locked,
                                                         uint32_t requestedRooms,
                                                         const std::vector<TDate>& requestedDates) {
        std::map<TDate, int64_t> byDate;
        for (auto const& r : locked) {
            byDate[r.Date] = r.AvailableRooms;
        }

        TInventoryValidation out;
        int64_t minAvailable = std::numeric_limits<int64_t>::max();
        for (auto const& date : requestedDates) {
            auto it = byDate.find(date);
            if (it == byDate.end()) {
                out.InsufficientDates.push_back(date);
                minAvailable = 0;
            } else if (it->second < static_cast<int64_t>(requestedRooms)) {
                out.InsufficientDates.push_back(date);
                minAvailable = std::min(minAvailable, it->second);
            }
        }
        out.Ok = out.InsufficientDates.empty();
        out.MinAvailable = out.Ok ? 0 : minAvailable;
        return out;
    }

    void TInventoryLockManager::Decrement(ITransaction& tx, const std::vector<TInventoryRecord>& locked, uint32_t roomsBooked) const {
        for (auto const& r : locked) {
            int64_t next = r.AvailableRooms - static_cast<int64_t>(roomsBooked);
            if (next < 0) {
                throw TReservationError(MakeConcurrencyError(
                    "Inventory underflow on " + r.Date.ToString() + ", locked record was not validated", r.RoomType));
            }
            tx.UpdateAvailableRooms(r.RoomType, r.Date, next);
        }
    }

    void TInventoryLockManager::Increment(ITransaction& tx, RoomTypeId roomType, const std::vector<TDate>& dates, uint32_t roomsBooked) const {
        auto locked = LockForUpdate(tx, roomType, dates);
        if (locked.size() != dates.size() && Logger) {
            Logger->Warn("inventory", "restoring rooms on dates without inventory rows",
                         {{"room_type_id", roomType}, {"requested", dates.size()}, {"found", locked.size()}});
        }
        for (auto const& r : locked) {
            tx.UpdateAvailableRooms(r.RoomType, r.Date, r.AvailableRooms + static_cast<int64_t>(roomsBooked));
        }
    }

    void TInventoryLockManager::Seed(ITransaction& tx, RoomTypeId roomType, const std::vector<TDate>& dates, int64_t availableRooms) const {
        if (availableRooms < 0) {
            throw TReservationError(EErrorCode::InvalidRequest, "Available rooms must not be negative");
        }
        auto sorted = dates;
        SortUnique(sorted);
        for (auto const& date : sorted) {
            tx.UpsertInventory(TInventoryRecord{roomType, date, availableRooms});
        }
    }

    std::map<TDate, int64_t> TInventoryLockManager::Snapshot(IReservationStore& store, RoomTypeId roomType, const std::vector<TDate>& dates) {
        std::map<TDate, int64_t> out;
        for (auto const& r : store.ReadInventory(roomType, dates)) {
            out[r.Date] = r.AvailableRooms;
        }
        return out;
    }

    bool TInventoryLockManager::VerifyIntegrity(IReservationStore& store, RoomTypeId roomType) {
        auto rows = store.ReadAllInventory(roomType);
        return std::none_of(rows.begin(), rows.end(), [](const TInventoryRecord& r) {
            return r.AvailableRooms < 0;
        });
    }

} // namespace NReservation
