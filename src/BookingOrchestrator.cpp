#include <BookingOrchestrator.hpp>

#include <DateRangeResolver.hpp>

namespace NReservation {

    namespace {

        void ValidateRequest(const TReserveRequest& request) {
            if (request.RoomsBooked == 0) {
                throw TReservationError(EErrorCode::InvalidRequest, "At least one room must be booked");
            }
            if (!(request.StartDate < request.EndDate)) {
                throw TReservationError(EErrorCode::InvalidDateRange, "Booking must span at least one night");
            }
        }

    } // namespace

    TBookingOrchestrator::TBookingOrchestrator(std::shared_ptr<IReservationStore> store,
                                               std::shared_ptr<TIdempotencyKeyManager> keys,
                                               std::shared_ptr<TInventoryLockManager> inventory,
                                               std::shared_ptr<TLogger> logger)
        : Store(std::move(store))
        , Keys(std::move(keys))
        , Inventory(std::move(inventory))
        , Logger(std::move(logger)) {
    }

    TBookingResult TBookingOrchestrator::Reserve(const TReserveRequest& request, const std::optional<std::string>& clientKey) {
        std::string key;
        try {
            ValidateRequest(request);
            key = Keys->AcceptClientSuppliedKey(request, clientKey);
            return ReserveInTransaction(request, key);
        } catch (const TUniqueViolation&) {
            return RecoverFromKeyRace(request, key);
        } catch (const TReservationError& ex) {
            return Fail(ex.GetResponse(), key);
        } catch (const std::exception& ex) {
            return Fail(MakeConcurrencyError(std::string("Failed to create booking, please retry: ") + ex.what(), request.RoomType), key);
        }
    }

    TBookingResult TBookingOrchestrator::ReserveInTransaction(const TReserveRequest& request, const std::string& key) {
        auto tx = Store->Begin();

        if (auto existing = Keys->Lookup(*tx, key)) {
            return ResolveExisting(*existing, request, key);
        }

        auto dates = ResolveDateRange(request.StartDate, request.EndDate);
        auto locked = Inventory->LockForUpdate(*tx, request.RoomType, dates);

        // An identical request may have committed while this one waited for the locks.
        if (auto existing = Keys->Lookup(*tx, key)) {
            return ResolveExisting(*existing, request, key);
        }

        auto validation = TInventoryLockManager::Validate(locked, request.RoomsBooked, dates);
        if (!validation.Ok) {
            throw TReservationError(MakeInsufficientInventoryError(
                request.RoomType, request.RoomsBooked, validation.MinAvailable, validation.InsufficientDates));
        }

        Inventory->Decrement(*tx, locked, request.RoomsBooked);

        TBooking booking;
        booking.User = request.User;
        booking.RoomType = request.RoomType;
        booking.StartDate = request.StartDate;
        booking.EndDate = request.EndDate;
        booking.RoomsBooked = request.RoomsBooked;
        booking.TotalPrice = request.TotalPrice;
        booking.Status = request.Confirmed ? EBookingStatus::Confirmed : EBookingStatus::Provisional;
        booking.CreatedAt = Keys->Now();
        booking.UpdatedAt = booking.CreatedAt;
        booking.Id = tx->InsertBooking(booking);

        Keys->Bind(*tx, key, booking.Id, Keys->MakeMetadata(request));
        tx->Commit();

        Logger->Info("orchestrator", "booking reserved",
                     {{"booking_id", booking.Id},
                      {"room_type_id", booking.RoomType},
                      {"rooms", booking.RoomsBooked},
                      {"nights", dates.size()},
                      {"status", ToString(booking.Status)}});
        return TBookingResult::Success(booking, false, key);
    }

    TBookingResult TBookingOrchestrator::ResolveExisting(const TKeyLookup& existing, const TReserveRequest& request, const std::string& key) {
        if (!existing.Booking || !TIdempotencyKeyManager::MatchesRequest(*existing.Booking, request)) {
            return Fail(MakeIdempotencyConflictError(existing.Record.Booking, key), key);
        }
        Logger->Info("orchestrator", "idempotent replay", {{"booking_id", existing.Booking->Id}, {"idempotency_key", key}});
        return TBookingResult::Success(*existing.Booking, true, key);
    }

    TBookingResult TBookingOrchestrator::RecoverFromKeyRace(const TReserveRequest& request, const std::string& key) {
        try {
            auto tx = Store->Begin();
            auto existing = Keys->Lookup(*tx, key);
            tx->Rollback();
            if (existing) {
                return ResolveExisting(*existing, request, key);
            }
        } catch (const TReservationError& ex) {
            return Fail(ex.GetResponse(), key);
        } catch (const std::exception& ex) {
            return Fail(MakeConcurrencyError(std::string("Failed to resolve idempotency key: ") + ex.what(), request.RoomType), key);
        }
        return Fail(MakeConcurrencyError("Idempotency key was bound concurrently, please retry", request.RoomType), key);
    }

    TBookingResult TBookingOrchestrator::Fail(const TErrorResponse& error, const std::string& key) {
        json fields = {{"error", ToString(error.Code)}};
        if (!key.empty()) {
            fields["idempotency_key"] = key;
        }
        switch (error.Code) {
            case EErrorCode::ConcurrencyAbort:
                Logger->Warn("orchestrator", error.Message, fields);
                break;
            case EErrorCode::IdempotencyConflict:
                Logger->Error("orchestrator", error.Message, fields);
                break;
            default:
                Logger->Info("orchestrator", error.Message, fields);
                break;
        }
        return TBookingResult::Failure(error, key);
    }

} // namespace NReservation
