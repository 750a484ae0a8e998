#include <BookingStateMachine.hpp>

#include <DateRangeResolver.hpp>

namespace NReservation {

    TBookingStateMachine::TBookingStateMachine(std::shared_ptr<IReservationStore> store,
                                               std::shared_ptr<TInventoryLockManager> inventory,
                                               std::shared_ptr<TLogger> logger)
        : Store(std::move(store))
        , Inventory(std::move(inventory))
        , Logger(std::move(logger)) {
    }

    bool TBookingStateMachine::CanTransition(EBookingStatus from, EBookingStatus to) {
        switch (from) {
            case EBookingStatus::Provisional:
                return to == EBookingStatus::Confirmed || to == EBookingStatus::Cancelled;
            case EBookingStatus::Confirmed:
                return to == EBookingStatus::Cancelled || to == EBookingStatus::Completed;
            case EBookingStatus::Cancelled:
            case EBookingStatus::Completed:
                return false;
        }
        return false;
    }

    TBookingResult TBookingStateMachine::Confirm(BookingId id, TTimePoint now) {
        return Transition(id, EBookingStatus::Confirmed, now);
    }

    TBookingResult TBookingStateMachine::Cancel(BookingId id, TTimePoint now) {
        return Transition(id, EBookingStatus::Cancelled, now);
    }

    TBookingResult TBookingStateMachine::Complete(BookingId id, TTimePoint now) {
        return Transition(id, EBookingStatus::Completed, now);
    }

    TBookingResult TBookingStateMachine::Transition(BookingId id, EBookingStatus target, TTimePoint now) {
        try {
            auto tx = Store->Begin();
            auto booking = tx->SelectBookingForUpdate(id);
            if (!booking) {
                throw TReservationError(EErrorCode::BookingNotFound, "Booking " + std::to_string(id) + " not found");
            }

            if (target == EBookingStatus::Cancelled && booking->Status == EBookingStatus::Cancelled) {
                tx->Rollback();
                return TBookingResult::Success(*booking);
            }

            if (!CanTransition(booking->Status, target)) {
                throw TReservationError(EErrorCode::InvalidState,
                                        "Cannot move booking " + std::to_string(id) + " from " +
                                            ToString(booking->Status) + " to " + ToString(target));
            }

            if (target == EBookingStatus::Cancelled) {
                Inventory->Increment(*tx, booking->RoomType, ResolveDateRange(booking->StartDate, booking->EndDate),
                                     booking->RoomsBooked);
            }

            auto from = booking->Status;
            booking->Status = target;
            booking->UpdatedAt = now;
            tx->UpdateBooking(*booking);
            tx->Commit();

            Logger->Info("state_machine", "booking transitioned",
                         {{"booking_id", id}, {"from", ToString(from)}, {"to", ToString(target)}});
            return TBookingResult::Success(*booking);
        } catch (const TReservationError& ex) {
            if (ex.Code() == EErrorCode::ConcurrencyAbort) {
                Logger->Warn("state_machine", ex.what(), {{"booking_id", id}});
            } else {
                Logger->Info("state_machine", ex.what(), {{"booking_id", id}, {"error", ToString(ex.Code())}});
            }
            return TBookingResult::Failure(ex.GetResponse());
        } catch (const std::exception& ex) {
            Logger->Warn("state_machine", ex.what(), {{"booking_id", id}});
            return TBookingResult::Failure(MakeConcurrencyError(
                std::string("Failed to update booking, please retry: ") + ex.what()));
        }
    }

    TExpireResult TBookingStateMachine::ExpireProvisional(TTimePoint createdBefore, TTimePoint now) {
        std::vector<BookingId> candidates;
        {
            auto tx = Store->Begin();
            candidates = tx->FindBookingIds(EBookingStatus::Provisional, createdBefore);
            tx->Rollback();
        }

        TExpireResult result;
        for (auto id : candidates) {
            try {
                auto tx = Store->Begin();
                auto booking = tx->SelectBookingForUpdate(id);
                // Confirmed or cancelled since the scan.
                if (!booking || booking->Status != EBookingStatus::Provisional) {
                    tx->Rollback();
                    continue;
                }
                Inventory->Increment(*tx, booking->RoomType, ResolveDateRange(booking->StartDate, booking->EndDate),
                                     booking->RoomsBooked);
                booking->Status = EBookingStatus::Cancelled;
                booking->UpdatedAt = now;
                tx->UpdateBooking(*booking);
                tx->Commit();
                ++result.Expired;
            } catch (const TReservationError& ex) {
                Logger->Warn("state_machine", "failed to expire provisional booking",
                             {{"booking_id", id}, {"reason", ex.what()}});
                result.Failed.emplace_back(id, ex.GetResponse());
            } catch (const std::exception& ex) {
                Logger->Warn("state_machine", "failed to expire provisional booking",
                             {{"booking_id", id}, {"reason", ex.what()}});
                result.Failed.emplace_back(id, MakeConcurrencyError(
                    std::string("Failed to expire booking, please retry: ") + ex.what()));
            }
        }

        Logger->Info("state_machine", "provisional bookings expired",
                     {{"candidates", candidates.size()}, {"expired", result.Expired}, {"failed", result.Failed.size()}});
        return result;
    }

} // namespace NReservation
