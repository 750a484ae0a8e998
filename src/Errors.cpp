#include <Errors.hpp>

namespace NReservation {

    std::string ToString(EErrorCode code) {
        switch (code) {
            case EErrorCode::InsufficientInventory:
                return "INSUFFICIENT_INVENTORY";
            case EErrorCode::ConcurrencyAbort:
                return "CONCURRENCY_ABORT";
            case EErrorCode::IdempotencyConflict:
                return "IDEMPOTENCY_CONFLICT";
            case EErrorCode::InvalidState:
                return "INVALID_STATE";
            case EErrorCode::InvalidDateRange:
                return "INVALID_DATE_RANGE";
            case EErrorCode::InvalidRequest:
                return "INVALID_REQUEST";
            case EErrorCode::BookingNotFound:
                return "BOOKING_NOT_FOUND";
        }
        return "UNKNOWN";
    }

    json TErrorResponse::ToJson() const {
        json j = {{"success", false}, {"error", ToString(Code)}, {"message", Message}};
        if (!Details) {
            return j;
        }
        json d = json::object();
        if (Details->RoomType) {
            d["roomTypeId"] = *Details->RoomType;
        }
        if (Details->RequestedRooms) {
            d["requestedRooms"] = *Details->RequestedRooms;
        }
        if (Details->AvailableRooms) {
            d["availableRooms"] = *Details->AvailableRooms;
        }
        if (!Details->ConflictDates.empty()) {
            d["conflictDates"] = json::array();
            for (auto const& date : Details->ConflictDates) {
                d["conflictDates"].push_back(date.ToString());
            }
        }
        if (Details->IdempotencyKey) {
            d["idempotencyKey"] = *Details->IdempotencyKey;
        }
        if (Details->ExistingBookingId) {
            d["existingBookingId"] = *Details->ExistingBookingId;
        }
        j["details"] = d;
        return j;
    }

    TBookingResult TBookingResult::Success(TBooking booking, bool replayed, std::string key) {
        TBookingResult out;
        out.Ok = true;
        out.Booking = std::move(booking);
        out.Replayed = replayed;
        out.IdempotencyKey = std::move(key);
        return out;
    }

    TBookingResult TBookingResult::Failure(TErrorResponse error, std::string key) {
        TBookingResult out;
        out.Error = std::move(error);
        out.IdempotencyKey = std::move(key);
        return out;
    }

    json TBookingResult::ToJson() const {
        if (!Ok || !Booking) {
            return Error ? Error->ToJson() : json{{"success", false}};
        }
        json j = {{"success", true},
                  {"bookingId", Booking->Id},
                  {"status", ToString(Booking->Status)},
                  {"totalPrice", Booking->TotalPrice},
                  {"roomsBooked", Booking->RoomsBooked},
                  {"isFromCache", Replayed}};
        if (!IdempotencyKey.empty()) {
            j["idempotencyKey"] = IdempotencyKey;
        }
        return j;
    }

    TErrorResponse MakeInsufficientInventoryError(RoomTypeId roomType,
                                                  uint32_t requestedRooms,
                                                  int64_t availableRooms,
                                                  const std::vector<TDate>& conflictDates) {
        std::string dates;
        for (auto const& d : conflictDates) {
            if (!dates.empty()) {
                dates += ", ";
            }
            dates += d.ToString();
        }
        TErrorDetails details;
        details.RoomType = roomType;
        details.RequestedRooms = requestedRooms;
        details.AvailableRooms = availableRooms;
        details.ConflictDates = conflictDates;
        return TErrorResponse{EErrorCode::InsufficientInventory,
                              "Insufficient inventory: requested " + std::to_string(requestedRooms) +
                                  " rooms but only " + std::to_string(availableRooms) + " available on " + dates,
                              std::move(details)};
    }

    TErrorResponse MakeConcurrencyError(const std::string& message, std::optional<RoomTypeId> roomType) {
        TErrorResponse out{EErrorCode::ConcurrencyAbort, message, std::nullopt};
        if (roomType) {
            TErrorDetails details;
            details.RoomType = roomType;
            out.Details = std::move(details);
        }
        return out;
    }

    TErrorResponse MakeIdempotencyConflictError(BookingId existingBookingId, const std::string& key) {
        TErrorDetails details;
        details.IdempotencyKey = key;
        details.ExistingBookingId = existingBookingId;
        return TErrorResponse{EErrorCode::IdempotencyConflict,
                              "A booking with this idempotency key already exists for different parameters",
                              std::move(details)};
    }

} // namespace NReservation
