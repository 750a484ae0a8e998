#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Common.hpp"

namespace NReservation {

    enum class EErrorCode {
        InsufficientInventory,
        ConcurrencyAbort,
        IdempotencyConflict,
        InvalidState,
        InvalidDateRange,
        InvalidRequest,
        BookingNotFound
    };

    std::string ToString(EErrorCode code);

    struct TErrorDetails {
        std::optional<RoomTypeId> RoomType;
        std::optional<uint32_t> RequestedRooms;
        std::optional<int64_t> AvailableRooms;
        std::vector<TDate> ConflictDates;
        std::optional<std::string> IdempotencyKey;
        std::optional<BookingId> ExistingBookingId;
    };

    struct TErrorResponse {
        EErrorCode Code = EErrorCode::ConcurrencyAbort;
        std::string Message;
        std::optional<TErrorDetails> Details;

        json ToJson() const;
    };

    // Raised inside a transaction; unwinding rolls the transaction back.
    class TReservationError: public std::runtime_error {
    public:
        explicit TReservationError(TErrorResponse response)
            : std::runtime_error(response.Message)
            , Response(std::move(response)) {
        }

        TReservationError(EErrorCode code, const std::string& message)
            : TReservationError(TErrorResponse{code, message, std::nullopt}) {
        }

        EErrorCode Code() const {
            return Response.Code;
        }

        const TErrorResponse& GetResponse() const {
            return Response;
        }

    private:
        TErrorResponse Response;
    };

    // Raised by a store when an insert hits a unique index.
    class TUniqueViolation: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Outcome of a public booking operation. A replay is a success.
    struct TBookingResult {
        bool Ok = false;
        std::optional<TBooking> Booking;
        bool Replayed = false;
        std::string IdempotencyKey;
        std::optional<TErrorResponse> Error;

        static TBookingResult Success(TBooking booking, bool replayed = false, std::string key = std::string());
        static TBookingResult Failure(TErrorResponse error, std::string key = std::string());

        json ToJson() const;
    };

    TErrorResponse MakeInsufficientInventoryError(RoomTypeId roomType,
                                                  uint32_t requestedRooms,
                                                  int64_t availableRooms,
                                                  const std::vector<TDate>& conflictDates);
    TErrorResponse MakeConcurrencyError(const std::string& message, std::optional<RoomTypeId> roomType = std::nullopt);
    TErrorResponse MakeIdempotencyConflictError(BookingId existingBookingId, const std::string& key);

} // namespace NReservation
