#include <IdempotencyKeyManager.hpp>

#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

namespace NReservation {

    namespace {

        std::string Sha256Hex(const std::string& data) {
            std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!ctx) {
                throw std::runtime_error("EVP_MD_CTX_new failed");
            }
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int len = 0;
            if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
                EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
                EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
                throw std::runtime_error("SHA-256 digest failed");
            }
            std::ostringstream out;
            out << std::hex << std::setfill('0');
            for (unsigned int i = 0; i < len; ++i) {
                out << std::setw(2) << static_cast<int>(digest[i]);
            }
            return out.str();
        }

        std::string TimestampIso(TTimePoint tp) {
            using namespace std::chrono;
            auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
            int64_t dayMs = 86400000;
            int64_t days = ms / dayMs;
            int64_t rem = ms % dayMs;
            if (rem < 0) {
                rem += dayMs;
                --days;
            }
            std::ostringstream out;
            out << TDate{days}.ToString() << 'T' << std::setfill('0')
                << std::setw(2) << rem / 3600000 << ':'
                << std::setw(2) << (rem / 60000) % 60 << ':'
                << std::setw(2) << (rem / 1000) % 60 << '.'
                << std::setw(3) << rem % 1000 << 'Z';
            return out.str();
        }

    } // namespace

    TIdempotencyKeyManager::TIdempotencyKeyManager(std::chrono::hours retention, TClock clock, std::shared_ptr<TLogger> logger)
        : Retention(retention)
        , Clock(clock ? std::move(clock) : TClock([] { return std::chrono::system_clock::now(); }))
        , Logger(std::move(logger)) {
    }

    std::string TIdempotencyKeyManager::DeriveKey(UserId user, RoomTypeId roomType, TDate start, TDate end, uint32_t roomsBooked) {
        std::string canonical = std::to_string(user) + "|" + std::to_string(roomType) + "|" + start.ToIsoString() + "|" +
                                end.ToIsoString() + "|" + std::to_string(roomsBooked);
        return Sha256Hex(canonical);
    }

    std::string TIdempotencyKeyManager::DeriveKey(const TReserveRequest& request) {
        return DeriveKey(request.User, request.RoomType, request.StartDate, request.EndDate, request.RoomsBooked);
    }

    bool TIdempotencyKeyManager::IsValidKeyFormat(const std::string& candidate) {
        if (candidate.size() != 64) {
            return false;
        }
        for (char c : candidate) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }

    std::string TIdempotencyKeyManager::AcceptClientSuppliedKey(const TReserveRequest& request,
                                                                const std::optional<std::string>& candidate) const {
        if (candidate && IsValidKeyFormat(*candidate)) {
            return *candidate;
        }
        if (candidate && Logger) {
            Logger->Debug("idempotency", "client key rejected, deriving", {{"candidate_length", candidate->size()}});
        }
        return DeriveKey(request);
    }

    std::optional<TKeyLookup> TIdempotencyKeyManager::Lookup(ITransaction& tx, const std::string& key) const {
        auto record = tx.FindIdempotencyKey(key);
        if (!record) {
            return std::nullopt;
        }
        TKeyLookup out;
        out.Record = *record;
        out.Booking = tx.FindBooking(record->Booking);
        return out;
    }

    void TIdempotencyKeyManager::Bind(ITransaction& tx, const std::string& key, BookingId booking, const std::string& metadata) const {
        TIdempotencyRecord record;
        record.Key = key;
        record.Booking = booking;
        record.Metadata = metadata;
        record.CreatedAt = Clock();
        tx.InsertIdempotencyKey(record);
    }

    std::string TIdempotencyKeyManager::MakeMetadata(const TReserveRequest& request) const {
        json j = {{"userId", request.User},
                  {"roomTypeId", request.RoomType},
                  {"startDate", request.StartDate.ToIsoString()},
                  {"endDate", request.EndDate.ToIsoString()},
                  {"roomsBooked", request.RoomsBooked},
                  {"requestedAt", TimestampIso(Clock())}};
        if (request.ClientIp) {
            j["clientIp"] = *request.ClientIp;
        }
        if (request.UserAgent) {
            j["userAgent"] = *request.UserAgent;
        }
        // User agents are client-controlled and may carry invalid UTF-8.
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    bool TIdempotencyKeyManager::MatchesRequest(const TBooking& booking, const TReserveRequest& request) {
        return booking.User == request.User &&
               booking.RoomType == request.RoomType &&
               booking.StartDate == request.StartDate &&
               booking.EndDate == request.EndDate &&
               booking.RoomsBooked == request.RoomsBooked;
    }

    size_t TIdempotencyKeyManager::SweepExpired(IReservationStore& store, TTimePoint now) const {
        auto cutoff = now - Retention;
        auto tx = store.Begin();
        size_t removed = tx->DeleteIdempotencyKeysBefore(cutoff);
        tx->Commit();
        if (Logger) {
            Logger->Info("idempotency", "expired keys swept", {{"removed", removed}, {"cutoff", TimestampIso(cutoff)}});
        }
        return removed;
    }

} // namespace NReservation
