#include <gtest/gtest.h>
#include <sstream>

#include <IdempotencyKeyManager.hpp>
#include <MemoryStore.hpp>

using namespace NReservation;

static TDate D(const std::string& s) {
    return TDate::Parse(s);
}

static std::shared_ptr<TLogger> QuietLogger() {
    static std::ostringstream sink;
    static auto logger = std::make_shared<TLogger>(sink, ELogLevel::Error);
    return logger;
}

static TReserveRequest Request() {
    TReserveRequest r;
    r.User = 7;
    r.RoomType = 3;
    r.StartDate = D("2025-11-01");
    r.EndDate = D("2025-11-05");
    r.RoomsBooked = 2;
    return r;
}

static TTimePoint At(const std::string& date, int h, int m, int s) {
    return FromEpochSeconds(D(date).Days * 86400 + h * 3600 + m * 60 + s);
}

TEST(IdempotencyKey, DerivedFromCanonicalString) {
    EXPECT_EQ(TIdempotencyKeyManager::DeriveKey(7, 3, D("2025-11-01"), D("2025-11-05"), 2),
              "3a6d0be02086636bf67c0b9541cf1271dfd686ea829d7f0d2f290a2463d0b179");
    EXPECT_EQ(TIdempotencyKeyManager::DeriveKey(Request()), TIdempotencyKeyManager::DeriveKey(Request()));
}

TEST(IdempotencyKey, EveryFieldChangesKey) {
    auto base = TIdempotencyKeyManager::DeriveKey(Request());
    auto changed = [](auto mutate) {
        auto r = Request();
        mutate(r);
        return TIdempotencyKeyManager::DeriveKey(r);
    };
    EXPECT_NE(base, changed([](TReserveRequest& r) { r.User = 8; }));
    EXPECT_NE(base, changed([](TReserveRequest& r) { r.RoomType = 4; }));
    EXPECT_NE(base, changed([](TReserveRequest& r) { r.StartDate = D("2025-11-02"); }));
    EXPECT_NE(base, changed([](TReserveRequest& r) { r.EndDate = D("2025-11-06"); }));
    EXPECT_NE(base, changed([](TReserveRequest& r) { r.RoomsBooked = 1; }));
    // price and status do not identify the request
    EXPECT_EQ(base, changed([](TReserveRequest& r) {
        r.TotalPrice = 999;
        r.Confirmed = true;
    }));
}

TEST(IdempotencyKey, ClientKeyFormat) {
    EXPECT_TRUE(TIdempotencyKeyManager::IsValidKeyFormat(std::string(64, 'F')));
    EXPECT_TRUE(TIdempotencyKeyManager::IsValidKeyFormat(TIdempotencyKeyManager::DeriveKey(Request())));
    EXPECT_FALSE(TIdempotencyKeyManager::IsValidKeyFormat(std::string(63, 'a')));
    EXPECT_FALSE(TIdempotencyKeyManager::IsValidKeyFormat(std::string(65, 'a')));
    EXPECT_FALSE(TIdempotencyKeyManager::IsValidKeyFormat(std::string(63, 'a') + "g"));

    TIdempotencyKeyManager keys(std::chrono::hours(168), TClock(), QuietLogger());
    std::string upper(64, 'B');
    EXPECT_EQ(keys.AcceptClientSuppliedKey(Request(), upper), upper);
    EXPECT_EQ(keys.AcceptClientSuppliedKey(Request(), std::string("abc")), TIdempotencyKeyManager::DeriveKey(Request()));
    EXPECT_EQ(keys.AcceptClientSuppliedKey(Request(), std::nullopt), TIdempotencyKeyManager::DeriveKey(Request()));
}

TEST(IdempotencyKey, MetadataCarriesRequestAndClock) {
    TIdempotencyKeyManager keys(std::chrono::hours(168), [] { return At("2025-01-02", 3, 4, 5); }, QuietLogger());
    auto req = Request();
    req.ClientIp = "10.0.0.1";

    auto meta = json::parse(keys.MakeMetadata(req));
    EXPECT_EQ(meta.at("userId").get<UserId>(), 7u);
    EXPECT_EQ(meta.at("roomTypeId").get<RoomTypeId>(), 3u);
    EXPECT_EQ(meta.at("startDate").get<std::string>(), "2025-11-01T00:00:00.000Z");
    EXPECT_EQ(meta.at("endDate").get<std::string>(), "2025-11-05T00:00:00.000Z");
    EXPECT_EQ(meta.at("roomsBooked").get<int>(), 2);
    EXPECT_EQ(meta.at("requestedAt").get<std::string>(), "2025-01-02T03:04:05.000Z");
    EXPECT_EQ(meta.at("clientIp").get<std::string>(), "10.0.0.1");
    EXPECT_FALSE(meta.contains("userAgent"));
}

TEST(IdempotencyKey, MetadataToleratesInvalidUtf8) {
    TIdempotencyKeyManager keys(std::chrono::hours(168), TClock(), QuietLogger());
    auto req = Request();
    req.UserAgent = std::string("Mozilla\xff\xfe");

    std::string text;
    ASSERT_NO_THROW(text = keys.MakeMetadata(req));
    auto meta = json::parse(text);
    ASSERT_TRUE(meta.contains("userAgent"));
    EXPECT_EQ(meta.at("userAgent").get<std::string>().rfind("Mozilla", 0), 0u);
}

TEST(IdempotencyKey, BindTwiceIsUniqueViolation) {
    auto store = std::make_shared<TMemoryStore>(std::make_shared<TMemoryStorage>(), std::chrono::milliseconds(200), QuietLogger());
    TIdempotencyKeyManager keys(std::chrono::hours(168), TClock(), QuietLogger());
    auto key = TIdempotencyKeyManager::DeriveKey(Request());

    {
        auto tx = store->Begin();
        TBooking b;
        b.User = 7;
        b.RoomType = 3;
        b.StartDate = D("2025-11-01");
        b.EndDate = D("2025-11-05");
        b.RoomsBooked = 2;
        auto id = tx->InsertBooking(b);
        keys.Bind(*tx, key, id, keys.MakeMetadata(Request()));
        tx->Commit();
    }

    auto tx = store->Begin();
    auto found = keys.Lookup(*tx, key);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->Booking);
    EXPECT_TRUE(TIdempotencyKeyManager::MatchesRequest(*found->Booking, Request()));
    EXPECT_THROW(keys.Bind(*tx, key, found->Booking->Id + 1, "{}"), TUniqueViolation);
    EXPECT_FALSE(keys.Lookup(*tx, std::string(64, '0')));
}

TEST(IdempotencyKey, SweepHonoursRetention) {
    auto store = std::make_shared<TMemoryStore>(std::make_shared<TMemoryStorage>(), std::chrono::milliseconds(200), QuietLogger());
    auto now = std::make_shared<TTimePoint>(At("2025-11-01", 12, 0, 0));
    TIdempotencyKeyManager keys(std::chrono::hours(24), [now] { return *now; }, QuietLogger());

    auto bindFresh = [&](UserId user) {
        auto tx = store->Begin();
        TBooking b;
        b.User = user;
        b.RoomType = 3;
        b.StartDate = D("2025-11-01");
        b.EndDate = D("2025-11-02");
        b.RoomsBooked = 1;
        auto id = tx->InsertBooking(b);
        keys.Bind(*tx, TIdempotencyKeyManager::DeriveKey(user, 3, b.StartDate, b.EndDate, 1), id, "{}");
        tx->Commit();
    };

    bindFresh(1);
    *now += std::chrono::hours(20);
    bindFresh(2);

    EXPECT_EQ(keys.SweepExpired(*store, *now), 0u);
    EXPECT_EQ(keys.SweepExpired(*store, *now + std::chrono::hours(5)), 1u);
    EXPECT_EQ(keys.SweepExpired(*store, *now + std::chrono::hours(25)), 1u);
    EXPECT_TRUE(store->ReadBooking(1));
    EXPECT_TRUE(store->ReadBooking(2));
}
