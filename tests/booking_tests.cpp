#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

#include <BookingManager.hpp>
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

static TReserveRequest MakeRequest(UserId user, uint32_t rooms, const std::string& start = "2025-11-01", const std::string& end = "2025-11-05") {
    TReserveRequest r;
    r.User = user;
    r.RoomType = 1;
    r.StartDate = D(start);
    r.EndDate = D(end);
    r.RoomsBooked = rooms;
    r.TotalPrice = 400 * rooms;
    return r;
}

static int64_t AvailableOn(TBookingManager& mgr, const std::string& date) {
    auto snap = mgr.Snapshot(1, D(date), D(date).Next());
    return snap.empty() ? -1 : snap.front().AvailableRooms;
}

TEST(Reserve, DecrementsEveryNight) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 2));
    ASSERT_TRUE(res.Ok);
    ASSERT_TRUE(res.Booking);
    EXPECT_FALSE(res.Replayed);
    EXPECT_EQ(res.Booking->Status, EBookingStatus::Provisional);
    EXPECT_EQ(res.Booking->TotalPrice, 800);

    auto snap = mgr.Snapshot(1, D("2025-11-01"), D("2025-11-05"));
    ASSERT_EQ(snap.size(), 4u);
    for (auto const& e : snap) {
        EXPECT_EQ(e.AvailableRooms, 3);
    }
    EXPECT_EQ(AvailableOn(mgr, "2025-11-05"), -1);
}

TEST(Reserve, ConfirmedFlagCreatesConfirmedBooking) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto req = MakeRequest(7, 1);
    req.Confirmed = true;
    auto res = mgr.Reserve(req);
    ASSERT_TRUE(res.Ok);
    EXPECT_EQ(res.Booking->Status, EBookingStatus::Confirmed);
}

TEST(Reserve, InsufficientInventoryReportsAllDates) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);
    mgr.SeedInventory(1, D("2025-11-02"), D("2025-11-04"), 1);

    auto res = mgr.Reserve(MakeRequest(7, 3));
    ASSERT_FALSE(res.Ok);
    ASSERT_TRUE(res.Error);
    EXPECT_EQ(res.Error->Code, EErrorCode::InsufficientInventory);
    ASSERT_TRUE(res.Error->Details);
    EXPECT_EQ(*res.Error->Details->AvailableRooms, 1);
    EXPECT_EQ(*res.Error->Details->RequestedRooms, 3u);
    ASSERT_EQ(res.Error->Details->ConflictDates.size(), 2u);
    EXPECT_EQ(res.Error->Details->ConflictDates[0], D("2025-11-02"));
    EXPECT_EQ(res.Error->Details->ConflictDates[1], D("2025-11-03"));

    // rolled back: nothing decremented
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 5);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-04"), 5);
}

TEST(Reserve, MissingInventoryRowIsInsufficient) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-03"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 1));
    ASSERT_FALSE(res.Ok);
    EXPECT_EQ(res.Error->Code, EErrorCode::InsufficientInventory);
    EXPECT_EQ(*res.Error->Details->AvailableRooms, 0);
    ASSERT_EQ(res.Error->Details->ConflictDates.size(), 2u);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 5);
}

TEST(Reserve, RejectsEmptyRangeAndZeroRooms) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto sameDay = mgr.Reserve(MakeRequest(7, 1, "2025-11-01", "2025-11-01"));
    ASSERT_FALSE(sameDay.Ok);
    EXPECT_EQ(sameDay.Error->Code, EErrorCode::InvalidDateRange);

    auto zero = mgr.Reserve(MakeRequest(7, 0));
    ASSERT_FALSE(zero.Ok);
    EXPECT_EQ(zero.Error->Code, EErrorCode::InvalidRequest);

    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 5);
}

TEST(Idempotency, RetryReplaysWithoutSecondDecrement) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto first = mgr.Reserve(MakeRequest(7, 2));
    auto second = mgr.Reserve(MakeRequest(7, 2));
    ASSERT_TRUE(first.Ok);
    ASSERT_TRUE(second.Ok);
    EXPECT_TRUE(second.Replayed);
    EXPECT_EQ(first.Booking->Id, second.Booking->Id);
    EXPECT_EQ(first.IdempotencyKey, second.IdempotencyKey);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 3);
    EXPECT_TRUE(second.ToJson().at("isFromCache").get<bool>());
}

TEST(Idempotency, ClientKeyWithDifferentParametersConflicts) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    std::string key(64, 'a');
    auto first = mgr.Reserve(MakeRequest(7, 1), key);
    ASSERT_TRUE(first.Ok);
    EXPECT_EQ(first.IdempotencyKey, key);

    auto other = mgr.Reserve(MakeRequest(7, 2), key);
    ASSERT_FALSE(other.Ok);
    EXPECT_EQ(other.Error->Code, EErrorCode::IdempotencyConflict);
    EXPECT_EQ(*other.Error->Details->ExistingBookingId, first.Booking->Id);
    EXPECT_EQ(*other.Error->Details->IdempotencyKey, key);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 4);
}

TEST(Idempotency, MalformedClientKeyFallsBackToDerived) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 1), std::string("not-a-key"));
    ASSERT_TRUE(res.Ok);
    EXPECT_EQ(res.IdempotencyKey, TIdempotencyKeyManager::DeriveKey(MakeRequest(7, 1)));
}

TEST(Multithreading, TwoRacersOnlyOneWins) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    TBookingResult a;
    TBookingResult b;
    std::thread ta([&] { a = mgr.Reserve(MakeRequest(100, 3)); });
    std::thread tb([&] { b = mgr.Reserve(MakeRequest(200, 3)); });
    ta.join();
    tb.join();

    ASSERT_NE(a.Ok, b.Ok);
    const auto& loser = a.Ok ? b : a;
    ASSERT_TRUE(loser.Error);
    EXPECT_EQ(loser.Error->Code, EErrorCode::InsufficientInventory);
    EXPECT_EQ(*loser.Error->Details->AvailableRooms, 2);
    EXPECT_EQ(loser.Error->Details->ConflictDates.size(), 4u);

    for (auto const& e : mgr.Snapshot(1, D("2025-11-01"), D("2025-11-05"))) {
        EXPECT_EQ(e.AvailableRooms, 2);
    }
}

TEST(Multithreading, ManyRacersNeverOverbook) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 10);

    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> th;
    for (int i = 0; i < 24; ++i) {
        th.emplace_back([&, i] {
            // overlapping ranges
            auto req = (i % 2 == 0) ? MakeRequest(1000 + i, 1) : MakeRequest(1000 + i, 1, "2025-11-02", "2025-11-04");
            auto res = mgr.Reserve(req);
            if (res.Ok) {
                ++created;
            } else if (res.Error && res.Error->Code == EErrorCode::InsufficientInventory) {
                ++rejected;
            }
        });
    }
    for (auto& t : th) {
        t.join();
    }

    EXPECT_EQ(created.load(), 10);
    EXPECT_EQ(rejected.load(), 14);
    EXPECT_TRUE(mgr.VerifyIntegrity(1));
    EXPECT_EQ(AvailableOn(mgr, "2025-11-02"), 0);
}

TEST(Multithreading, IdenticalConcurrentRequestsBookOnce) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    std::vector<TBookingResult> results(8);
    std::vector<std::thread> th;
    for (size_t i = 0; i < results.size(); ++i) {
        th.emplace_back([&, i] { results[i] = mgr.Reserve(MakeRequest(7, 2)); });
    }
    for (auto& t : th) {
        t.join();
    }

    int fresh = 0;
    for (auto const& r : results) {
        ASSERT_TRUE(r.Ok);
        EXPECT_EQ(r.Booking->Id, results[0].Booking->Id);
        if (!r.Replayed) {
            ++fresh;
        }
    }
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 3);
}

TEST(Locking, WaitBeyondTimeoutAborts) {
    TReservationConfig cfg;
    cfg.LockWaitTimeout = std::chrono::milliseconds(50);
    auto store = std::make_shared<TMemoryStore>(std::make_shared<TMemoryStorage>(), cfg.LockWaitTimeout, QuietLogger());
    TBookingManager mgr(store, cfg, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto holder = store->Begin();
    holder->SelectInventoryForUpdate(1, {D("2025-11-03")});

    auto blocked = mgr.Reserve(MakeRequest(7, 1));
    ASSERT_FALSE(blocked.Ok);
    EXPECT_EQ(blocked.Error->Code, EErrorCode::ConcurrencyAbort);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 5);

    holder->Rollback();
    auto retried = mgr.Reserve(MakeRequest(7, 1));
    EXPECT_TRUE(retried.Ok);
}

TEST(StateMachine, CancelRestoresInventoryOnce) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 2));
    ASSERT_TRUE(res.Ok);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-02"), 3);

    auto cancelled = mgr.Cancel(res.Booking->Id);
    ASSERT_TRUE(cancelled.Ok);
    EXPECT_EQ(cancelled.Booking->Status, EBookingStatus::Cancelled);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-02"), 5);

    auto again = mgr.Cancel(res.Booking->Id);
    ASSERT_TRUE(again.Ok);
    EXPECT_EQ(again.Booking->Status, EBookingStatus::Cancelled);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-02"), 5);
}

TEST(StateMachine, ConfirmThenComplete) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 1));
    ASSERT_TRUE(res.Ok);
    BookingId id = res.Booking->Id;

    auto early = mgr.Complete(id);
    ASSERT_FALSE(early.Ok);
    EXPECT_EQ(early.Error->Code, EErrorCode::InvalidState);

    ASSERT_TRUE(mgr.Confirm(id).Ok);
    auto twice = mgr.Confirm(id);
    ASSERT_FALSE(twice.Ok);
    EXPECT_EQ(twice.Error->Code, EErrorCode::InvalidState);

    auto done = mgr.Complete(id);
    ASSERT_TRUE(done.Ok);
    EXPECT_EQ(mgr.GetBooking(id)->Status, EBookingStatus::Completed);

    auto cancel = mgr.Cancel(id);
    ASSERT_FALSE(cancel.Ok);
    EXPECT_EQ(cancel.Error->Code, EErrorCode::InvalidState);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 4);
}

TEST(StateMachine, CancelledCannotBeConfirmed) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto res = mgr.Reserve(MakeRequest(7, 1));
    ASSERT_TRUE(mgr.Cancel(res.Booking->Id).Ok);
    auto confirm = mgr.Confirm(res.Booking->Id);
    ASSERT_FALSE(confirm.Ok);
    EXPECT_EQ(confirm.Error->Code, EErrorCode::InvalidState);
}

TEST(StateMachine, UnknownBookingNotFound) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    auto res = mgr.Cancel(424242);
    ASSERT_FALSE(res.Ok);
    EXPECT_EQ(res.Error->Code, EErrorCode::BookingNotFound);
}

TEST(StateMachine, TransitionTable) {
    using S = EBookingStatus;
    EXPECT_TRUE(TBookingStateMachine::CanTransition(S::Provisional, S::Confirmed));
    EXPECT_TRUE(TBookingStateMachine::CanTransition(S::Provisional, S::Cancelled));
    EXPECT_TRUE(TBookingStateMachine::CanTransition(S::Confirmed, S::Cancelled));
    EXPECT_TRUE(TBookingStateMachine::CanTransition(S::Confirmed, S::Completed));
    EXPECT_FALSE(TBookingStateMachine::CanTransition(S::Provisional, S::Completed));
    EXPECT_FALSE(TBookingStateMachine::CanTransition(S::Confirmed, S::Confirmed));
    EXPECT_FALSE(TBookingStateMachine::CanTransition(S::Cancelled, S::Confirmed));
    EXPECT_FALSE(TBookingStateMachine::CanTransition(S::Completed, S::Cancelled));
}

TEST(StateMachine, ExpireProvisionalOnlyTouchesStaleProvisional) {
    auto now = std::make_shared<TTimePoint>(FromEpochSeconds(1760000000));
    TBookingManager mgr(TReservationConfig{}, QuietLogger(), [now] { return *now; });
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto stale = mgr.Reserve(MakeRequest(1, 1));
    auto confirmed = mgr.Reserve(MakeRequest(2, 1));
    ASSERT_TRUE(mgr.Confirm(confirmed.Booking->Id).Ok);

    *now += std::chrono::hours(2);
    auto fresh = mgr.Reserve(MakeRequest(3, 1));
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 2);

    auto result = mgr.ExpireProvisional(std::chrono::hours(1));
    EXPECT_EQ(result.Expired, 1u);
    EXPECT_TRUE(result.Failed.empty());
    EXPECT_EQ(mgr.GetBooking(stale.Booking->Id)->Status, EBookingStatus::Cancelled);
    EXPECT_EQ(mgr.GetBooking(confirmed.Booking->Id)->Status, EBookingStatus::Confirmed);
    EXPECT_EQ(mgr.GetBooking(fresh.Booking->Id)->Status, EBookingStatus::Provisional);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 3);
}

TEST(StateMachine, ExpireReportsLockedBookings) {
    auto now = std::make_shared<TTimePoint>(FromEpochSeconds(1760000000));
    auto store = std::make_shared<TMemoryStore>(std::make_shared<TMemoryStorage>(), std::chrono::milliseconds(50), QuietLogger());
    TBookingManager mgr(store, TReservationConfig{}, QuietLogger(), [now] { return *now; });
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);
    auto stale = mgr.Reserve(MakeRequest(1, 1));
    ASSERT_TRUE(stale.Ok);
    *now += std::chrono::hours(2);

    auto holder = store->Begin();
    ASSERT_TRUE(holder->SelectBookingForUpdate(stale.Booking->Id));

    auto blocked = mgr.ExpireProvisional(std::chrono::hours(1));
    EXPECT_EQ(blocked.Expired, 0u);
    ASSERT_EQ(blocked.Failed.size(), 1u);
    EXPECT_EQ(blocked.Failed[0].first, stale.Booking->Id);
    EXPECT_EQ(blocked.Failed[0].second.Code, EErrorCode::ConcurrencyAbort);
    EXPECT_EQ(mgr.GetBooking(stale.Booking->Id)->Status, EBookingStatus::Provisional);

    holder->Rollback();
    auto retried = mgr.ExpireProvisional(std::chrono::hours(1));
    EXPECT_EQ(retried.Expired, 1u);
    EXPECT_TRUE(retried.Failed.empty());
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 5);
}

TEST(Reserve, InvalidUtf8UserAgentIsStored) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);
    auto req = MakeRequest(7, 1);
    req.UserAgent = std::string("Mozilla\xff\xfe");

    auto res = mgr.Reserve(req);
    ASSERT_TRUE(res.Ok);
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 4);
    EXPECT_TRUE(mgr.Reserve(req).Replayed);
}

TEST(Sweep, RemovesOnlyExpiredKeys) {
    auto now = std::make_shared<TTimePoint>(FromEpochSeconds(1760000000));
    TBookingManager mgr(TReservationConfig{}, QuietLogger(), [now] { return *now; });
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 5);

    auto old = mgr.Reserve(MakeRequest(1, 1));
    *now += std::chrono::hours(24 * 8);
    auto recent = mgr.Reserve(MakeRequest(2, 1));
    ASSERT_TRUE(old.Ok);
    ASSERT_TRUE(recent.Ok);

    EXPECT_EQ(mgr.SweepIdempotencyKeys(), 1u);
    EXPECT_EQ(mgr.SweepIdempotencyKeys(), 0u);
    EXPECT_TRUE(mgr.GetBooking(old.Booking->Id));
    EXPECT_EQ(AvailableOn(mgr, "2025-11-01"), 3);

    auto replay = mgr.Reserve(MakeRequest(2, 1));
    ASSERT_TRUE(replay.Ok);
    EXPECT_TRUE(replay.Replayed);
}

TEST(Errors, PayloadShape) {
    TBookingManager mgr(TReservationConfig{}, QuietLogger());
    mgr.SeedInventory(1, D("2025-11-01"), D("2025-11-05"), 1);

    auto j = mgr.Reserve(MakeRequest(7, 2)).ToJson();
    EXPECT_FALSE(j.at("success").get<bool>());
    EXPECT_EQ(j.at("error").get<std::string>(), "INSUFFICIENT_INVENTORY");
    EXPECT_TRUE(j.at("message").is_string());
    auto const& d = j.at("details");
    EXPECT_EQ(d.at("roomTypeId").get<RoomTypeId>(), 1u);
    EXPECT_EQ(d.at("requestedRooms").get<int>(), 2);
    EXPECT_EQ(d.at("availableRooms").get<int>(), 1);
    ASSERT_EQ(d.at("conflictDates").size(), 4u);
    EXPECT_EQ(d.at("conflictDates")[0].get<std::string>(), "2025-11-01");

    auto ok = mgr.Reserve(MakeRequest(7, 1)).ToJson();
    EXPECT_TRUE(ok.at("success").get<bool>());
    EXPECT_EQ(ok.at("status").get<std::string>(), "PROVISIONAL");
    EXPECT_EQ(ok.at("roomsBooked").get<int>(), 1);
    EXPECT_EQ(ok.at("totalPrice").get<int>(), 400);
    EXPECT_FALSE(ok.at("isFromCache").get<bool>());
    EXPECT_EQ(ok.at("idempotencyKey").get<std::string>().size(), 64u);
}
