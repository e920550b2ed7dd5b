#include <gtest/gtest.h>
#include <ledger/session.hpp>
#include <core/constants.hpp>

static const std::string T0 = "2025-01-15T10:00:00Z";
static const std::string T1 = "2025-01-15T12:00:00Z";
static const std::string T2 = "2025-01-15T13:00:00Z";

TEST(Ledger, SessionIdIsZeroPadded) {
    EXPECT_EQ(make_session_id(42, 7), "m42-0007");
    EXPECT_EQ(make_session_id(42, 12345), "m42-12345");
}

TEST(Ledger, StatusNames) {
    EXPECT_STREQ(to_string(SessionStatus::Stored), "stored");
    EXPECT_EQ(parse_session_status("running"), SessionStatus::Running);
    EXPECT_FALSE(parse_session_status("paused").has_value());
}

TEST(Ledger, DemandClassFromCode) {
    EXPECT_EQ(demand_class_for("D"), DemandClass::OnDemand);
    EXPECT_EQ(demand_class_for("I"), DemandClass::Other);
    EXPECT_EQ(demand_class_for("R"), DemandClass::Other);
}

TEST(Ledger, GpuSegmentsAreContiguous) {
    Session s;
    s.start_time = T0;
    s.open_gpu_segment(0.5, 2, T0);
    s.open_gpu_segment(0.4, 2, T1);

    ASSERT_EQ(s.gpu_segments.size(), 2u);
    EXPECT_EQ(s.gpu_segments[0].end, T1);
    EXPECT_EQ(s.gpu_segments[1].start, T1);
    ASSERT_NE(s.open_gpu(), nullptr);
    EXPECT_DOUBLE_EQ(s.open_gpu()->rate, 0.4);
}

TEST(Ledger, CloseWithoutOpenIsNoop) {
    Session s;
    s.close_gpu_segment(T0);
    s.close_storage_segment(T0);
    EXPECT_TRUE(s.gpu_segments.empty());
    EXPECT_TRUE(s.storage_segments.empty());
}

TEST(Ledger, StorageRateNeverRises) {
    Session s;
    EXPECT_TRUE(s.open_storage_segment(0.10, T0));
    EXPECT_FALSE(s.open_storage_segment(0.15, T1));
    EXPECT_FALSE(s.open_storage_segment(0.10, T1));
    EXPECT_TRUE(s.open_storage_segment(0.08, T1));

    ASSERT_EQ(s.storage_segments.size(), 2u);
    EXPECT_EQ(s.storage_segments[0].end, T1);
    EXPECT_DOUBLE_EQ(s.open_storage()->rate_per_gb_month, 0.08);
}

TEST(Ledger, TotalsMeasureOpenSegmentsToAsOf) {
    Session s;
    s.start_time = T0;
    s.storage_gb = 73.0;
    s.open_gpu_segment(0.5, 2, T0);
    s.open_storage_segment(0.10, T0);

    auto t = s.totals(T1);
    EXPECT_DOUBLE_EQ(t.duration_secs, 7200.0);
    EXPECT_DOUBLE_EQ(t.gpu, 0.5 * 2 * 2.0);
    EXPECT_NEAR(t.storage, 0.10 * 73.0 * 2.0 / HOURS_PER_MONTH, 1e-12);
    EXPECT_DOUBLE_EQ(t.total(), t.gpu + t.storage);
}

TEST(Ledger, PausedSessionAccruesStorageOnly) {
    Session s;
    s.start_time = T0;
    s.storage_gb = 100.0;
    s.open_gpu_segment(1.0, 1, T0);
    s.open_storage_segment(0.073, T0);
    s.close_gpu_segment(T1);

    auto before = s.totals(T1);
    auto after = s.totals(T2);
    EXPECT_DOUBLE_EQ(after.gpu, before.gpu);
    EXPECT_GT(after.storage, before.storage);
}

TEST(Ledger, FinalizeFreezesEarnings) {
    Session s;
    s.start_time = T0;
    s.open_gpu_segment(0.3, 4, T0);
    s.finalize(T1);

    EXPECT_EQ(s.status, SessionStatus::Ended);
    EXPECT_FALSE(s.is_active());
    EXPECT_EQ(s.open_gpu(), nullptr);
    ASSERT_TRUE(s.estimated_earnings.has_value());
    EXPECT_DOUBLE_EQ(*s.estimated_earnings, 0.3 * 4 * 2.0);
    EXPECT_DOUBLE_EQ(*s.rental_duration, 7200.0);

    // Later queries do not grow a finalized session
    EXPECT_DOUBLE_EQ(s.totals(T2).total(), *s.estimated_earnings);
}

TEST(Ledger, EffectiveRateIsCappedByCeiling) {
    Session s;
    s.gpu_contracted_rate = 0.5;
    EXPECT_DOUBLE_EQ(s.effective_gpu_rate(0.7), 0.5);
    EXPECT_DOUBLE_EQ(s.effective_gpu_rate(0.3), 0.3);
}

TEST(Ledger, ZeroCeilingBillsObservedRate) {
    Session s;
    EXPECT_DOUBLE_EQ(s.effective_gpu_rate(0.7), 0.7);
    EXPECT_DOUBLE_EQ(s.effective_storage_rate(0.2), 0.2);
}

TEST(Ledger, HourlyRateSumsOpenSegments) {
    Session s;
    s.storage_gb = HOURS_PER_MONTH;
    s.open_gpu_segment(0.25, 4, T0);
    s.open_storage_segment(1.0, T0);
    EXPECT_DOUBLE_EQ(s.hourly_rate(), 1.0 + 1.0);

    s.close_gpu_segment(T1);
    EXPECT_DOUBLE_EQ(s.hourly_rate(), 1.0);
}
