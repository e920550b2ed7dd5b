#include <gtest/gtest.h>
#include <monitor/pause_budget.hpp>

static RentalCounters counters(int running, int running_od, int resident, int resident_od) {
    RentalCounters c;
    c.running = running;
    c.running_on_demand = running_od;
    c.resident = resident;
    c.resident_on_demand = resident_od;
    return c;
}

TEST(PauseBudget, StoredCountsNeverNegative) {
    auto c = counters(3, 2, 1, 0);
    EXPECT_EQ(stored_on_demand(c), 0);
    EXPECT_EQ(stored_other(c), 0);
}

TEST(PauseBudget, StoredCountsPerClass) {
    // 2 on-demand resident, 1 running; 3 other resident, 1 running
    auto c = counters(2, 1, 5, 2);
    EXPECT_EQ(stored_on_demand(c), 1);
    EXPECT_EQ(stored_other(c), 2);
}

TEST(PauseBudget, GrowthOfStoredPopulation) {
    auto before = counters(2, 1, 2, 1);
    auto after = counters(1, 0, 2, 1);   // on-demand rental stopped, still resident
    auto budget = estimate_pause_budget(before, after);
    EXPECT_EQ(budget.on_demand, 1);
    EXPECT_EQ(budget.other, 0);
}

TEST(PauseBudget, ShrinkingPopulationGivesNothing) {
    auto budget = estimate_pause_budget(counters(0, 0, 2, 2), counters(0, 0, 0, 0));
    EXPECT_EQ(budget.on_demand, 0);
    EXPECT_EQ(budget.other, 0);
}

TEST(PauseBudget, ConsumeUntilEmpty) {
    PauseBudget b;
    b.other = 1;
    EXPECT_FALSE(b.available(DemandClass::OnDemand));
    EXPECT_TRUE(b.available(DemandClass::Other));
    EXPECT_TRUE(b.consume(DemandClass::Other));
    EXPECT_FALSE(b.consume(DemandClass::Other));
    EXPECT_EQ(b.other, 0);
}
