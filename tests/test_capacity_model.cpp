#include <gtest/gtest.h>
#include <core/capacity_model.hpp>

TEST(CapacityModel, LocalBudgetUsesSmallerCeiling) {
    CapacitySnapshot s;
    s.free_space = 1000;
    s.max_usage = 800;
    s.min_free = 100;
    s.current_usage = 200;
    EXPECT_EQ(local_budget(s), 800 - 200 - 100);

    s.free_space = 500;
    EXPECT_EQ(local_budget(s), 500 - 200 - 100);
}

TEST(CapacityModel, RemoteBudgetTakesLesserOfTwoChecks) {
    CapacitySnapshot s;
    s.free_space = 1000;
    s.max_usage = 5000;
    s.min_free = 600;
    s.current_usage = 100;
    // min(min(5000, 1000) - 100, 1000 - 600) = min(900, 400)
    EXPECT_EQ(remote_budget(s), 400);

    s.min_free = 0;
    s.max_usage = 300;
    // min(300 - 100, 1000 - 0)
    EXPECT_EQ(remote_budget(s), 200);
}

TEST(CapacityModel, BudgetMayGoNegative) {
    CapacitySnapshot s;
    s.free_space = 100;
    s.max_usage = 1000;
    s.min_free = 200;
    s.current_usage = 50;
    EXPECT_LT(local_budget(s), 0);
    EXPECT_LT(remote_budget(s), 0);
    EXPECT_TRUE(budget_exhausted(local_budget(s)));
    EXPECT_TRUE(budget_exhausted(0));
    EXPECT_FALSE(budget_exhausted(1));
}

TEST(CapacityModel, VariantDispatch) {
    CapacitySnapshot s;
    s.free_space = 1000;
    s.max_usage = 1000;
    s.min_free = 300;
    s.current_usage = 200;
    EXPECT_EQ(budget(s, CapacityVariant::Local), local_budget(s));
    EXPECT_EQ(budget(s, CapacityVariant::Remote), remote_budget(s));
    EXPECT_NE(describe(s, CapacityVariant::Remote).find("free_to_use"), std::string::npos);
}
