#include <gtest/gtest.h>
#include "modules/Household.h"
#include "modules/RegionPolicy.h"
#include "kernel/SpatialGrid.h"

#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

namespace {
RegionProfile profile(std::uint32_t households = 10) {
    RegionProfile p;
    p.name = "Test";
    p.households = households;
    p.effortCost = 0.2;
    p.decayRate = 0.005;
    p.fineAmount = 500.0;
    p.centerX = 10;
    p.centerY = 10;
    return p;
}

BehaviorState neutral(bool compliant = false) {
    BehaviorState s;
    s.attitude = 0.5;
    s.subjectiveNorm = 0.5;
    s.perceivedControl = 0.7;
    s.compliant = compliant;
    return s;
}

// One region of `n` households laid out along a diagonal, far enough apart
// that nobody sees a neighbour unless a test places one.
struct World {
    MultiGrid grid{40, 40};
    std::vector<RegionPolicy> regions;
    FinanceLedger finance;
    std::mt19937_64 rng{11};

    explicit World(std::uint32_t n = 10, IncomeTier tier = IncomeTier::Low) {
        regions.emplace_back(0, profile(n), EnforcementSettings{});
        for (std::uint32_t i = 0; i < n; ++i) {
            const int c = static_cast<int>(i) * 3;
            regions[0].addHousehold(Household(i, 0, tier, {c, c}, neutral()), grid);
        }
    }

    RegionPolicy& region() { return regions[0]; }
    Household& household(std::uint32_t id) { return *region().findHouseholdMut(id); }
    StepContext ctx() { return StepContext{rng, grid, regions, finance, nullptr, 0}; }
};
}

TEST(HouseholdTest, NormTargetIsAsymmetric) {
    // Bad neighbourhoods are buffered above a floor, good ones amplified
    EXPECT_DOUBLE_EQ(socialNormTarget(0.0), 0.2);
    EXPECT_DOUBLE_EQ(socialNormTarget(0.5), 0.6);
    EXPECT_DOUBLE_EQ(socialNormTarget(0.6), 0.72);
    EXPECT_DOUBLE_EQ(socialNormTarget(1.0), 1.0);
}

TEST(HouseholdTest, NormTargetMonotonicAndBounded) {
    double prev = socialNormTarget(0.0);
    for (int i = 1; i <= 100; ++i) {
        const double v = socialNormTarget(i / 100.0);
        EXPECT_GE(v, prev);
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
        prev = v;
    }
    EXPECT_DOUBLE_EQ(socialNormTarget(-3.0), socialNormTarget(0.0));
    EXPECT_DOUBLE_EQ(socialNormTarget(4.0), 1.0);
}

TEST(HouseholdTest, ConstructorRejectsOutOfRangeState) {
    BehaviorState s;
    s.attitude = 1.7;
    EXPECT_THROW(Household(0, 0, IncomeTier::Mid, {0, 0}, s), std::invalid_argument);

    s = BehaviorState{};
    s.subjectiveNorm = -0.3;
    EXPECT_THROW(Household(0, 0, IncomeTier::Mid, {0, 0}, s), std::invalid_argument);

    s = BehaviorState{};
    s.perceivedControl = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Household(0, 0, IncomeTier::Mid, {0, 0}, s), std::invalid_argument);

    s = BehaviorState{};
    s.attitude = 1.0;
    s.subjectiveNorm = 0.0;
    Household edge(0, 0, IncomeTier::Mid, {0, 0}, s);
    EXPECT_DOUBLE_EQ(edge.state().attitude, 1.0);
    EXPECT_DOUBLE_EQ(edge.state().subjectiveNorm, 0.0);
}

TEST(HouseholdTest, UtilityWithoutFunding) {
    World w(10, IncomeTier::High);
    const Household& h = w.household(0);

    // tpb = 0.4*0.5 + 0.3*0.5 + 0.3*0.7 = 0.56, net cost = effort = 0.2
    EXPECT_NEAR(h.computeUtility(w.region(), 0.0), 0.36, 1e-12);
    EXPECT_NEAR(h.computeUtility(w.region(), 0.1), 0.46, 1e-12);
    EXPECT_DOUBLE_EQ(h.complianceThreshold(w.region()), 0.5);
}

TEST(HouseholdTest, IncentiveAndFineOffsetEffort) {
    World w(10, IncomeTier::Low);
    // 200 pesos per household, full enforcement intensity
    w.region().updatePolicy(0.0, 375000.0, 2000.0);
    const Household& h = w.household(0);

    // net cost = 0.2 - 1.5 * (0.2 + 0.5 * 1.0) = -0.85
    EXPECT_NEAR(h.computeUtility(w.region(), 0.0), 0.56 + 0.85, 1e-12);
    EXPECT_NEAR(h.complianceThreshold(w.region()), 0.5 - 0.05 * 0.2, 1e-12);
}

TEST(HouseholdTest, RedemptionRemovesIncentivePull) {
    World w(10, IncomeTier::Low);
    w.region().updatePolicy(0.0, 375000.0, 2000.0);
    Household& h = w.household(0);

    ASSERT_TRUE(h.claimIncentive(w.region(), w.finance));
    EXPECT_NEAR(h.computeUtility(w.region(), 0.0), 0.56 - (0.2 - 1.5 * 0.5), 1e-12);
}

TEST(HouseholdTest, PoorerHouseholdsRespondMoreToMoney) {
    World low(1, IncomeTier::Low);
    World high(1, IncomeTier::High);
    low.region().updatePolicy(0.0, 0.0, 300.0);
    high.region().updatePolicy(0.0, 0.0, 300.0);

    EXPECT_GT(low.household(0).computeUtility(low.region(), 0.0),
              high.household(0).computeUtility(high.region(), 0.0));
}

TEST(HouseholdTest, DecideComparesAgainstThreshold) {
    World w(10, IncomeTier::High);
    Household& h = w.household(0);

    EXPECT_NEAR(h.decide(w.region(), 0.0), 0.36, 1e-12);
    EXPECT_FALSE(h.compliant());

    h.decide(w.region(), 0.2);
    EXPECT_TRUE(h.compliant());
    EXPECT_NEAR(h.state().utility, 0.56, 1e-12);
}

TEST(HouseholdTest, GetFinedPenalizesAndRecords) {
    World w;
    Household& h = w.household(0);
    h.decide(w.region(), 0.0);
    const double utility = h.state().utility;

    EXPECT_TRUE(h.getFined(500.0, w.finance, 3));

    EXPECT_NEAR(h.state().utility, utility - 0.5, 1e-12);
    EXPECT_NEAR(h.state().attitude, 0.48, 1e-12);
    EXPECT_EQ(h.finesReceived(), 1u);
    EXPECT_EQ(w.finance.finesIssued, 1u);
    EXPECT_DOUBLE_EQ(w.finance.finesCollected, 500.0);
    EXPECT_DOUBLE_EQ(w.finance.recentFines, 500.0);
    EXPECT_TRUE(h.finedAt(3));
}

TEST(HouseholdTest, FinedAtMostOncePerTick) {
    World w;
    Household& h = w.household(0);

    EXPECT_TRUE(h.getFined(500.0, w.finance, 0));
    EXPECT_FALSE(h.getFined(500.0, w.finance, 0));
    EXPECT_FALSE(h.getFined(500.0, w.finance, 0));
    EXPECT_EQ(h.finesReceived(), 1u);
    EXPECT_DOUBLE_EQ(w.finance.finesCollected, 500.0);
    EXPECT_NEAR(h.state().attitude, 0.48, 1e-12);

    EXPECT_TRUE(h.getFined(500.0, w.finance, 1));
    EXPECT_EQ(h.finesReceived(), 2u);
    EXPECT_FALSE(h.finedAt(0));
}

TEST(HouseholdTest, AttitudeDecaysWithoutEducation) {
    World w;
    Household& h = w.household(0);
    h.updateAttitude(w.region());
    EXPECT_NEAR(h.state().attitude, 0.495, 1e-12);
}

TEST(HouseholdTest, EducationOutweighsDecay) {
    World w;
    // 650 per household for full intensity
    w.region().updatePolicy(10 * 650.0, 0.0, 0.0);
    Household& h = w.household(0);
    h.updateAttitude(w.region());
    EXPECT_NEAR(h.state().attitude, 0.5 - 0.005 + 0.02, 1e-12);
}

TEST(HouseholdTest, HeavyEnforcementCausesReactance) {
    World w;
    w.region().updatePolicy(0.0, 0.9 * 375000.0, 0.0);
    Household& h = w.household(0);
    h.updateAttitude(w.region());
    EXPECT_NEAR(h.state().attitude, 0.5 - 0.005 - 0.002, 1e-12);

    // At the threshold there is no push-back
    World calm;
    calm.region().updatePolicy(0.0, 0.8 * 375000.0, 0.0);
    calm.household(0).updateAttitude(calm.region());
    EXPECT_NEAR(calm.household(0).state().attitude, 0.495, 1e-12);
}

TEST(HouseholdTest, AttitudeClampsAtZero) {
    World w;
    Household& h = w.household(0);
    h.stateMut().attitude = 0.001;
    h.updateAttitude(w.region());
    EXPECT_DOUBLE_EQ(h.state().attitude, 0.0);
}

TEST(HouseholdTest, SocialNormFollowsSameRegionNeighbours) {
    MultiGrid grid(20, 20);
    std::vector<RegionPolicy> regions;
    regions.emplace_back(0, profile(4), EnforcementSettings{});
    regions.emplace_back(1, profile(2), EnforcementSettings{});

    regions[0].addHousehold(Household(0, 0, IncomeTier::Mid, {5, 5}, neutral(false)), grid);
    regions[0].addHousehold(Household(1, 0, IncomeTier::Mid, {6, 5}, neutral(true)), grid);
    regions[0].addHousehold(Household(2, 0, IncomeTier::Mid, {7, 7}, neutral(true)), grid);
    regions[0].addHousehold(Household(3, 0, IncomeTier::Mid, {15, 15}, neutral(false)), grid);
    // Another barangay's violators next door do not count
    regions[1].addHousehold(Household(4, 1, IncomeTier::Mid, {5, 6}, neutral(false)), grid);
    regions[1].addHousehold(Household(5, 1, IncomeTier::Mid, {4, 4}, neutral(false)), grid);

    FinanceLedger finance;
    std::mt19937_64 rng(1);
    StepContext ctx{rng, grid, regions, finance, nullptr, 0};

    Household& h = *regions[0].findHouseholdMut(0);
    h.updateSocialNorm(ctx);
    // Both visible same-region neighbours comply: target 1.0
    EXPECT_NEAR(h.state().subjectiveNorm, 0.8 * 0.5 + 0.2 * 1.0, 1e-12);

    // Nobody in view: drift toward the neutral target
    Household& isolated = *regions[0].findHouseholdMut(3);
    isolated.stateMut().subjectiveNorm = 1.0;
    isolated.updateSocialNorm(ctx);
    EXPECT_NEAR(isolated.state().subjectiveNorm, 0.8 * 1.0 + 0.2 * 0.5, 1e-12);
}

TEST(HouseholdTest, ClaimIncentiveOncePerQuarter) {
    World w;
    w.region().updatePolicy(0.0, 0.0, 2000.0);
    Household& h = w.household(0);

    EXPECT_TRUE(h.claimIncentive(w.region(), w.finance));
    EXPECT_TRUE(h.redeemed());
    EXPECT_FALSE(h.claimIncentive(w.region(), w.finance));
    EXPECT_DOUBLE_EQ(w.region().cashOnHand(), 1800.0);
    EXPECT_DOUBLE_EQ(w.finance.incentivesPaid, 200.0);

    w.region().resetQuarter();
    EXPECT_FALSE(h.redeemed());
    EXPECT_TRUE(h.claimIncentive(w.region(), w.finance));
    EXPECT_DOUBLE_EQ(w.region().cashOnHand(), 1600.0);
}

TEST(HouseholdTest, ClaimFailsWhenPoolIsEmpty) {
    World w;
    w.region().updatePolicy(0.0, 0.0, 2000.0);
    ASSERT_TRUE(w.region().giveReward(1900.0, w.finance));

    Household& h = w.household(0);
    EXPECT_FALSE(h.claimIncentive(w.region(), w.finance));
    EXPECT_FALSE(h.redeemed());
    EXPECT_DOUBLE_EQ(w.region().cashOnHand(), 100.0);
}

TEST(HouseholdTest, StepKeepsStateInUnitInterval) {
    World w(10);
    w.region().updatePolicy(10 * 650.0, 375000.0, 5000.0);
    StepContext ctx = w.ctx();

    for (int t = 0; t < 300; ++t) {
        for (auto& h : w.region().householdsMut()) {
            h.step(ctx);
            const auto& s = h.state();
            ASSERT_GE(s.attitude, 0.0);
            ASSERT_LE(s.attitude, 1.0);
            ASSERT_GE(s.subjectiveNorm, 0.0);
            ASSERT_LE(s.subjectiveNorm, 1.0);
            ASSERT_GE(s.perceivedControl, 0.0);
            ASSERT_LE(s.perceivedControl, 1.0);
        }
    }
}

TEST(HouseholdTest, GenerateIsSeededAndBounded) {
    RegionProfile p = profile();
    p.initialCompliance = 0.5;

    std::mt19937_64 a(99), b(99);
    int compliant = 0;
    for (std::uint32_t i = 0; i < 400; ++i) {
        Household x = Household::generate(i, 0, p, {1, 1}, a);
        Household y = Household::generate(i, 0, p, {1, 1}, b);
        EXPECT_EQ(x.incomeTier(), y.incomeTier());
        EXPECT_EQ(x.compliant(), y.compliant());
        EXPECT_DOUBLE_EQ(x.state().attitude, y.state().attitude);
        EXPECT_GE(x.state().perceivedControl, 0.2);
        EXPECT_LE(x.state().perceivedControl, 1.0);
        EXPECT_DOUBLE_EQ(x.state().subjectiveNorm, 0.5);
        if (x.compliant()) {
            compliant++;
            EXPECT_GT(x.state().attitude, 0.6);
        } else {
            EXPECT_LT(x.state().attitude, 0.36);
        }
    }
    EXPECT_GT(compliant, 120);
    EXPECT_LT(compliant, 280);
}
