#include <gtest/gtest.h>
#include "modules/Enforcement.h"
#include "modules/Household.h"
#include "modules/RegionPolicy.h"
#include "kernel/SpatialGrid.h"

#include <algorithm>
#include <cstdlib>
#include <random>
#include <vector>

namespace {
BehaviorState behaviour(bool compliant) {
    BehaviorState s;
    s.compliant = compliant;
    return s;
}

struct Placement {
    GridPos pos;
    bool compliant;
};

struct Patrol {
    MultiGrid grid{30, 30};
    std::vector<RegionPolicy> regions;
    FinanceLedger finance;
    std::mt19937_64 rng{5};

    Patrol(const std::vector<Placement>& households, std::uint32_t units,
           TargetingPolicy targeting = TargetingPolicy::NearestViolator) {
        RegionProfile p;
        p.name = "Patrolled";
        p.households = static_cast<std::uint32_t>(households.size());
        p.centerX = 15;
        p.centerY = 15;

        EnforcementSettings settings;
        settings.targeting = targeting;
        regions.emplace_back(0, p, settings);

        for (std::uint32_t i = 0; i < households.size(); ++i) {
            regions[0].addHousehold(
                Household(i, 0, IncomeTier::Mid, households[i].pos, behaviour(households[i].compliant)), grid);
        }
        regions[0].updatePolicy(0.0, units * settings.unitCost, 0.0);
        regions[0].adjustEnforcementAgents(grid, rng);
    }

    RegionPolicy& region() { return regions[0]; }
    EnforcementUnit& unit(std::size_t i) { return region().unitsMut()[i]; }
    StepContext ctx() { return StepContext{rng, grid, regions, finance, nullptr, 0}; }
};

int chebyshev(GridPos a, GridPos b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}
}

TEST(EnforcementTest, PursuitStepsTowardViolator) {
    Patrol world({{{13, 10}, false}, {{28, 28}, true}}, 1);
    world.unit(0).relocate(world.grid, {10, 10});

    StepContext ctx = world.ctx();
    world.unit(0).step(ctx);

    EXPECT_EQ(world.unit(0).mode(), PatrolMode::Pursuit);
    EXPECT_EQ(world.unit(0).position(), (GridPos{11, 10}));
    EXPECT_EQ(world.grid.positionOf(world.unit(0).handle()), (GridPos{11, 10}));
    // Still two cells away: nobody fined yet
    EXPECT_EQ(world.finance.finesIssued, 0u);
}

// Equidistant violators: the lower household id wins regardless of scan order
TEST(EnforcementTest, TieGoesToLowerId) {
    Patrol world({{{13, 10}, false}, {{7, 10}, false}}, 1);
    world.unit(0).relocate(world.grid, {10, 10});

    StepContext ctx = world.ctx();
    world.unit(0).step(ctx);

    EXPECT_EQ(world.unit(0).position(), (GridPos{11, 10}));
}

TEST(EnforcementTest, ViolatorsOutsideRangeAreIgnored) {
    // Patrol range is 5; this violator is 8 cells away
    Patrol world({{{18, 10}, false}}, 1);
    world.unit(0).relocate(world.grid, {10, 10});

    StepContext ctx = world.ctx();
    world.unit(0).step(ctx);

    EXPECT_EQ(world.unit(0).mode(), PatrolMode::Patrol);
    EXPECT_EQ(chebyshev(world.unit(0).position(), {10, 10}), 1);
}

TEST(EnforcementTest, PatrolMovesOneCell) {
    Patrol world({{{2, 2}, true}, {{27, 27}, true}}, 1);
    world.unit(0).relocate(world.grid, {15, 15});
    StepContext ctx = world.ctx();

    GridPos prev = world.unit(0).position();
    for (int t = 0; t < 50; ++t) {
        world.unit(0).step(ctx);
        EXPECT_EQ(world.unit(0).mode(), PatrolMode::Patrol);
        EXPECT_EQ(chebyshev(world.unit(0).position(), prev), 1);
        EXPECT_TRUE(world.grid.inBounds(world.unit(0).position()));
        prev = world.unit(0).position();
    }
    EXPECT_EQ(world.finance.finesIssued, 0u);
}

TEST(EnforcementTest, CaughtViolatorFinedOncePerStep) {
    Patrol world({{{15, 15}, false}}, 3);
    ASSERT_EQ(world.region().units().size(), 3u);

    // Every unit starts within catch range of the violator
    world.unit(0).relocate(world.grid, {14, 15});
    world.unit(1).relocate(world.grid, {16, 15});
    world.unit(2).relocate(world.grid, {15, 16});

    StepContext ctx = world.ctx();
    const Household& violator = *world.region().findHousehold(0);

    for (int t = 1; t <= 5; ++t) {
        ctx.tick = static_cast<std::uint64_t>(t);
        for (auto& u : world.region().unitsMut()) {
            u.step(ctx);
        }
        EXPECT_EQ(violator.finesReceived(), static_cast<std::uint32_t>(t));
        EXPECT_EQ(world.finance.finesIssued, static_cast<std::uint64_t>(t));
    }

    std::uint32_t issuedByUnits = 0;
    for (const auto& u : world.region().units()) {
        EXPECT_EQ(u.position(), (GridPos{15, 15}));
        issuedByUnits += u.finesIssued();
    }
    EXPECT_EQ(issuedByUnits, 5u);
    EXPECT_DOUBLE_EQ(world.finance.finesCollected, 5 * 500.0);
}

TEST(EnforcementTest, CompliantHouseholdsAreNotFined) {
    Patrol world({{{5, 5}, true}}, 1);
    world.unit(0).relocate(world.grid, {5, 5});

    StepContext ctx = world.ctx();
    world.unit(0).step(ctx);

    EXPECT_EQ(world.finance.finesIssued, 0u);
    EXPECT_EQ(world.region().findHousehold(0)->finesReceived(), 0u);
}

TEST(EnforcementTest, UnitsOnlyFineTheirOwnRegion) {
    Patrol world({{{20, 20}, true}}, 1);

    RegionProfile other;
    other.name = "Neighbour";
    other.households = 1;
    other.centerX = 5;
    other.centerY = 5;
    world.regions.emplace_back(1, other, EnforcementSettings{});
    world.regions[1].addHousehold(Household(1, 1, IncomeTier::Low, {5, 5}, behaviour(false)), world.grid);

    world.unit(0).relocate(world.grid, {5, 6});
    StepContext ctx = world.ctx();
    for (int t = 0; t < 5; ++t) {
        world.unit(0).step(ctx);
    }

    EXPECT_EQ(world.unit(0).mode(), PatrolMode::Patrol);
    EXPECT_EQ(world.regions[1].findHousehold(1)->finesReceived(), 0u);
    EXPECT_EQ(world.finance.finesIssued, 0u);
}

TEST(EnforcementTest, SystematicSweepVisitsEveryHousehold) {
    Patrol world({{{2, 2}, true}, {{20, 3}, true}, {{8, 25}, true}, {{27, 27}, true}}, 1,
                 TargetingPolicy::SystematicSweep);
    world.unit(0).relocate(world.grid, {15, 15});
    StepContext ctx = world.ctx();

    int steps = 0;
    while (world.unit(0).sweepsCompleted() == 0 && steps < 500) {
        world.unit(0).step(ctx);
        ++steps;
    }

    EXPECT_EQ(world.unit(0).sweepsCompleted(), 1u);
    EXPECT_LT(steps, 500);
}

TEST(EnforcementTest, SweepStillFinesViolators) {
    Patrol world({{{4, 4}, false}, {{25, 25}, true}}, 1, TargetingPolicy::SystematicSweep);
    world.unit(0).relocate(world.grid, {6, 6});
    StepContext ctx = world.ctx();

    world.unit(0).step(ctx);
    world.unit(0).step(ctx);

    EXPECT_GE(world.region().findHousehold(0)->finesReceived(), 1u);
}
