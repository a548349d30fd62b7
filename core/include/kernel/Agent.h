#pragma once

#include <cstdint>
#include <random>
#include <vector>
#include "kernel/SpatialGrid.h"

class RegionPolicy;
class Household;
class EventLog;
struct FinanceLedger;

// ---------- Step Context ----------
// Everything an agent may touch during one activation. Owned by the ledger;
// agents reach their region through `regionId` lookups, never stored pointers.
struct StepContext {
    std::mt19937_64& rng;
    SpatialIndex& space;
    std::vector<RegionPolicy>& regions;
    FinanceLedger& finance;
    EventLog* log = nullptr;
    std::uint64_t tick = 0;

    // Throws std::out_of_range for an unknown region id.
    RegionPolicy& region(std::uint32_t regionId) const;

    // nullptr when the handle does not name a household of a known region.
    Household* household(const AgentHandle& handle) const;
};

// ---------- Stepping Agent ----------
class SteppingAgent {
public:
    virtual ~SteppingAgent() = default;

    virtual void step(StepContext& ctx) = 0;
    virtual AgentHandle handle() const = 0;
    virtual GridPos position() const = 0;
};
