#ifndef ENFORCEMENT_H
#define ENFORCEMENT_H

#include <cstdint>
#include <unordered_set>

#include "kernel/Agent.h"
#include "kernel/Config.h"

class RegionPolicy;

// Shared by every unit a region hires.
struct EnforcementSettings {
    TargetingPolicy targeting = TargetingPolicy::NearestViolator;
    int patrolRange = 5;
    int catchRadius = 1;
    double unitCost = 45000.0;          // per unit per quarter
    double saturation = 375000.0;       // quarterly spend for intensity 1.0
};

enum class PatrolMode : std::uint8_t {
    Patrol = 0,
    Pursuit = 1
};

class EnforcementUnit : public SteppingAgent {
public:
    EnforcementUnit(std::uint32_t id, std::uint32_t regionId, GridPos pos, const EnforcementSettings& settings);

    // Move (pursuit or patrol), then fine every violator inside the catch radius.
    void step(StepContext& ctx) override;
    AgentHandle handle() const override { return {AgentKind::Enforcement, regionId_, id_}; }
    GridPos position() const override { return pos_; }

    // Moves the unit on the spatial index (spawn jitter, scripted scenarios).
    void relocate(SpatialIndex& space, GridPos pos);

    std::uint32_t id() const { return id_; }
    std::uint32_t regionId() const { return regionId_; }
    PatrolMode mode() const { return mode_; }
    std::uint32_t finesIssued() const { return finesIssued_; }
    std::size_t visitedCount() const { return visited_.size(); }
    std::uint32_t sweepsCompleted() const { return sweepsCompleted_; }

private:
    std::uint32_t id_;
    std::uint32_t regionId_;
    GridPos pos_;
    TargetingPolicy targeting_;
    int patrolRange_;
    int catchRadius_;
    PatrolMode mode_ = PatrolMode::Patrol;
    std::uint32_t finesIssued_ = 0;

    // Systematic sweep memory (household ids)
    std::unordered_set<std::uint32_t> visited_;
    std::uint32_t sweepsCompleted_ = 0;

    const Household* nearestViolator(const StepContext& ctx, const RegionPolicy& region) const;
    const Household* nearestUnvisited(const RegionPolicy& region);
    GridPos stepToward(const SpatialIndex& space, GridPos target) const;
    GridPos randomStep(const SpatialIndex& space, std::mt19937_64& rng) const;
    void markVisited(const StepContext& ctx);
    void catchViolators(StepContext& ctx, RegionPolicy& region);
};

#endif
