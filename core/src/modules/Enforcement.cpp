#include "modules/Enforcement.h"

#include <limits>
#include <random>

#include "modules/Household.h"
#include "modules/RegionPolicy.h"

namespace {
// Strictly closer wins; equal distance falls back to the lower household id.
bool closer(double dist, std::uint32_t id, double bestDist, std::uint32_t bestId) {
    if (dist < bestDist) return true;
    return dist == bestDist && id < bestId;
}
}

EnforcementUnit::EnforcementUnit(std::uint32_t id, std::uint32_t regionId, GridPos pos,
                                 const EnforcementSettings& settings)
    : id_(id),
      regionId_(regionId),
      pos_(pos),
      targeting_(settings.targeting),
      patrolRange_(settings.patrolRange),
      catchRadius_(settings.catchRadius) {}

void EnforcementUnit::step(StepContext& ctx) {
    RegionPolicy& region = ctx.region(regionId_);

    const Household* target = targeting_ == TargetingPolicy::SystematicSweep
        ? nearestUnvisited(region)
        : nearestViolator(ctx, region);

    GridPos next = pos_;
    if (target) {
        mode_ = PatrolMode::Pursuit;
        next = stepToward(ctx.space, target->position());
    } else {
        mode_ = PatrolMode::Patrol;
        next = randomStep(ctx.space, ctx.rng);
    }

    if (next != pos_) {
        ctx.space.move(handle(), next);
        pos_ = next;
    }

    if (targeting_ == TargetingPolicy::SystematicSweep) {
        markVisited(ctx);
    }
    catchViolators(ctx, region);
}

void EnforcementUnit::relocate(SpatialIndex& space, GridPos pos) {
    space.move(handle(), pos);
    pos_ = pos;
}

const Household* EnforcementUnit::nearestViolator(const StepContext& ctx, const RegionPolicy& region) const {
    const Household* best = nullptr;
    double bestDist = std::numeric_limits<double>::max();

    for (const auto& nb : ctx.space.neighbors(pos_, patrolRange_, true)) {
        if (nb.kind != AgentKind::Household || nb.region != regionId_) continue;
        const Household* h = region.findHousehold(nb.id);
        if (!h || h->compliant()) continue;

        const double dist = euclidean(pos_, h->position());
        if (!best || closer(dist, h->id(), bestDist, best->id())) {
            best = h;
            bestDist = dist;
        }
    }
    return best;
}

const Household* EnforcementUnit::nearestUnvisited(const RegionPolicy& region) {
    const auto& households = region.households();
    if (households.empty()) {
        return nullptr;
    }
    if (visited_.size() >= households.size()) {
        // Sweep finished: forget and patrol for this tick
        visited_.clear();
        sweepsCompleted_++;
        return nullptr;
    }

    const Household* best = nullptr;
    double bestDist = std::numeric_limits<double>::max();
    for (const auto& h : households) {
        if (visited_.count(h.id())) continue;
        const double dist = euclidean(pos_, h.position());
        if (!best || closer(dist, h.id(), bestDist, best->id())) {
            best = &h;
            bestDist = dist;
        }
    }
    return best;
}

GridPos EnforcementUnit::stepToward(const SpatialIndex& space, GridPos target) const {
    if (pos_ == target) {
        return pos_;
    }
    GridPos best = pos_;
    double bestDist = std::numeric_limits<double>::max();
    for (const auto& candidate : space.legalMoves(pos_)) {
        const double dist = euclidean(candidate, target);
        if (dist < bestDist) {
            best = candidate;
            bestDist = dist;
        }
    }
    return best;
}

GridPos EnforcementUnit::randomStep(const SpatialIndex& space, std::mt19937_64& rng) const {
    const auto moves = space.legalMoves(pos_);
    if (moves.empty()) {
        return pos_;
    }
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng)];
}

void EnforcementUnit::markVisited(const StepContext& ctx) {
    for (const auto& nb : ctx.space.neighbors(pos_, catchRadius_, true)) {
        if (nb.kind == AgentKind::Household && nb.region == regionId_) {
            visited_.insert(nb.id);
        }
    }
}

void EnforcementUnit::catchViolators(StepContext& ctx, RegionPolicy& region) {
    // No detection roll: anyone non-compliant this close is cited, unless
    // another unit already cited them this tick
    for (const auto& nb : ctx.space.neighbors(pos_, catchRadius_, true)) {
        if (nb.kind != AgentKind::Household || nb.region != regionId_) continue;
        Household* h = region.findHouseholdMut(nb.id);
        if (!h || h->compliant()) continue;
        if (h->getFined(region.fineAmount(), ctx.finance, ctx.tick)) {
            finesIssued_++;
        }
    }
}
