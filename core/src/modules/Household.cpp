#include "modules/Household.h"

#include <algorithm>
#include <cmath>
#include <random>

#include "kernel/Config.h"
#include "modules/Finance.h"
#include "modules/RegionPolicy.h"
#include "utils/EventLog.h"
#include "utils/Validation.h"

using namespace TuningConstants;

namespace {
IncomeTier drawIncomeTier(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    const double u = uni(rng);
    if (u < kLowIncomeShare) return IncomeTier::Low;
    if (u < kLowIncomeShare + kMidIncomeShare) return IncomeTier::Mid;
    return IncomeTier::High;
}
}

double incomeWeight(IncomeTier tier) {
    switch (tier) {
        case IncomeTier::Low: return kIncomeWeightLow;
        case IncomeTier::Mid: return kIncomeWeightMid;
        case IncomeTier::High: return kIncomeWeightHigh;
    }
    return kIncomeWeightHigh;
}

const char* incomeTierName(IncomeTier tier) {
    switch (tier) {
        case IncomeTier::Low: return "low";
        case IncomeTier::Mid: return "mid";
        case IncomeTier::High: return "high";
    }
    return "unknown";
}

double socialNormTarget(double rawFraction) {
    const double raw = std::clamp(rawFraction, 0.0, 1.0);
    if (raw > 0.5) {
        return std::min(1.0, raw * kNormAmplify);
    }
    return raw * kNormBuffer + kBaseDecency;
}

Household::Household(std::uint32_t id, std::uint32_t regionId, IncomeTier tier, GridPos pos,
                     const BehaviorState& initial)
    : id_(id), regionId_(regionId), tier_(tier), pos_(pos), state_(initial) {
    Validation::requireUnitInterval("attitude", state_.attitude);
    Validation::requireUnitInterval("subjectiveNorm", state_.subjectiveNorm);
    Validation::requireUnitInterval("perceivedControl", state_.perceivedControl);
}

Household Household::generate(std::uint32_t id, std::uint32_t regionId, const RegionProfile& profile,
                              GridPos pos, std::mt19937_64& rng) {
    std::bernoulli_distribution startsCompliant(profile.initialCompliance);
    std::uniform_real_distribution<double> jitter(-kAttitudeJitter, kAttitudeJitter);
    std::normal_distribution<double> control(kControlMean, kControlStd);

    const IncomeTier tier = drawIncomeTier(rng);

    BehaviorState initial;
    initial.compliant = startsCompliant(rng);
    // Survey baseline: compliant households start with a favourable attitude
    initial.attitude = clamp01((initial.compliant ? kCompliantAttitude : kNonCompliantAttitude) + jitter(rng));
    initial.perceivedControl = std::clamp(control(rng), kControlMin, 1.0);
    initial.subjectiveNorm = kNeutralNorm;
    initial.utility = 0.0;

    return Household(id, regionId, tier, pos, initial);
}

void Household::step(StepContext& ctx) {
    RegionPolicy& region = ctx.region(regionId_);

    updateAttitude(region);
    updateSocialNorm(ctx);

    std::normal_distribution<double> noise(0.0, kUtilityNoiseStd);
    decide(region, noise(ctx.rng));

    tryRedeem(ctx, region);
}

void Household::updateAttitude(const RegionPolicy& region) {
    double attitude = state_.attitude - region.profile().decayRate;

    // IEC boost saturates with intensity (never more than kEducationBoost per tick)
    attitude += region.educationIntensity() * kEducationBoost;

    if (region.enforcementIntensity() > kReactanceThreshold) {
        attitude -= kReactancePenalty;
    }

    state_.attitude = clamp01(attitude);
}

void Household::updateSocialNorm(const StepContext& ctx) {
    std::uint32_t total = 0;
    std::uint32_t compliantCount = 0;

    for (const auto& nb : ctx.space.neighbors(pos_, kNormRadius, true)) {
        if (nb.kind != AgentKind::Household || nb.region != regionId_ || nb.id == id_) continue;
        const Household* other = ctx.household(nb);
        if (!other) continue;
        total++;
        if (other->compliant()) compliantCount++;
    }

    const double target = total > 0
        ? socialNormTarget(static_cast<double>(compliantCount) / total)
        : kNeutralNorm;

    state_.subjectiveNorm = clamp01((1.0 - kNormSmoothing) * state_.subjectiveNorm + kNormSmoothing * target);
}

double Household::computeUtility(const RegionPolicy& region, double noise) const {
    const double tpb = kAttitudeWeight * state_.attitude +
                       kNormWeight * state_.subjectiveNorm +
                       kControlWeight * state_.perceivedControl;

    const double incentivePull = redeemed_ ? 0.0 : region.incentivePerCapita() / kMoneyScale;
    const double expectedFine = region.fineAmount() / kMoneyScale * region.enforcementIntensity();

    // Incentives earned and fines avoided both offset the effort of segregating
    const double netCost = region.profile().effortCost - incomeWeight(tier_) * (incentivePull + expectedFine);

    return tpb - netCost + noise;
}

double Household::complianceThreshold(const RegionPolicy& region) const {
    const double strength = std::min(1.0, region.incentivePerCapita() / kMoneyScale);
    return kComplianceThreshold - kIncentiveThresholdRelief * strength;
}

double Household::decide(const RegionPolicy& region, double noise) {
    state_.utility = computeUtility(region, noise);
    state_.compliant = state_.utility > complianceThreshold(region);
    return state_.utility;
}

bool Household::getFined(double amount, FinanceLedger& finance, std::uint64_t tick) {
    if (lastFinedTick_ == tick) {
        return false;
    }
    lastFinedTick_ = tick;
    state_.utility -= kFineUtilityPenalty;
    state_.attitude = clamp01(state_.attitude - kFineAttitudePenalty);
    finesReceived_++;
    finance.recordFine(amount);
    return true;
}

bool Household::claimIncentive(RegionPolicy& region, FinanceLedger& finance) {
    if (redeemed_) {
        return false;
    }
    if (!region.giveReward(region.incentivePerCapita(), finance)) {
        return false;
    }
    redeemed_ = true;
    return true;
}

void Household::tryRedeem(StepContext& ctx, RegionPolicy& region) {
    if (!state_.compliant || redeemed_ || region.incentivePerCapita() <= 0.0) {
        return;
    }
    std::bernoulli_distribution visits(kRedemptionChance);
    if (!visits(ctx.rng)) {
        return;
    }
    if (!claimIncentive(region, ctx.finance) && ctx.log) {
        ctx.log->record(ctx.tick, EventType::RewardDenied, static_cast<std::int32_t>(regionId_),
                        region.incentivePerCapita());
    }
}

double Household::clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}
