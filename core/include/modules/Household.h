#ifndef HOUSEHOLD_MODULE_H
#define HOUSEHOLD_MODULE_H

#include <cstdint>
#include <limits>
#include <random>

#include "kernel/Agent.h"

struct RegionProfile;
struct FinanceLedger;
class RegionPolicy;

enum class IncomeTier : std::uint8_t {
    Low = 0,
    Mid = 1,
    High = 2
};

// Price sensitivity: lower tiers weigh incentives and fines more.
double incomeWeight(IncomeTier tier);
const char* incomeTierName(IncomeTier tier);

// Asymmetric neighbourhood influence: amplify compliant neighbourhoods,
// buffer non-compliant ones above a floor. Monotonic in `rawFraction`, in [0,1].
double socialNormTarget(double rawFraction);

// Theory of Planned Behavior state; the first three fields stay in [0,1].
struct BehaviorState {
    double attitude = 0.5;
    double subjectiveNorm = 0.5;
    double perceivedControl = 0.7;
    double utility = 0.0;
    bool compliant = false;
};

class Household : public SteppingAgent {
public:
    // Throws std::invalid_argument if attitude, norm or control lies outside [0,1].
    Household(std::uint32_t id, std::uint32_t regionId, IncomeTier tier, GridPos pos,
              const BehaviorState& initial);

    // Draws income tier, initial compliance, attitude and perceived control.
    static Household generate(std::uint32_t id, std::uint32_t regionId, const RegionProfile& profile,
                              GridPos pos, std::mt19937_64& rng);

    // Attitude -> social norm -> decision -> redemption attempt.
    void step(StepContext& ctx) override;
    AgentHandle handle() const override { return {AgentKind::Household, regionId_, id_}; }
    GridPos position() const override { return pos_; }

    void updateAttitude(const RegionPolicy& region);
    void updateSocialNorm(const StepContext& ctx);

    // Pure utility for a given noise draw.
    double computeUtility(const RegionPolicy& region, double noise) const;
    double complianceThreshold(const RegionPolicy& region) const;
    // Stores utility and compliance; returns the utility.
    double decide(const RegionPolicy& region, double noise);

    // Called by enforcement units. At most one fine per tick, however many
    // units stand in range; returns false when this tick was already fined.
    bool getFined(double amount, FinanceLedger& finance, std::uint64_t tick);

    // Claims the region's per-capita incentive once per quarter (no chance roll).
    bool claimIncentive(RegionPolicy& region, FinanceLedger& finance);
    void resetRedemption() { redeemed_ = false; }

    std::uint32_t id() const { return id_; }
    std::uint32_t regionId() const { return regionId_; }
    IncomeTier incomeTier() const { return tier_; }
    const BehaviorState& state() const { return state_; }
    BehaviorState& stateMut() { return state_; }
    bool compliant() const { return state_.compliant; }
    bool redeemed() const { return redeemed_; }
    std::uint32_t finesReceived() const { return finesReceived_; }
    bool finedAt(std::uint64_t tick) const { return lastFinedTick_ == tick; }

private:
    std::uint32_t id_;
    std::uint32_t regionId_;
    IncomeTier tier_;
    GridPos pos_;
    BehaviorState state_;
    bool redeemed_ = false;
    std::uint32_t finesReceived_ = 0;
    std::uint64_t lastFinedTick_ = std::numeric_limits<std::uint64_t>::max();

    void tryRedeem(StepContext& ctx, RegionPolicy& region);
    static double clamp01(double value);
};

#endif
