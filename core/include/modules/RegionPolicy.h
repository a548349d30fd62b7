#ifndef REGION_POLICY_H
#define REGION_POLICY_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "kernel/Config.h"
#include "modules/Enforcement.h"
#include "modules/Finance.h"
#include "modules/Household.h"

class SpatialIndex;
class EventLog;

struct ComplianceStats {
    std::uint32_t compliant = 0;
    std::uint32_t total = 0;
    double rate = 0.0;   // 0.0 for an empty region
};

/**
 * One barangay: owns its households and enforcement units, turns a quarterly
 * allocation into behavioural intensities and keeps the redeemable incentive
 * pool. Households and units are released only through this class.
 */
class RegionPolicy {
public:
    RegionPolicy(std::uint32_t id, const RegionProfile& profile, const EnforcementSettings& settings);

    // Population (households keep contiguous global ids)
    void addHousehold(const Household& household, SpatialIndex& space);

    // Policy translation
    void updatePolicy(double educationFund, double enforcementFund, double incentiveFund);
    std::uint32_t targetEnforcementCount() const;
    // Hires or retires (newest first) until headcount == targetEnforcementCount().
    std::uint32_t adjustEnforcementAgents(SpatialIndex& space, std::mt19937_64& rng,
                                          EventLog* log = nullptr, std::uint64_t tick = 0);

    // Compliance (pure O(population) scan)
    double getLocalCompliance() const;
    ComplianceStats computeCompliance() const;

    // Pays `amount` from cash on hand; false (and no change) if it cannot.
    bool giveReward(double amount, FinanceLedger& finance);

    // Per-tick refresh of cached statistics
    void step();
    // Quarter boundary: households may claim the incentive again
    void resetQuarter();

    // Lookup
    const Household* findHousehold(std::uint32_t householdId) const;
    Household* findHouseholdMut(std::uint32_t householdId);

    // Access
    std::uint32_t id() const { return id_; }
    const std::string& name() const { return profile_.name; }
    const RegionProfile& profile() const { return profile_; }
    const EnforcementSettings& settings() const { return settings_; }
    GridPos center() const { return {profile_.centerX, profile_.centerY}; }
    std::uint32_t population() const { return static_cast<std::uint32_t>(households_.size()); }
    std::uint32_t firstHouseholdId() const { return firstHouseholdId_; }

    const FundPools& funds() const { return funds_; }
    double educationIntensity() const { return education_intensity_; }
    double enforcementIntensity() const { return enforcement_intensity_; }
    double incentivePerCapita() const { return incentive_per_capita_; }
    double cashOnHand() const { return cash_on_hand_; }
    double fineAmount() const { return profile_.fineAmount; }
    const ComplianceStats& stats() const { return stats_; }

    const std::vector<Household>& households() const { return households_; }
    std::vector<Household>& householdsMut() { return households_; }
    const std::vector<EnforcementUnit>& units() const { return units_; }
    std::vector<EnforcementUnit>& unitsMut() { return units_; }

private:
    std::uint32_t id_;
    RegionProfile profile_;
    EnforcementSettings settings_;

    std::vector<Household> households_;
    std::vector<EnforcementUnit> units_;
    std::uint32_t firstHouseholdId_ = 0;
    std::uint32_t nextUnitId_ = 0;

    FundPools funds_;
    double education_intensity_ = 0.0;
    double enforcement_intensity_ = 0.0;
    double incentive_per_capita_ = 0.0;
    double cash_on_hand_ = 0.0;

    ComplianceStats stats_;

    GridPos spawnPosition(const SpatialIndex& space, std::mt19937_64& rng) const;
};

#endif
