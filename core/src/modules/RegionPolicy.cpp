#include "modules/RegionPolicy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "kernel/SpatialGrid.h"
#include "utils/EventLog.h"
#include "utils/Validation.h"

namespace {
constexpr int kSpawnJitter = 2;   // cells around the barangay hall
}

// ---------- StepContext lookups ----------

RegionPolicy& StepContext::region(std::uint32_t regionId) const {
    if (regionId >= regions.size()) {
        throw std::out_of_range("unknown region id " + std::to_string(regionId));
    }
    return regions[regionId];
}

Household* StepContext::household(const AgentHandle& handle) const {
    if (handle.kind != AgentKind::Household || handle.region >= regions.size()) {
        return nullptr;
    }
    return regions[handle.region].findHouseholdMut(handle.id);
}

// ---------- RegionPolicy ----------

RegionPolicy::RegionPolicy(std::uint32_t id, const RegionProfile& profile, const EnforcementSettings& settings)
    : id_(id), profile_(profile), settings_(settings) {
    profile_.validate();
    Validation::requirePositive("enforcement unit cost", settings_.unitCost);
    Validation::requirePositive("enforcement saturation", settings_.saturation);
    households_.reserve(profile_.households);
}

void RegionPolicy::addHousehold(const Household& household, SpatialIndex& space) {
    if (household.regionId() != id_) {
        throw std::invalid_argument("household " + std::to_string(household.id()) +
                                    " belongs to region " + std::to_string(household.regionId()) +
                                    ", not " + std::to_string(id_));
    }
    if (households_.empty()) {
        firstHouseholdId_ = household.id();
    } else if (household.id() != firstHouseholdId_ + households_.size()) {
        throw std::invalid_argument("household ids must be contiguous within a region (got " +
                                    std::to_string(household.id()) + ")");
    }
    space.place(household.handle(), household.position());
    households_.push_back(household);
}

void RegionPolicy::updatePolicy(double educationFund, double enforcementFund, double incentiveFund) {
    Validation::requireNonNegative("education fund", educationFund);
    Validation::requireNonNegative("enforcement fund", enforcementFund);
    Validation::requireNonNegative("incentive fund", incentiveFund);

    funds_.education = educationFund;
    funds_.enforcement = enforcementFund;
    funds_.incentive = incentiveFund;

    const double population = static_cast<double>(households_.size());

    // Door-to-door IEC: bigger barangays need proportionally more money
    const double educationTarget = population * TuningConstants::kEducationCostPerHead;
    education_intensity_ = educationTarget > 0.0 ? std::min(1.0, educationFund / educationTarget) : 0.0;

    // Patrols cover area, not people
    enforcement_intensity_ = std::min(1.0, enforcementFund / settings_.saturation);

    incentive_per_capita_ = population > 0.0 ? incentiveFund / population : 0.0;
    cash_on_hand_ = incentiveFund;
}

std::uint32_t RegionPolicy::targetEnforcementCount() const {
    if (funds_.enforcement <= 0.0) {
        return 0;
    }
    return static_cast<std::uint32_t>(std::floor(funds_.enforcement / settings_.unitCost));
}

std::uint32_t RegionPolicy::adjustEnforcementAgents(SpatialIndex& space, std::mt19937_64& rng,
                                                    EventLog* log, std::uint64_t tick) {
    const std::uint32_t target = targetEnforcementCount();

    while (units_.size() < target) {
        EnforcementUnit unit(nextUnitId_++, id_, spawnPosition(space, rng), settings_);
        space.place(unit.handle(), unit.position());
        units_.push_back(unit);
        if (log) {
            log->record(tick, EventType::UnitHired, static_cast<std::int32_t>(id_), unit.id());
        }
    }

    while (units_.size() > target) {
        const EnforcementUnit& retired = units_.back();
        space.remove(retired.handle());
        if (log) {
            log->record(tick, EventType::UnitRetired, static_cast<std::int32_t>(id_), retired.id());
        }
        units_.pop_back();
    }

    return target;
}

double RegionPolicy::getLocalCompliance() const {
    return computeCompliance().rate;
}

ComplianceStats RegionPolicy::computeCompliance() const {
    ComplianceStats s;
    s.total = static_cast<std::uint32_t>(households_.size());
    for (const auto& h : households_) {
        if (h.compliant()) s.compliant++;
    }
    s.rate = s.total > 0 ? static_cast<double>(s.compliant) / s.total : 0.0;
    return s;
}

bool RegionPolicy::giveReward(double amount, FinanceLedger& finance) {
    if (!std::isfinite(amount) || amount < 0.0 || amount > cash_on_hand_) {
        return false;
    }
    cash_on_hand_ -= amount;
    finance.recordIncentive(amount);
    return true;
}

void RegionPolicy::step() {
    stats_ = computeCompliance();
}

void RegionPolicy::resetQuarter() {
    for (auto& h : households_) {
        h.resetRedemption();
    }
}

const Household* RegionPolicy::findHousehold(std::uint32_t householdId) const {
    if (householdId < firstHouseholdId_) return nullptr;
    const std::size_t idx = householdId - firstHouseholdId_;
    if (idx >= households_.size()) return nullptr;
    return &households_[idx];
}

Household* RegionPolicy::findHouseholdMut(std::uint32_t householdId) {
    return const_cast<Household*>(static_cast<const RegionPolicy&>(*this).findHousehold(householdId));
}

GridPos RegionPolicy::spawnPosition(const SpatialIndex& space, std::mt19937_64& rng) const {
    std::uniform_int_distribution<int> jitter(-kSpawnJitter, kSpawnJitter);
    const GridPos base = center();
    GridPos pos{base.x + jitter(rng), base.y + jitter(rng)};
    return space.inBounds(pos) ? pos : base;
}
