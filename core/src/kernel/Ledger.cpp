#include "kernel/Ledger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

#include "kernel/Agent.h"

namespace {
double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

const SimConfig& validated(const SimConfig& cfg) {
    cfg.validate();
    return cfg;
}
}

Ledger::Ledger(const SimConfig& cfg)
    : cfg_(validated(cfg)), grid_(cfg_.gridWidth, cfg_.gridHeight), rng_(cfg_.seed) {
    reset(cfg);
}

void Ledger::reset(const SimConfig& cfg) {
    cfg.validate();
    cfg_ = cfg;
    rng_.seed(cfg_.seed);
    grid_ = MultiGrid(cfg_.gridWidth, cfg_.gridHeight);

    finance_ = FinanceLedger{};
    finance_.cashBalance = cfg_.termBudget();
    political_capital_ = clamp01(cfg_.initialPoliticalCapital);
    step_ = 0;

    controller_allocation_.clear();
    has_controller_allocation_ = false;
    allocation_ = ScaledAllocation{};
    daily_expense_ = FundPools{};

    history_.clear();
    quarter_reports_.clear();
    event_log_.clear();

    initRegions();
}

void Ledger::initRegions() {
    EnforcementSettings settings;
    settings.targeting = cfg_.targeting;
    settings.patrolRange = cfg_.patrolRange;
    settings.catchRadius = cfg_.catchRadius;
    settings.unitCost = cfg_.enforcementUnitCost;
    settings.saturation = cfg_.enforcementSaturation;

    regions_.clear();
    regions_.reserve(cfg_.regions.size());

    // Household ids are global and contiguous per region
    std::uint32_t nextId = 0;
    for (std::uint32_t r = 0; r < cfg_.regions.size(); ++r) {
        const RegionProfile& profile = cfg_.regions[r];
        regions_.emplace_back(r, profile, settings);
        RegionPolicy& region = regions_.back();

        for (std::uint32_t i = 0; i < profile.households; ++i) {
            const GridPos pos = grid_.scatterAround(region.center(), TuningConstants::kClusterSpread, rng_);
            region.addHousehold(Household::generate(nextId++, r, profile, pos, rng_), grid_);
        }
        region.step();
    }
}

const RegionPolicy& Ledger::region(std::uint32_t id) const {
    if (id >= regions_.size()) {
        throw std::out_of_range("region index " + std::to_string(id) + " out of range (have " +
                                std::to_string(regions_.size()) + ")");
    }
    return regions_[id];
}

std::uint32_t Ledger::totalHouseholds() const {
    std::uint32_t total = 0;
    for (const auto& r : regions_) total += r.population();
    return total;
}

// ---------- Controller interface ----------

void Ledger::setAllocation(const std::vector<double>& fractions) {
    if (fractions.size() != actionSize()) {
        throw std::invalid_argument("allocation must have " + std::to_string(actionSize()) +
                                    " entries (3 per region), got " + std::to_string(fractions.size()));
    }
    controller_allocation_ = fractions;
    has_controller_allocation_ = true;
}

void Ledger::clearAllocation() {
    controller_allocation_.clear();
    has_controller_allocation_ = false;
}

void Ledger::switchScenario(Scenario scenario) {
    setDefaultScenario(scenario);
    clearAllocation();
}

QuarterOutcome Ledger::advanceQuarter(const std::vector<double>& fractions) {
    setAllocation(fractions);

    const auto perQuarter = static_cast<std::uint64_t>(cfg_.stepsPerQuarter);
    do {
        step();
    } while (step_ % perQuarter != 0);

    QuarterOutcome out;
    out.state = getState();
    out.reward = calculateReward();
    out.done = done();
    return out;
}

// ---------- Stepping ----------

void Ledger::step() {
    const auto perQuarter = static_cast<std::uint64_t>(cfg_.stepsPerQuarter);
    if (step_ % perQuarter == 0) {
        beginQuarter();
    }

    for (auto& r : regions_) {
        r.step();
    }

    StepContext ctx{rng_, grid_, regions_, finance_, &event_log_, step_};
    activateAgents(ctx);

    double enforcementSum = 0.0;
    for (const auto& r : regions_) enforcementSum += r.enforcementIntensity();
    const double avgEnforcement = regions_.empty() ? 0.0 : enforcementSum / regions_.size();
    updatePoliticalCapital(avgEnforcement);

    finance_.recordExpense(daily_expense_);
    const double finesSettled = finance_.settleRecentFines();

    ++step_;
    recordStep(finesSettled);

    if (step_ % perQuarter == 0) {
        recordQuarterReports();
    }
}

void Ledger::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

void Ledger::beginQuarter() {
    const double quarterly = cfg_.quarterlyBudget();

    std::vector<double> fractions;
    if (has_controller_allocation_) {
        fractions = controller_allocation_;
    } else {
        std::vector<std::uint32_t> populations;
        populations.reserve(regions_.size());
        for (const auto& r : regions_) populations.push_back(r.population());
        fractions = scenarioAllocation(cfg_.defaultScenario, populations);
    }

    allocation_ = scaleAllocation(fractions, quarterly);
    if (allocation_.requested > 1.0) {
        event_log_.record(step_, EventType::AllocationScaled, -1, allocation_.requested,
                          "requested share above quarterly budget, scaled by " +
                          std::to_string(allocation_.scale));
    }

    daily_expense_ = FundPools{};
    const double days = static_cast<double>(cfg_.stepsPerQuarter);
    for (std::uint32_t r = 0; r < regions_.size(); ++r) {
        RegionPolicy& region = regions_[r];
        region.updatePolicy(allocation_.education(r), allocation_.enforcement(r), allocation_.incentive(r));
        region.adjustEnforcementAgents(grid_, rng_, &event_log_, step_);
        region.resetQuarter();

        daily_expense_.education += allocation_.education(r) / days;
        daily_expense_.enforcement += allocation_.enforcement(r) / days;
        daily_expense_.incentive += allocation_.incentive(r) / days;
    }

    event_log_.record(step_, EventType::QuarterStart, -1, static_cast<double>(currentQuarter()));
}

void Ledger::activateAgents(StepContext& ctx) {
    // Region vectors do not reallocate while agents step
    std::vector<SteppingAgent*> order;
    order.reserve(totalHouseholds() + 64);
    for (auto& r : regions_) {
        for (auto& h : r.householdsMut()) order.push_back(&h);
        for (auto& u : r.unitsMut()) order.push_back(&u);
    }

    std::shuffle(order.begin(), order.end(), rng_);
    for (SteppingAgent* agent : order) {
        agent->step(ctx);
    }
}

void Ledger::updatePoliticalCapital(double avgEnforcement) {
    political_capital_ = clamp01(political_capital_
                                 - cfg_.capitalErosion * avgEnforcement
                                 + cfg_.capitalRecovery * (1.0 - avgEnforcement));
}

void Ledger::recordStep(double finesSettled) {
    StepRecord rec;
    rec.step = step_;
    double compliance = 0.0, education = 0.0, enforcement = 0.0;
    for (const auto& r : regions_) {
        compliance += r.getLocalCompliance();
        education += r.educationIntensity();
        enforcement += r.enforcementIntensity();
        rec.activeUnits += static_cast<std::uint32_t>(r.units().size());
    }
    if (!regions_.empty()) {
        const double n = static_cast<double>(regions_.size());
        rec.avgCompliance = compliance / n;
        rec.avgEducationIntensity = education / n;
        rec.avgEnforcementIntensity = enforcement / n;
    }
    rec.politicalCapital = political_capital_;
    rec.cashBalance = finance_.cashBalance;
    rec.finesThisStep = finesSettled;
    history_.push_back(rec);
}

void Ledger::recordQuarterReports() {
    const double quarterly = cfg_.quarterlyBudget();
    const int quarter = currentQuarter() - 1;

    for (const auto& r : regions_) {
        QuarterReport row;
        row.quarter = quarter;
        row.region = r.id();
        row.name = r.name();
        if (quarterly > 0.0) {
            row.educationShare = r.funds().education / quarterly;
            row.enforcementShare = r.funds().enforcement / quarterly;
            row.incentiveShare = r.funds().incentive / quarterly;
        }
        row.compliance = r.getLocalCompliance();
        row.enforcementUnits = static_cast<std::uint32_t>(r.units().size());
        quarter_reports_.push_back(row);
    }
}

// ---------- Observation ----------

std::vector<double> Ledger::regionalCompliance() const {
    std::vector<double> out;
    out.reserve(regions_.size());
    for (const auto& r : regions_) out.push_back(r.getLocalCompliance());
    return out;
}

double Ledger::remainingBudgetFraction() const {
    const double term = cfg_.termBudget();
    return term > 0.0 ? clamp01(finance_.cashBalance / term) : 0.0;
}

double Ledger::timeIndex() const {
    const std::uint64_t episode = cfg_.episodeSteps();
    return episode > 0 ? clamp01(static_cast<double>(step_) / static_cast<double>(episode)) : 1.0;
}

std::vector<double> Ledger::getState() const {
    std::vector<double> state = regionalCompliance();
    for (double& v : state) v = clamp01(v);
    state.push_back(remainingBudgetFraction());
    state.push_back(timeIndex());
    state.push_back(clamp01(political_capital_));
    return state;
}

double Ledger::calculateReward() const {
    const std::vector<double> compliance = regionalCompliance();
    double avgCompliance = 0.0;
    double avgEnforcement = 0.0;
    if (!regions_.empty()) {
        avgCompliance = std::accumulate(compliance.begin(), compliance.end(), 0.0) / regions_.size();
        for (const auto& r : regions_) avgEnforcement += r.enforcementIntensity();
        avgEnforcement /= regions_.size();
    }

    // Spend should track the calendar: half the term gone, half the money left
    const double idealRemaining = 1.0 - timeIndex();
    double reward = cfg_.complianceRewardWeight * avgCompliance
                  - cfg_.budgetRewardWeight * std::abs(remainingBudgetFraction() - idealRemaining);

    if (avgEnforcement > cfg_.backlashEnforcementLevel && avgCompliance < cfg_.backlashComplianceLevel) {
        reward -= cfg_.backlashPenalty;
    }
    return reward;
}

Ledger::Metrics Ledger::computeMetrics() const {
    Metrics m;
    const int n = static_cast<int>(regions_.size());
    if (n == 0) {
        m.politicalCapital = political_capital_;
        m.remainingBudget = remainingBudgetFraction();
        return m;
    }

    // One slot per region; the reduction below is serial so the result does
    // not depend on the thread count.
    std::vector<ComplianceStats> stats(regions_.size());
    #pragma omp parallel for schedule(static)
    for (int r = 0; r < n; ++r) {
        stats[r] = regions_[r].computeCompliance();
    }

    double compliance = 0.0, education = 0.0, enforcement = 0.0;
    for (int r = 0; r < n; ++r) {
        compliance += stats[r].rate;
        m.compliantHouseholds += stats[r].compliant;
        m.totalHouseholds += stats[r].total;
        education += regions_[r].educationIntensity();
        enforcement += regions_[r].enforcementIntensity();
        m.activeUnits += static_cast<std::uint32_t>(regions_[r].units().size());
    }

    m.avgCompliance = compliance / n;
    m.avgEducationIntensity = education / n;
    m.avgEnforcementIntensity = enforcement / n;
    m.politicalCapital = political_capital_;
    m.remainingBudget = remainingBudgetFraction();
    return m;
}
