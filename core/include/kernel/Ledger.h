#ifndef LEDGER_H
#define LEDGER_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "kernel/Config.h"
#include "kernel/SpatialGrid.h"
#include "modules/Allocation.h"
#include "modules/Finance.h"
#include "modules/RegionPolicy.h"
#include "utils/EventLog.h"

// ---------- Observation records ----------
struct StepRecord {
    std::uint64_t step = 0;
    double avgCompliance = 0.0;
    double avgEducationIntensity = 0.0;
    double avgEnforcementIntensity = 0.0;
    double politicalCapital = 0.0;
    double cashBalance = 0.0;
    double finesThisStep = 0.0;
    std::uint32_t activeUnits = 0;
};

// One row per region per completed quarter (reporting collaborator contract).
struct QuarterReport {
    int quarter = 0;
    std::uint32_t region = 0;
    std::string name;
    double educationShare = 0.0;     // of the quarterly budget
    double enforcementShare = 0.0;
    double incentiveShare = 0.0;
    double compliance = 0.0;
    std::uint32_t enforcementUnits = 0;
};

struct QuarterOutcome {
    std::vector<double> state;
    double reward = 0.0;
    bool done = false;
};

// ---------- Simulation Ledger ----------
class Ledger {
public:
    explicit Ledger(const SimConfig& cfg);

    // Lifecycle
    void reset(const SimConfig& cfg);
    void step();
    void stepN(int n);

    // Controller interface
    // Fractions of the quarterly budget, kLeversPerRegion per region. Used from
    // the next quarter boundary on until replaced. Throws on wrong length.
    void setAllocation(const std::vector<double>& fractions);
    void clearAllocation();
    // Policy synthesized at quarter boundaries while no controller allocation is set.
    void setDefaultScenario(Scenario scenario) { cfg_.defaultScenario = scenario; }
    // Default scenario takes over from the next quarter; drops any controller allocation.
    void switchScenario(Scenario scenario);
    bool hasControllerAllocation() const { return has_controller_allocation_; }

    // Applies `fractions`, runs to the next quarter boundary, reports the result.
    QuarterOutcome advanceQuarter(const std::vector<double>& fractions);

    std::vector<double> getState() const;
    double calculateReward() const;
    bool done() const { return step_ >= cfg_.episodeSteps(); }

    std::size_t stateSize() const { return regions_.size() + 3; }
    std::size_t actionSize() const { return regions_.size() * kLeversPerRegion; }

    // Access
    const SimConfig& config() const { return cfg_; }
    const std::vector<RegionPolicy>& regions() const { return regions_; }
    std::vector<RegionPolicy>& regionsMut() { return regions_; }
    const RegionPolicy& region(std::uint32_t id) const;
    const FinanceLedger& finance() const { return finance_; }
    const MultiGrid& space() const { return grid_; }
    double politicalCapital() const { return political_capital_; }
    std::uint64_t stepCount() const { return step_; }
    int currentQuarter() const { return static_cast<int>(step_ / static_cast<std::uint64_t>(cfg_.stepsPerQuarter)); }
    const ScaledAllocation& currentAllocation() const { return allocation_; }
    const FundPools& dailyExpense() const { return daily_expense_; }
    const std::vector<StepRecord>& history() const { return history_; }
    const std::vector<QuarterReport>& quarterReports() const { return quarter_reports_; }
    std::uint32_t totalHouseholds() const;

    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

    // Metrics (lightweight for logging)
    struct Metrics {
        double avgCompliance = 0.0;            // mean of regional rates
        double avgEducationIntensity = 0.0;
        double avgEnforcementIntensity = 0.0;
        double politicalCapital = 0.0;
        double remainingBudget = 0.0;          // fraction of the term budget
        std::uint32_t compliantHouseholds = 0;
        std::uint32_t totalHouseholds = 0;
        std::uint32_t activeUnits = 0;
    };
    Metrics computeMetrics() const;

private:
    void initRegions();
    void beginQuarter();
    void activateAgents(StepContext& ctx);
    void updatePoliticalCapital(double avgEnforcement);
    void recordStep(double finesSettled);
    void recordQuarterReports();

    std::vector<double> regionalCompliance() const;
    double remainingBudgetFraction() const;
    double timeIndex() const;

    SimConfig cfg_;
    std::vector<RegionPolicy> regions_;
    MultiGrid grid_;
    std::mt19937_64 rng_;
    FinanceLedger finance_;
    double political_capital_ = 0.0;
    std::uint64_t step_ = 0;

    std::vector<double> controller_allocation_;
    bool has_controller_allocation_ = false;
    ScaledAllocation allocation_;
    FundPools daily_expense_;

    std::vector<StepRecord> history_;
    std::vector<QuarterReport> quarter_reports_;
    EventLog event_log_;
};

#endif // LEDGER_H
