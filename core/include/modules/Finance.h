#ifndef FINANCE_H
#define FINANCE_H

#include <cstdint>

// Quarterly fund pools of one region (pesos).
struct FundPools {
    double education = 0.0;
    double enforcement = 0.0;
    double incentive = 0.0;

    double total() const { return education + enforcement + incentive; }
};

// Ledger-wide running totals. Households and regions write here only through
// recordFine / recordIncentive.
struct FinanceLedger {
    double cashBalance = 0.0;       // may go negative transiently
    double finesCollected = 0.0;    // whole run
    double recentFines = 0.0;       // since the last settlement
    double incentivesPaid = 0.0;    // redeemed by households
    double educationSpend = 0.0;    // amortized allocations
    double enforcementSpend = 0.0;
    double incentiveSpend = 0.0;
    std::uint64_t finesIssued = 0;

    void recordFine(double amount) {
        finesCollected += amount;
        recentFines += amount;
        finesIssued++;
    }

    void recordIncentive(double amount) { incentivesPaid += amount; }

    void recordExpense(const FundPools& daily) {
        educationSpend += daily.education;
        enforcementSpend += daily.enforcement;
        incentiveSpend += daily.incentive;
        cashBalance -= daily.total();
    }

    // Moves recently collected fines into the cash balance and returns them.
    double settleRecentFines() {
        const double settled = recentFines;
        cashBalance += settled;
        recentFines = 0.0;
        return settled;
    }
};

#endif
