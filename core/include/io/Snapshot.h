#ifndef LEDGER_SNAPSHOT_H
#define LEDGER_SNAPSHOT_H

#include "kernel/Ledger.h"
#include <string>
#include <iosfwd>
#include <vector>

// JSON export for ledger state
std::string ledgerToJson(const Ledger& ledger, bool includeHouseholds = false);

// CSV metrics logging (one line per call)
void writeMetricsHeader(std::ostream& out);
void logMetrics(const Ledger& ledger, std::ostream& out);

// Per-quarter, per-region table; the column order is fixed:
// quarter,region,name,education_share,enforcement_share,incentive_share,compliance,enforcement_units
void writeQuarterReport(const std::vector<QuarterReport>& reports, std::ostream& out);

#endif
