#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>

namespace {
std::string escapeJson(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    return out;
}

// Names with a comma or quote are quoted for the CSV table
std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

const char* modeName(PatrolMode mode) {
    return mode == PatrolMode::Pursuit ? "pursuit" : "patrol";
}
}

std::string ledgerToJson(const Ledger& ledger, bool includeHouseholds) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    auto m = ledger.computeMetrics();
    const auto& fin = ledger.finance();

    os << "{";
    os << "\"step\":" << ledger.stepCount() << ",";
    os << "\"quarter\":" << ledger.currentQuarter() << ",";
    os << "\"done\":" << (ledger.done() ? "true" : "false") << ",";
    os << "\"metrics\":{";
    os << "\"avgCompliance\":" << m.avgCompliance << ",";
    os << "\"avgEducationIntensity\":" << m.avgEducationIntensity << ",";
    os << "\"avgEnforcementIntensity\":" << m.avgEnforcementIntensity << ",";
    os << "\"politicalCapital\":" << m.politicalCapital << ",";
    os << "\"remainingBudget\":" << m.remainingBudget << ",";
    os << "\"compliantHouseholds\":" << m.compliantHouseholds << ",";
    os << "\"totalHouseholds\":" << m.totalHouseholds << ",";
    os << "\"activeUnits\":" << m.activeUnits;
    os << "},";

    os << "\"finance\":{";
    os << "\"cashBalance\":" << fin.cashBalance << ",";
    os << "\"finesCollected\":" << fin.finesCollected << ",";
    os << "\"finesIssued\":" << fin.finesIssued << ",";
    os << "\"incentivesPaid\":" << fin.incentivesPaid << ",";
    os << "\"educationSpend\":" << fin.educationSpend << ",";
    os << "\"enforcementSpend\":" << fin.enforcementSpend << ",";
    os << "\"incentiveSpend\":" << fin.incentiveSpend;
    os << "},";

    os << "\"regions\":[";
    const auto& regions = ledger.regions();
    for (std::size_t i = 0; i < regions.size(); ++i) {
        const auto& r = regions[i];
        os << "{";
        os << "\"id\":" << r.id() << ",";
        os << "\"name\":\"" << escapeJson(r.name()) << "\",";
        os << "\"population\":" << r.population() << ",";
        os << "\"compliance\":" << r.getLocalCompliance() << ",";
        os << "\"educationIntensity\":" << r.educationIntensity() << ",";
        os << "\"enforcementIntensity\":" << r.enforcementIntensity() << ",";
        os << "\"incentivePerCapita\":" << r.incentivePerCapita() << ",";
        os << "\"cashOnHand\":" << r.cashOnHand() << ",";

        os << "\"units\":[";
        const auto& units = r.units();
        for (std::size_t u = 0; u < units.size(); ++u) {
            const auto& unit = units[u];
            os << "{\"id\":" << unit.id()
               << ",\"x\":" << unit.position().x
               << ",\"y\":" << unit.position().y
               << ",\"mode\":\"" << modeName(unit.mode()) << "\""
               << ",\"fines\":" << unit.finesIssued() << "}";
            if (u + 1 < units.size()) os << ",";
        }
        os << "]";

        if (includeHouseholds) {
            os << ",\"households\":[";
            const auto& households = r.households();
            for (std::size_t h = 0; h < households.size(); ++h) {
                const auto& hh = households[h];
                const auto& s = hh.state();
                os << "{";
                os << "\"id\":" << hh.id() << ",";
                os << "\"x\":" << hh.position().x << ",";
                os << "\"y\":" << hh.position().y << ",";
                os << "\"income\":\"" << incomeTierName(hh.incomeTier()) << "\",";
                os << "\"tpb\":[" << s.attitude << "," << s.subjectiveNorm << ","
                   << s.perceivedControl << "],";
                os << "\"utility\":" << s.utility << ",";
                os << "\"compliant\":" << (s.compliant ? "true" : "false") << ",";
                os << "\"redeemed\":" << (hh.redeemed() ? "true" : "false") << ",";
                os << "\"fines\":" << hh.finesReceived();
                os << "}";
                if (h + 1 < households.size()) os << ",";
            }
            os << "]";
        }

        os << "}";
        if (i + 1 < regions.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

void writeMetricsHeader(std::ostream& out) {
    out << "step,avg_compliance,avg_education,avg_enforcement,political_capital,"
           "remaining_budget,compliant_households,active_units\n";
}

void logMetrics(const Ledger& ledger, std::ostream& out) {
    auto m = ledger.computeMetrics();
    out << ledger.stepCount() << ","
        << m.avgCompliance << ","
        << m.avgEducationIntensity << ","
        << m.avgEnforcementIntensity << ","
        << m.politicalCapital << ","
        << m.remainingBudget << ","
        << m.compliantHouseholds << ","
        << m.activeUnits << "\n";
}

void writeQuarterReport(const std::vector<QuarterReport>& reports, std::ostream& out) {
    out << "quarter,region,name,education_share,enforcement_share,incentive_share,compliance,enforcement_units\n";
    for (const auto& row : reports) {
        out << row.quarter << ","
            << row.region << ","
            << csvField(row.name) << ","
            << row.educationShare << ","
            << row.enforcementShare << ","
            << row.incentiveShare << ","
            << row.compliance << ","
            << row.enforcementUnits << "\n";
    }
}
