#include "kernel/Ledger.h"
#include "io/Snapshot.h"
#include "modules/Allocation.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <filesystem>
#include <cstdlib>
#include <string>
#include <vector>

static void printHelp() {
    std::cerr << "Simulation Commands:\n"
              << "  step N               # advance N days\n"
              << "  quarter [a0 a1 ...]  # run to the next quarter boundary (optional allocation, 3 per region)\n"
              << "  run Q [log]          # run Q quarters, log metrics to metrics.csv every 'log' days\n"
              << "  state                # print controller state vector\n"
              << "  reward               # print current reward\n"
              << "  metrics              # print current metrics\n"
              << "  regions              # per-region summary\n"
              << "  report               # quarterly report table (CSV)\n"
              << "  json [households]    # print JSON snapshot (optional: include households)\n"
              << "  scenario NAME        # default policy: baseline, status_quo, education_heavy,\n"
              << "                       #   enforcement_heavy, incentive_heavy (drops controller allocation)\n"
              << "  reset [seed]         # rebuild the population\n"
              << "  events               # recent events\n"
              << "  quit                 # exit\n"
              << "\nOptions: --seed=N --scenario=NAME --budget=PESOS --quarters=N --sweep --verbose\n"
              << "Environment: SEGSIM_SCENARIO, SEGSIM_SEED\n";
}

static void printVector(const std::vector<double>& v) {
    std::cout << "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        std::cout << v[i];
        if (i + 1 < v.size()) std::cout << ", ";
    }
    std::cout << "]\n";
}

static void printRegions(const Ledger& ledger) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "\n=== Regions (day " << ledger.stepCount() << ", quarter " << ledger.currentQuarter() << ") ===\n";
    for (const auto& r : ledger.regions()) {
        std::cout << std::left << std::setw(14) << r.name() << std::right
                  << " pop=" << std::setw(4) << r.population()
                  << " compliance=" << r.getLocalCompliance()
                  << " edu=" << r.educationIntensity()
                  << " enf=" << r.enforcementIntensity()
                  << " units=" << r.units().size()
                  << " incentive/hh=" << std::setprecision(1) << r.incentivePerCapita()
                  << " cash=" << r.cashOnHand() << std::setprecision(3) << "\n";
    }
    std::cout << "\n";
    std::cout.flush();
}

static void runToQuarterEnd(Ledger& ledger) {
    const auto perQuarter = static_cast<std::uint64_t>(ledger.config().stepsPerQuarter);
    do {
        ledger.step();
    } while (ledger.stepCount() % perQuarter != 0);
}

static void printQuarterLine(const Ledger& ledger) {
    auto m = ledger.computeMetrics();
    std::cout << "Quarter " << ledger.currentQuarter() << ": "
              << "Compliance=" << std::fixed << std::setprecision(3) << m.avgCompliance << ", "
              << "Enf=" << m.avgEnforcementIntensity << ", "
              << "PolCap=" << m.politicalCapital << ", "
              << "Budget=" << m.remainingBudget << ", "
              << "Units=" << m.activeUnits << ", "
              << "Reward=" << ledger.calculateReward()
              << "\n";
    std::cout.flush();
}

int main(int argc, char** argv) {
    SimConfig cfg;
    bool verbose = false;

    try {
        if (const char* envScenario = std::getenv("SEGSIM_SCENARIO")) {
            cfg.defaultScenario = parseScenario(envScenario);
        }
        if (const char* envSeed = std::getenv("SEGSIM_SEED")) {
            cfg.seed = std::stoull(envSeed);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error in environment: " << e.what() << "\n";
        return 1;
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg.rfind("--seed=", 0) == 0) {
                cfg.seed = std::stoull(arg.substr(7));
            } else if (arg.rfind("--scenario=", 0) == 0) {
                cfg.defaultScenario = parseScenario(arg.substr(11));
            } else if (arg.rfind("--budget=", 0) == 0) {
                cfg.annualBudget = std::stod(arg.substr(9));
            } else if (arg.rfind("--quarters=", 0) == 0) {
                cfg.quarters = std::stoi(arg.substr(11));
            } else if (arg == "--sweep") {
                cfg.targeting = TargetingPolicy::SystematicSweep;
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        } catch (const std::exception& e) {
            std::cerr << "Bad value for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    std::unique_ptr<Ledger> ledgerPtr;
    try {
        ledgerPtr = std::make_unique<Ledger>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }
    Ledger& ledger = *ledgerPtr;
    if (verbose) {
        ledger.eventLog().setEcho(&std::cerr);
    }

    std::cerr << "segsim: " << ledger.regions().size() << " regions, "
              << ledger.totalHouseholds() << " households, scenario="
              << scenarioName(cfg.defaultScenario) << ", seed=" << cfg.seed << "\n";

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd) || cmd[0] == '#') {
            continue;
        }

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                for (int i = 0; i < n; ++i) {
                    ledger.step();
                    if ((i + 1) % 90 == 0 || i == n - 1) {
                        std::cerr << "Day " << (i + 1) << "/" << n << "\r";
                        std::cerr.flush();
                    }
                }
                std::cerr << "\n";
                printQuarterLine(ledger);

            } else if (cmd == "quarter") {
                std::vector<double> action;
                double v;
                while (iss >> v) action.push_back(v);

                if (action.empty()) {
                    runToQuarterEnd(ledger);
                    printQuarterLine(ledger);
                } else {
                    auto outcome = ledger.advanceQuarter(action);
                    std::cout << std::fixed << std::setprecision(4) << "state=";
                    printVector(outcome.state);
                    std::cout << "reward=" << outcome.reward
                              << " done=" << (outcome.done ? "true" : "false") << "\n";
                    std::cout.flush();
                }

            } else if (cmd == "run") {
                int quarters = 1;
                int logFreq = 0;
                iss >> quarters >> logFreq;
                if (quarters < 1) quarters = 1;

                std::ofstream metricsFile;
                if (logFreq > 0) {
                    bool isNewFile = !std::filesystem::exists("metrics.csv");
                    metricsFile.open("metrics.csv", std::ios::app);
                    if (isNewFile) {
                        writeMetricsHeader(metricsFile);
                    }
                }

                const auto perQuarter = static_cast<std::uint64_t>(ledger.config().stepsPerQuarter);
                for (int q = 0; q < quarters; ++q) {
                    do {
                        ledger.step();
                        if (logFreq > 0 && ledger.stepCount() % static_cast<std::uint64_t>(logFreq) == 0) {
                            logMetrics(ledger, metricsFile);
                        }
                    } while (ledger.stepCount() % perQuarter != 0);
                    printQuarterLine(ledger);
                }

                if (logFreq > 0) {
                    std::cout << "Completed " << quarters << " quarters. Metrics written to metrics.csv\n";
                    std::cout.flush();
                }

            } else if (cmd == "state") {
                std::cout << std::fixed << std::setprecision(4);
                printVector(ledger.getState());
                std::cout.flush();

            } else if (cmd == "reward") {
                std::cout << std::fixed << std::setprecision(4) << ledger.calculateReward() << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                auto m = ledger.computeMetrics();
                const auto& fin = ledger.finance();
                std::cout << std::fixed << std::setprecision(4)
                          << "Day: " << ledger.stepCount() << " (quarter " << ledger.currentQuarter() << ")\n"
                          << "Compliance: " << m.avgCompliance
                          << " (" << m.compliantHouseholds << "/" << m.totalHouseholds << " households)\n"
                          << "Education intensity: " << m.avgEducationIntensity << "\n"
                          << "Enforcement intensity: " << m.avgEnforcementIntensity
                          << " (" << m.activeUnits << " units)\n"
                          << "Political capital: " << m.politicalCapital << "\n"
                          << "Remaining budget: " << m.remainingBudget << "\n"
                          << std::setprecision(2)
                          << "Cash: " << fin.cashBalance << "\n"
                          << "Fines: " << fin.finesIssued << " issued, " << fin.finesCollected << " collected\n"
                          << "Incentives paid: " << fin.incentivesPaid << "\n";
                std::cout.flush();

            } else if (cmd == "regions") {
                printRegions(ledger);

            } else if (cmd == "report") {
                std::cout << std::fixed << std::setprecision(4);
                writeQuarterReport(ledger.quarterReports(), std::cout);
                std::cout.flush();

            } else if (cmd == "json") {
                std::string opt;
                iss >> opt;
                std::cout << ledgerToJson(ledger, opt == "households") << "\n";
                std::cout.flush();

            } else if (cmd == "scenario") {
                std::string name;
                iss >> name;
                cfg.defaultScenario = parseScenario(name);
                ledger.switchScenario(cfg.defaultScenario);
                std::cout << "Scenario: " << scenarioName(cfg.defaultScenario) << "\n";
                std::cout.flush();

            } else if (cmd == "reset") {
                std::uint64_t seed = cfg.seed;
                if (iss >> seed) {
                    cfg.seed = seed;
                }
                ledger.reset(cfg);
                std::cout << "Reset: " << ledger.totalHouseholds() << " households, "
                          << ledger.regions().size() << " regions (seed=" << cfg.seed
                          << ", scenario=" << scenarioName(cfg.defaultScenario) << ")\n";
                std::cout.flush();

            } else if (cmd == "events") {
                for (const auto& e : ledger.eventLog().events()) {
                    std::cout << "[" << EventLog::typeName(e.type) << "] day=" << e.tick
                              << " region=" << e.region << " value=" << e.value;
                    if (!e.message.empty()) std::cout << " " << e.message;
                    std::cout << "\n";
                }
                std::cout.flush();

            } else if (cmd == "quit") {
                break;

            } else if (cmd == "help") {
                printHelp();

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
                printHelp();
            }
        } catch (const std::exception& e) {
            std::cerr << "Error in " << cmd << " command: " << e.what() << "\n";
        }
    }

    return 0;
}
