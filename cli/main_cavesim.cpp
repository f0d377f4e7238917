#include "CommandArgs.h"
#include "kernel/Simulation.h"
#include "io/Snapshot.h"
#include "modules/Experiment.h"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <string>

static void printHelp() {
    std::cerr << "Cavesim Commands:\n"
              << "  build [C N K]      # rebuild with optional: caves, agents per cave, K\n"
              << "  rewire p P         # one Bernoulli(P) trial per unconnected pair\n"
              << "  rewire count N     # add N uniformly random ties\n"
              << "  rewire short N     # add N ties between adjacent caves\n"
              << "  run T [log] [mode] # run T sweeps (mode: async|sync, any order), print polarization every 'log'\n"
              << "  state [history]    # print JSON snapshot (optional: include history)\n"
              << "  polarization       # print current polarization\n"
              << "  series             # print polarization of every recorded snapshot\n"
              << "  metadata           # print run metadata as key=value\n"
              << "  csv FILE           # write iteration,polarization CSV\n"
              << "  trace on|off       # toggle structured trace echo on stderr\n"
              << "  experiment T I S E [FILE]\n"
              << "                     # T trials, I sweeps, S sync sweeps, E random ties; JSON to FILE\n"
              << "  quit               # exit\n"
              << "\nOptions: --caves=N --per-cave=N --k=K --s=S --noise=X --seed=N\n"
              << "         --topology=caveman|connected --variant=sign-dependent|symmetric\n"
              << "         --ordering=async|sync --nonnegative --sample=N --tolerance=X\n"
              << "         (or CAVESIM_SEED env var for the seed)\n";
}

static std::atomic<bool> g_cancel{false};

extern "C" void onInterrupt(int) {
    g_cancel.store(true);
}

static bool applyOption(SimulationConfig& cfg, const std::string& arg) {
    const auto eq = arg.find('=');
    const std::string key = arg.substr(0, eq);
    const std::string v = eq == std::string::npos ? std::string() : arg.substr(eq + 1);

    if (key == "--caves") cfg.nCaves = static_cast<std::uint32_t>(std::stoul(v));
    else if (key == "--per-cave") cfg.nPerCave = static_cast<std::uint32_t>(std::stoul(v));
    else if (key == "--k") cfg.K = static_cast<std::uint32_t>(std::stoul(v));
    else if (key == "--s") cfg.initialScale = std::stod(v);
    else if (key == "--noise") cfg.noiseLevel = std::stod(v);
    else if (key == "--seed") cfg.seed = std::stoull(v);
    else if (key == "--topology") cfg.topology = parseTopology(v);
    else if (key == "--variant") cfg.variant = parseUpdateVariant(v);
    else if (key == "--ordering") cfg.ordering = parseOrdering(v);
    else if (key == "--sample") cfg.sampleInterval = static_cast<std::uint32_t>(std::stoul(v));
    else if (key == "--tolerance") cfg.convergenceTolerance = std::stod(v);
    else if (arg == "--nonnegative") cfg.nonnegativeWeights = true;
    else return false;
    return true;
}

static void printExperimentSummary(const ExperimentResult& result) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n=== Experiment (" << result.attrs.at("n_trials_completed") << "/"
              << result.attrs.at("n_trials") << " trials) ===\n";
    for (const auto& [key, cond] : result.conditions) {
        if (cond.size() == 0) {
            std::cout << key << ": no completed trials\n";
            continue;
        }
        auto finals = cond.finalPolarizations();
        std::sort(finals.begin(), finals.end());
        const double mean = std::accumulate(finals.begin(), finals.end(), 0.0) / finals.size();
        std::cout << std::left << std::setw(20) << key << std::right
                  << " mean=" << mean
                  << " min=" << finals.front()
                  << " median=" << finals[finals.size() / 2]
                  << " max=" << finals.back() << "\n";
    }
    if (!result.failures.empty()) {
        std::cout << "Failed trials: " << result.failures.size() << "\n";
    }
    if (!result.cancelled.empty()) {
        std::cout << "Cancelled trials: " << result.cancelled.size() << "\n";
    }
    std::cout.flush();
}

int main(int argc, char** argv) {
    SimulationConfig cfg;
    cfg.nCaves = 20;
    cfg.nPerCave = 5;
    cfg.K = 2;
    cfg.topology = Topology::ConnectedCaveman;

    if (const char* envSeed = std::getenv("CAVESIM_SEED")) {
        cfg.seed = std::strtoull(envSeed, nullptr, 10);
    }

    const char* scriptArg = nullptr;
    bool trace = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg == "--trace") {
            trace = true;
        } else if (arg.size() && arg[0] == '-') {
            try {
                if (!applyOption(cfg, arg)) {
                    std::cerr << "Unknown option: " << arg << "\n";
                    return 1;
                }
            } catch (const std::exception& e) {
                std::cerr << "Invalid option " << arg << ": " << e.what() << "\n";
                return 1;
            }
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    Simulation sim;
    try {
        sim.build(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    sim.eventLog().enable(trace);
    sim.eventLog().setEcho(trace);
    std::signal(SIGINT, onInterrupt);

    // Check if there's a script file argument
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
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) continue;
        if (trace) std::cerr << "[DEBUG] Command: '" << cmd << "'\n";
        g_cancel.store(false);

        try {
            if (cmd == "build") {
                // Failed extraction zeroes its target, so only overwrite on success
                SimulationConfig newCfg = cfg;
                std::uint32_t v = 0;
                if (iss >> v) {
                    newCfg.nCaves = v;
                    if (iss >> v) {
                        newCfg.nPerCave = v;
                        if (iss >> v) newCfg.K = v;
                    }
                }
                sim.build(newCfg);
                cfg = newCfg;
                std::cout << "Built: " << sim.agents().size() << " agents, " << cfg.nCaves << " caves ("
                          << topologyName(cfg.topology) << "), " << sim.network().edgeCount() << " edges\n";
                std::cout.flush();

            } else if (cmd == "rewire") {
                std::string mode;
                iss >> mode;
                std::size_t added = 0;
                if (mode == "p") {
                    double p = 0.0;
                    iss >> p;
                    added = sim.rewire(p);
                } else if (mode == "count") {
                    std::size_t n = 0;
                    iss >> n;
                    added = sim.rewireCount(n);
                } else if (mode == "short") {
                    std::size_t n = 0;
                    iss >> n;
                    added = sim.rewireShortRange(n);
                } else {
                    std::cerr << "Usage: rewire p P | rewire count N | rewire short N\n";
                    continue;
                }
                std::cout << "Added " << added << " edges (" << sim.network().edgeCount() << " total, "
                          << sim.nonNeighbors().size() << " non-neighbor pairs left)\n";
                std::cout.flush();

            } else if (cmd == "run") {
                const RunArgs args = parseRunArgs(iss);
                const std::uint64_t sweeps = args.sweeps;
                const std::uint64_t logFreq = args.logFreq;
                const UpdateOrdering ordering = args.ordering.value_or(cfg.ordering);
                const std::uint64_t chunk = logFreq > 0 ? logFreq : std::max<std::uint64_t>(sweeps, 1);

                std::uint64_t done = 0;
                while (done < sweeps && !g_cancel.load()) {
                    const std::uint64_t n = std::min(chunk, sweeps - done);
                    done += sim.run(n, ordering, &g_cancel);
                    std::cerr << "Sweep " << done << "/" << sweeps << "\r";
                    std::cerr.flush();
                    if (logFreq > 0) {
                        std::cout << "Sweep " << sim.iteration() << ": Pol=" << std::fixed
                                  << std::setprecision(4) << sim.polarization() << "\n";
                    }
                    if (sim.state() == SimulationState::Converged) break;
                }
                std::cerr << "\n";
                std::cout << "Completed " << done << " sweeps (" << orderingName(ordering) << ", state="
                          << stateName(sim.state()) << "), polarization=" << std::fixed
                          << std::setprecision(4) << sim.polarization() << "\n";
                std::cout.flush();

            } else if (cmd == "state") {
                std::string opt;
                iss >> opt;
                std::cout << simulationToJson(sim, opt == "history") << "\n";
                std::cout.flush();

            } else if (cmd == "polarization") {
                std::cout << "Iteration: " << sim.iteration() << "\n"
                          << "Polarization: " << std::setprecision(6) << sim.polarization() << "\n";
                std::cout.flush();

            } else if (cmd == "series") {
                logPolarization(sim, std::cout);
                std::cout.flush();

            } else if (cmd == "metadata") {
                for (const auto& [key, value] : sim.metadata()) {
                    std::cout << key << "=" << value << "\n";
                }
                std::cout.flush();

            } else if (cmd == "csv") {
                std::string path;
                if (!(iss >> path)) {
                    std::cerr << "Usage: csv FILE\n";
                    continue;
                }
                std::ofstream out(path);
                if (!out) {
                    std::cerr << "Error: Could not open '" << path << "' for writing\n";
                    continue;
                }
                out << "iteration,polarization\n";
                logPolarization(sim, out);
                std::cout << "Wrote " << sim.history().size() << " rows to " << path << "\n";

            } else if (cmd == "trace") {
                std::string opt;
                iss >> opt;
                trace = (opt == "on");
                sim.eventLog().enable(trace);
                sim.eventLog().setEcho(trace);

            } else if (cmd == "experiment") {
                ExperimentConfig ecfg;
                ecfg.sim = cfg;
                std::string path;
                std::uint32_t trials = 0;
                std::uint64_t iters = 0;
                std::uint64_t sync = 0;
                std::uint32_t edges = 0;
                if (!(iss >> trials >> iters >> sync >> edges)) {
                    std::cerr << "Usage: experiment T I S E [FILE]\n";
                    continue;
                }
                iss >> path;
                ecfg.nTrials = trials;
                ecfg.nIterations = iters;
                ecfg.nIterSync = sync;
                ecfg.nRandomEdges = edges;
                ecfg.keepHistories = !path.empty();
                ecfg.skipFailedTrials = true;

                Experiment experiment(ecfg);
                std::cerr << "Running " << ecfg.nTrials << " trials...\n";
                auto result = experiment.run(&g_cancel);
                printExperimentSummary(result);
                if (!path.empty()) {
                    std::ofstream out(path);
                    if (!out) {
                        std::cerr << "Error: Could not open '" << path << "' for writing\n";
                        continue;
                    }
                    out << experimentToJson(result, true) << "\n";
                    std::cout << "Experiment written to " << path << "\n";
                }

            } else if (cmd == "quit") {
                break;

            } else if (cmd == "help") {
                printHelp();

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
                printHelp();
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }

    return 0;
}
