#include "modules/Experiment.h"
#include "kernel/Errors.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <omp.h>

namespace {

const std::array<const char*, 3> kConditions{kConditionConnected, kConditionShortRange, kConditionAnyRange};

// A run that returns short without converging was cancelled
bool stoppedShort(const Simulation& sim, std::uint64_t done, std::uint64_t requested) {
    return done < requested && sim.state() != SimulationState::Converged;
}

std::string formatDouble(double v) {
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

}

std::vector<double> ConditionResult::finalPolarizations() const {
    std::vector<double> out;
    out.reserve(polarization.size());
    for (const auto& series : polarization) out.push_back(series.back());
    return out;
}

const ConditionResult& ExperimentResult::condition(const std::string& key) const {
    auto it = conditions.find(key);
    if (it == conditions.end()) {
        throw std::out_of_range("experiment has no condition '" + key + "'");
    }
    return it->second;
}

void validateExperimentConfig(const ExperimentConfig& cfg) {
    SimulationConfig sim = cfg.sim;
    sim.topology = Topology::ConnectedCaveman;
    validateConfig(sim);
    if (sim.nCaves < 2 || sim.nPerCave < 2) {
        throw ConfigurationError("experiment needs n_caves >= 2 and n_per_cave >= 2");
    }
    if (cfg.nTrials < 1) {
        throw ConfigurationError("n_trials must be >= 1");
    }
    if (cfg.nIterSync > cfg.nIterations) {
        throw ConfigurationError("n_iter_sync (" + std::to_string(cfg.nIterSync) +
                                 ") exceeds n_iterations (" + std::to_string(cfg.nIterations) + ")");
    }
    if (cfg.threads < 0) {
        throw ConfigurationError("threads must be >= 0");
    }
}

std::uint64_t trialSeed(std::uint64_t baseSeed, std::uint32_t trial) {
    // splitmix64 finalizer over (seed, trial)
    std::uint64_t z = baseSeed + 0x9E3779B97F4A7C15ULL * (static_cast<std::uint64_t>(trial) + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

Experiment::Experiment(const ExperimentConfig& cfg) : cfg_(cfg) {
    cfg_.sim.topology = Topology::ConnectedCaveman;
    validateExperimentConfig(cfg_);
}

std::map<std::string, std::string> Experiment::attributes() const {
    std::map<std::string, std::string> attrs;
    attrs["K"] = std::to_string(cfg_.sim.K);
    attrs["S"] = formatDouble(cfg_.sim.initialScale);
    attrs["noise_level"] = formatDouble(cfg_.sim.noiseLevel);
    attrs["n_caves"] = std::to_string(cfg_.sim.nCaves);
    attrs["n_per_cave"] = std::to_string(cfg_.sim.nPerCave);
    attrs["n_trials"] = std::to_string(cfg_.nTrials);
    attrs["n_iterations"] = std::to_string(cfg_.nIterations);
    attrs["n_iter_sync"] = std::to_string(cfg_.nIterSync);
    attrs["n_random_edges"] = std::to_string(cfg_.nRandomEdges);
    attrs["seed"] = std::to_string(cfg_.sim.seed);
    attrs["update_variant"] = updateVariantName(cfg_.sim.variant);
    attrs["ordering"] = orderingName(cfg_.sim.ordering);
    attrs["distance_metric"] = cfg_.sim.nonnegativeWeights ? "nonnegative" : "signed";
    return attrs;
}

void Experiment::runTrial(std::uint32_t trial, TrialOutput& out, const std::atomic<bool>* cancel) const {
    SimulationConfig simCfg = cfg_.sim;
    simCfg.seed = trialSeed(cfg_.sim.seed, trial);

    Simulation base(simCfg);
    if (stoppedShort(base, base.run(cfg_.nIterSync, cancel), cfg_.nIterSync)) {
        out.cancelled = true;
        return;
    }

    const std::uint64_t remaining = cfg_.nIterations - cfg_.nIterSync;
    for (std::size_t c = 0; c < kConditions.size(); ++c) {
        Simulation sim = base;  // branch: each condition continues from the same state and RNG
        if (c == 1) {
            sim.rewireShortRange(cfg_.nRandomEdges);
        } else if (c == 2) {
            sim.rewireCount(cfg_.nRandomEdges);
        }
        if (stoppedShort(sim, sim.run(remaining, cancel), remaining)) {
            out.cancelled = true;
            return;
        }

        out.polarization[c] = sim.polarizationSeries();
        out.iterations[c].clear();
        for (const auto& snap : sim.history().snapshots()) {
            out.iterations[c].push_back(snap.iteration);
        }
        if (cfg_.keepHistories) {
            out.histories[c] = sim.history();
        }
    }
}

ExperimentResult Experiment::run(const std::atomic<bool>* cancel) {
    const int nTrials = static_cast<int>(cfg_.nTrials);
    const int nThreads = cfg_.threads > 0 ? cfg_.threads : omp_get_max_threads();
    std::vector<TrialOutput> outputs(cfg_.nTrials);

    #pragma omp parallel for schedule(dynamic) num_threads(nThreads)
    for (int t = 0; t < nTrials; ++t) {
        if (cancel && cancel->load(std::memory_order_relaxed)) continue;
        auto& out = outputs[t];
        out.started = true;
        try {
            runTrial(static_cast<std::uint32_t>(t), out, cancel);
            out.ok = true;
        } catch (const std::exception& e) {
            out.error = e.what();
            out.failure = std::current_exception();
        }
    }

    ExperimentResult result;
    result.attrs = attributes();
    for (const char* key : kConditions) {
        result.conditions[key];
    }

    for (std::uint32_t t = 0; t < cfg_.nTrials; ++t) {
        auto& out = outputs[t];
        if (!out.started || out.cancelled) {
            result.cancelled.push_back(t);
            continue;
        }
        if (!out.ok) {
            if (!cfg_.skipFailedTrials) {
                std::rethrow_exception(out.failure);
            }
            std::cerr << "Trial " << t << " failed, skipping: " << out.error << "\n";
            result.failures.emplace_back(t, out.error);
            continue;
        }
        for (std::size_t c = 0; c < kConditions.size(); ++c) {
            auto& cond = result.conditions[kConditions[c]];
            cond.trials.push_back(t);
            cond.polarization.push_back(std::move(out.polarization[c]));
            cond.iterations.push_back(std::move(out.iterations[c]));
            if (cfg_.keepHistories) {
                cond.histories.push_back(std::move(out.histories[c]));
            }
        }
    }
    result.attrs["n_trials_completed"] = std::to_string(result.condition(kConditionConnected).size());
    result.attrs["n_trials_cancelled"] = std::to_string(result.cancelled.size());
    return result;
}
