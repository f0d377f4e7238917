#ifndef CAVESIM_EXPERIMENT_H
#define CAVESIM_EXPERIMENT_H

#include <array>
#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <vector>
#include "kernel/History.h"
#include "kernel/Simulation.h"

// Condition keys; downstream readers look runs up by these names
constexpr const char* kConditionConnected = "connected caveman";
constexpr const char* kConditionShortRange = "random short-range";
constexpr const char* kConditionAnyRange = "random any-range";

// ---------- Configuration ----------
struct ExperimentConfig {
    SimulationConfig sim;               // topology is forced to ConnectedCaveman
    std::uint32_t nTrials = 10;
    std::uint64_t nIterations = 4000;   // total sweeps per trial
    std::uint64_t nIterSync = 2000;     // sweeps before the conditions diverge
    std::uint32_t nRandomEdges = 20;    // extra ties for the two random conditions
    bool keepHistories = true;          // keep full opinion histories per trial
    bool skipFailedTrials = false;      // false: rethrow the first trial failure
    int threads = 0;                    // 0: OpenMP default
};

void validateExperimentConfig(const ExperimentConfig& cfg);

// Trial seed derived from the base seed; trials never share a stream
std::uint64_t trialSeed(std::uint64_t baseSeed, std::uint32_t trial);

// Results of one condition across all trials
struct ConditionResult {
    std::vector<std::uint32_t> trials;               // ids of trials that completed
    std::vector<std::vector<double>> polarization;   // [trial][snapshot]
    std::vector<std::vector<std::uint64_t>> iterations;  // [trial][snapshot]
    std::vector<History> histories;                  // [trial], empty if not kept

    std::size_t size() const { return trials.size(); }
    double finalPolarization(std::size_t trial) const { return polarization.at(trial).back(); }
    std::vector<double> finalPolarizations() const;
    const std::vector<OpinionVec>& opinionsAt(std::size_t trial, std::size_t snapshot) const {
        return histories.at(trial).at(snapshot).opinions;
    }
};

struct ExperimentResult {
    std::map<std::string, std::string> attrs;
    std::map<std::string, ConditionResult> conditions;
    std::vector<std::pair<std::uint32_t, std::string>> failures;  // (trial, error)
    std::vector<std::uint32_t> cancelled;                          // trials stopped early

    const ConditionResult& condition(const std::string& key) const;
};

/**
 * Flache & Macy caveman experiment for one parameter set.
 *
 * Every trial builds a connected caveman network from its own seed, runs
 * nIterSync sweeps, then copies the network into three conditions:
 *   - "connected caveman": unchanged
 *   - "random short-range": nRandomEdges ties between adjacent caves
 *   - "random any-range":   nRandomEdges ties between any unconnected pair
 * and runs each for the remaining nIterations - nIterSync sweeps.
 *
 * Trials are independent and run in parallel with OpenMP. Results are
 * stored by trial index so the output does not depend on thread scheduling.
 * A trial cut short by `cancel` is dropped from the conditions and counted in
 * attrs["n_trials_cancelled"].
 */
class Experiment {
public:
    explicit Experiment(const ExperimentConfig& cfg);

    ExperimentResult run(const std::atomic<bool>* cancel = nullptr);

    const ExperimentConfig& config() const { return cfg_; }
    std::map<std::string, std::string> attributes() const;

private:
    struct TrialOutput {
        bool started = false;
        bool ok = false;
        bool cancelled = false;  // stopped before its last sweep
        std::string error;
        std::exception_ptr failure;
        std::array<std::vector<double>, 3> polarization;
        std::array<std::vector<std::uint64_t>, 3> iterations;
        std::array<History, 3> histories;
    };

    // Leaves out.cancelled set if any phase stopped short
    void runTrial(std::uint32_t trial, TrialOutput& out, const std::atomic<bool>* cancel) const;

    ExperimentConfig cfg_;
};

#endif // CAVESIM_EXPERIMENT_H
