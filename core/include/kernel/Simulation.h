#ifndef CAVESIM_SIMULATION_H
#define CAVESIM_SIMULATION_H

#include <atomic>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>
#include "kernel/Agent.h"
#include "kernel/History.h"
#include "kernel/Network.h"
#include "modules/OpinionUpdate.h"
#include "modules/Rewiring.h"
#include "modules/Topology.h"
#include "utils/EventLog.h"

// ---------- Update Ordering ----------
// Asynchronous: random order reshuffled every sweep, each update visible
//   immediately to later agents in the same sweep (Gauss-Seidel).
// Synchronous: every agent reads the previous sweep's frozen state and all
//   updates commit together (Jacobi). A different dynamical system.
enum class UpdateOrdering : std::uint8_t {
    Asynchronous = 0,
    Synchronous = 1
};

const char* orderingName(UpdateOrdering ordering);
UpdateOrdering parseOrdering(const std::string& name);

enum class SimulationState : std::uint8_t {
    Uninitialized = 0,
    Built,
    Rewired,
    Running,
    Converged,
    MaxIterReached
};

const char* stateName(SimulationState state);

// ---------- Configuration ----------
struct SimulationConfig {
    std::uint32_t K = 2;                  // opinion dimensions
    std::uint32_t nCaves = 20;
    std::uint32_t nPerCave = 5;
    Topology topology = Topology::Caveman;
    double initialScale = 1.0;            // S: initial opinions ~ U(-S, S)
    double noiseLevel = 0.0;              // std dev of per-component Gaussian noise
    bool nonnegativeWeights = false;      // weights in [0,1] instead of [-1,1]
    UpdateVariant variant = UpdateVariant::SignDependent;
    UpdateOrdering ordering = UpdateOrdering::Asynchronous;
    std::uint32_t sampleInterval = 1;     // sweeps between history snapshots
    double convergenceTolerance = 0.0;    // 0 disables convergence detection
    std::uint64_t seed = 42;
};

// Throws ConfigurationError describing the first invalid field
void validateConfig(const SimulationConfig& cfg);

// ---------- Simulation Driver ----------
class Simulation {
public:
    Simulation() = default;
    explicit Simulation(const SimulationConfig& cfg);

    // Lifecycle
    void build(const SimulationConfig& cfg);
    void build(const SimulationConfig& cfg, const std::vector<OpinionVec>& opinions);

    // Random long-range ties. Each returns the number of edges added.
    std::size_t rewire(double targetProbability);
    std::size_t rewireCount(std::size_t count);
    std::size_t rewireShortRange(std::size_t count);

    // Runs up to `iterations` sweeps; returns the number actually executed.
    // `cancel` is polled between sweeps.
    std::uint64_t run(std::uint64_t iterations, const std::atomic<bool>* cancel = nullptr);
    std::uint64_t run(std::uint64_t iterations, UpdateOrdering ordering,
                      const std::atomic<bool>* cancel = nullptr);

    // Metrics (computed on demand, never cached)
    double polarizationOf(const Snapshot& snap) const;
    double polarization() const;
    std::vector<double> polarizationSeries() const;

    Snapshot snapshot() const;
    std::map<std::string, std::string> metadata() const;

    // Access
    const SimulationConfig& config() const { return cfg_; }
    SimulationState state() const { return state_; }
    const std::vector<Agent>& agents() const { return agents_; }
    const Network& network() const { return network_; }
    const NonNeighborPool& nonNeighbors() const { return pool_; }
    const History& history() const { return history_; }
    std::uint64_t iteration() const { return iteration_; }
    const std::string& topologyLabel() const { return topologyLabel_; }

    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

private:
    void initAgents(const std::vector<OpinionVec>* injected);
    void requireBuilt(const char* op) const;
    void markRewired(const std::string& label, const std::string& target, std::size_t added);
    double sweepAsynchronous();
    double sweepSynchronous();
    void gatherNeighbors(std::uint32_t id, const std::vector<OpinionVec>* frozen);
    void applyNoise(OpinionVec& opinion);
    void recordSnapshot();

    SimulationConfig cfg_;
    SimulationState state_ = SimulationState::Uninitialized;
    Network network_;
    NonNeighborPool pool_;
    std::vector<Agent> agents_;
    std::vector<std::uint32_t> order_;
    std::vector<const OpinionVec*> scratch_;
    History history_;
    std::uint64_t iteration_ = 0;
    std::mt19937_64 rng_;
    std::string topologyLabel_;
    std::string rewiringTarget_ = "none";
    std::size_t edgesAdded_ = 0;
    UpdateOrdering lastOrdering_ = UpdateOrdering::Asynchronous;
    mutable EventLog event_log_;  // metric tracing is allowed from const queries
};

#endif // CAVESIM_SIMULATION_H
