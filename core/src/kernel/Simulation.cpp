#include "kernel/Simulation.h"
#include "kernel/Errors.h"
#include "modules/Polarization.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <utility>

namespace {

std::string formatDouble(double v) {
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

}

const char* orderingName(UpdateOrdering ordering) {
    switch (ordering) {
        case UpdateOrdering::Asynchronous: return "asynchronous";
        case UpdateOrdering::Synchronous: return "synchronous";
    }
    return "unknown";
}

UpdateOrdering parseOrdering(const std::string& name) {
    if (name == "async" || name == "asynchronous") return UpdateOrdering::Asynchronous;
    if (name == "sync" || name == "synchronous") return UpdateOrdering::Synchronous;
    throw ConfigurationError("unknown update ordering '" + name + "'");
}

const char* stateName(SimulationState state) {
    switch (state) {
        case SimulationState::Uninitialized: return "uninitialized";
        case SimulationState::Built: return "built";
        case SimulationState::Rewired: return "rewired";
        case SimulationState::Running: return "running";
        case SimulationState::Converged: return "converged";
        case SimulationState::MaxIterReached: return "max-iter-reached";
    }
    return "unknown";
}

void validateConfig(const SimulationConfig& cfg) {
    if (cfg.K < 1) {
        throw ConfigurationError("K must be >= 1 (got " + std::to_string(cfg.K) + ")");
    }
    if (cfg.nCaves < 1) {
        throw ConfigurationError("n_caves must be >= 1 (got " + std::to_string(cfg.nCaves) + ")");
    }
    if (cfg.nPerCave < 1) {
        throw ConfigurationError("n_per_cave must be >= 1 (got " + std::to_string(cfg.nPerCave) + ")");
    }
    if (!(cfg.initialScale > 0.0 && cfg.initialScale <= 1.0)) {
        throw ConfigurationError("S must be in (0,1] (got " + formatDouble(cfg.initialScale) + ")");
    }
    if (!(cfg.noiseLevel >= 0.0) || !std::isfinite(cfg.noiseLevel)) {
        throw ConfigurationError("noise_level must be >= 0 (got " + formatDouble(cfg.noiseLevel) + ")");
    }
    if (cfg.sampleInterval < 1) {
        throw ConfigurationError("sample_interval must be >= 1");
    }
    if (!(cfg.convergenceTolerance >= 0.0)) {
        throw ConfigurationError("convergence tolerance must be >= 0 (got " +
                                 formatDouble(cfg.convergenceTolerance) + ")");
    }
}

Simulation::Simulation(const SimulationConfig& cfg) { build(cfg); }

void Simulation::build(const SimulationConfig& cfg) {
    validateConfig(cfg);
    // Nothing is committed until the topology builds
    Network network = buildTopology(cfg.topology, cfg.nCaves, cfg.nPerCave);
    cfg_ = cfg;
    rng_.seed(cfg_.seed);
    network_ = std::move(network);
    initAgents(nullptr);
}

void Simulation::build(const SimulationConfig& cfg, const std::vector<OpinionVec>& opinions) {
    validateConfig(cfg);
    const std::size_t N = static_cast<std::size_t>(cfg.nCaves) * cfg.nPerCave;
    if (opinions.size() != N) {
        throw ConfigurationError("injected opinions: expected " + std::to_string(N) +
                                 " agents, got " + std::to_string(opinions.size()));
    }
    for (std::size_t i = 0; i < N; ++i) {
        if (opinions[i].size() != cfg.K) {
            throw ConfigurationError("injected opinions: agent " + std::to_string(i) + " has " +
                                     std::to_string(opinions[i].size()) + " components, expected K=" +
                                     std::to_string(cfg.K));
        }
        for (double v : opinions[i]) {
            if (!(v >= -1.0 && v <= 1.0)) {
                throw ConfigurationError("injected opinions: agent " + std::to_string(i) +
                                         " has a component outside [-1,1]");
            }
        }
    }
    Network network = buildTopology(cfg.topology, cfg.nCaves, cfg.nPerCave);
    cfg_ = cfg;
    rng_.seed(cfg_.seed);
    network_ = std::move(network);
    initAgents(&opinions);
}

void Simulation::initAgents(const std::vector<OpinionVec>* injected) {
    const std::uint32_t N = network_.size();
    std::uniform_real_distribution<double> opinionDist(-cfg_.initialScale, cfg_.initialScale);

    agents_.clear();
    agents_.reserve(N);
    for (std::uint32_t i = 0; i < N; ++i) {
        Agent a;
        a.id = i;
        a.cave = network_.caveOf(i);
        if (injected) {
            a.opinions = (*injected)[i];
        } else {
            a.opinions.resize(cfg_.K);
            for (auto& v : a.opinions) v = opinionDist(rng_);
        }
        agents_.push_back(std::move(a));
    }

    order_.resize(N);
    std::iota(order_.begin(), order_.end(), 0u);

    pool_.rebuild(network_);
    history_.clear();
    iteration_ = 0;
    topologyLabel_ = topologyName(cfg_.topology);
    rewiringTarget_ = "none";
    edgesAdded_ = 0;
    lastOrdering_ = cfg_.ordering;
    state_ = SimulationState::Built;
    recordSnapshot();

    std::ostringstream os;
    os << N << " agents in " << cfg_.nCaves << " caves (" << topologyLabel_ << "), "
       << network_.edgeCount() << " edges, " << pool_.size() << " non-neighbor pairs";
    event_log_.log(EventCategory::Build, iteration_, os.str());
}

void Simulation::requireBuilt(const char* op) const {
    if (state_ == SimulationState::Uninitialized) {
        throw InvalidStateError(std::string(op) + ": simulation has not been built");
    }
    if (state_ == SimulationState::Running) {
        throw InvalidStateError(std::string(op) + ": simulation is running");
    }
}

void Simulation::markRewired(const std::string& label, const std::string& target, std::size_t added) {
    topologyLabel_ = label;
    rewiringTarget_ = target;
    edgesAdded_ += added;
    state_ = SimulationState::Rewired;
    event_log_.log(EventCategory::Rewire, iteration_,
                   label + " " + target + ": added " + std::to_string(added) + " edges");
}

std::size_t Simulation::rewire(double targetProbability) {
    requireBuilt("rewire");
    RewiringEngine engine(network_, pool_);
    const std::size_t added = engine.addRandomConnections(targetProbability, rng_);
    markRewired("random any-range", "p=" + formatDouble(targetProbability), added);
    return added;
}

std::size_t Simulation::rewireCount(std::size_t count) {
    requireBuilt("rewireCount");
    RewiringEngine engine(network_, pool_);
    const std::string target = "count=" + std::to_string(count);
    std::size_t added = 0;
    try {
        for (; added < count; ++added) {
            engine.addRandomConnection(rng_);
        }
    } catch (...) {
        // Edges added before the pool ran out stay in the network
        if (added > 0) markRewired("random any-range", target, added);
        throw;
    }
    markRewired("random any-range", target, added);
    return added;
}

std::size_t Simulation::rewireShortRange(std::size_t count) {
    requireBuilt("rewireShortRange");
    RewiringEngine engine(network_, pool_);
    const std::string target = "count=" + std::to_string(count);
    std::size_t added = 0;
    try {
        for (; added < count; ++added) {
            engine.addShortRangeConnection(rng_);
        }
    } catch (...) {
        if (added > 0) markRewired("random short-range", target, added);
        throw;
    }
    markRewired("random short-range", target, added);
    return added;
}

std::uint64_t Simulation::run(std::uint64_t iterations, const std::atomic<bool>* cancel) {
    return run(iterations, cfg_.ordering, cancel);
}

std::uint64_t Simulation::run(std::uint64_t iterations, UpdateOrdering ordering,
                              const std::atomic<bool>* cancel) {
    requireBuilt("run");
    state_ = SimulationState::Running;
    lastOrdering_ = ordering;

    std::uint64_t done = 0;
    bool converged = false;
    try {
        while (done < iterations) {
            if (cancel && cancel->load(std::memory_order_relaxed)) {
                event_log_.log(EventCategory::Cancelled, iteration_,
                               "cancelled after " + std::to_string(done) + " sweeps");
                break;
            }

            const double maxDelta = ordering == UpdateOrdering::Asynchronous
                ? sweepAsynchronous()
                : sweepSynchronous();
            ++iteration_;
            ++done;

            if (iteration_ % cfg_.sampleInterval == 0) {
                recordSnapshot();
            }
            if (event_log_.enabled()) {
                event_log_.log(EventCategory::Sweep, iteration_,
                               std::string(orderingName(ordering)) + " max_delta=" + formatDouble(maxDelta));
            }
            if (cfg_.convergenceTolerance > 0.0 && maxDelta < cfg_.convergenceTolerance) {
                converged = true;
                event_log_.log(EventCategory::Converged, iteration_,
                               "max_delta=" + formatDouble(maxDelta));
                break;
            }
        }
    } catch (...) {
        // Leave the run usable for inspection; the caller decides what to do with it
        state_ = SimulationState::MaxIterReached;
        throw;
    }

    if (history_.empty() || history_.lastIteration() != iteration_) {
        recordSnapshot();
    }
    state_ = converged ? SimulationState::Converged : SimulationState::MaxIterReached;
    return done;
}

void Simulation::gatherNeighbors(std::uint32_t id, const std::vector<OpinionVec>* frozen) {
    const auto& nbrs = network_.neighbors(id);
    if (nbrs.empty()) {
        throw NoNeighborsError("agent " + std::to_string(id) + " has no neighbors");
    }
    scratch_.clear();
    for (auto n : nbrs) {
        validation::checkIndex(n, agents_.size(), "gatherNeighbors");
        scratch_.push_back(frozen ? &(*frozen)[n] : &agents_[n].opinions);
    }
}

void Simulation::applyNoise(OpinionVec& opinion) {
    if (cfg_.noiseLevel <= 0.0) return;
    std::normal_distribution<double> noise(0.0, cfg_.noiseLevel);
    for (auto& v : opinion) {
        v = std::clamp(v + noise(rng_), -1.0, 1.0);
    }
}

double Simulation::sweepAsynchronous() {
    std::shuffle(order_.begin(), order_.end(), rng_);

    double maxDelta = 0.0;
    for (auto id : order_) {
        gatherNeighbors(id, nullptr);
        auto& agent = agents_[id];
        OpinionVec next = updateOpinion(agent.opinions, scratch_, cfg_.nonnegativeWeights, cfg_.variant);
        applyNoise(next);
        for (std::size_t k = 0; k < next.size(); ++k) {
            maxDelta = std::max(maxDelta, std::abs(next[k] - agent.opinions[k]));
        }
        agent.opinions = std::move(next);
        validation::checkOpinions(agent.opinions.data(), agent.opinions.size(), "sweepAsynchronous");
    }
    return maxDelta;
}

double Simulation::sweepSynchronous() {
    std::vector<OpinionVec> frozen;
    frozen.reserve(agents_.size());
    for (const auto& a : agents_) frozen.push_back(a.opinions);

    std::vector<OpinionVec> next(agents_.size());
    for (std::uint32_t id = 0; id < agents_.size(); ++id) {
        gatherNeighbors(id, &frozen);
        next[id] = updateOpinion(frozen[id], scratch_, cfg_.nonnegativeWeights, cfg_.variant);
        applyNoise(next[id]);
    }

    double maxDelta = 0.0;
    for (std::uint32_t id = 0; id < agents_.size(); ++id) {
        for (std::size_t k = 0; k < next[id].size(); ++k) {
            maxDelta = std::max(maxDelta, std::abs(next[id][k] - frozen[id][k]));
        }
        agents_[id].opinions = std::move(next[id]);
        validation::checkOpinions(agents_[id].opinions.data(), agents_[id].opinions.size(),
                                  "sweepSynchronous");
    }
    return maxDelta;
}

void Simulation::recordSnapshot() {
    history_.append(snapshot());
}

Snapshot Simulation::snapshot() const {
    Snapshot snap;
    snap.iteration = iteration_;
    snap.opinions.reserve(agents_.size());
    for (const auto& a : agents_) snap.opinions.push_back(a.opinions);
    return snap;
}

double Simulation::polarizationOf(const Snapshot& snap) const {
    return ::polarization(snap.opinions, &event_log_, snap.iteration);
}

double Simulation::polarization() const {
    if (state_ == SimulationState::Uninitialized) {
        throw InvalidStateError("polarization: simulation has not been built");
    }
    return ::polarization(agents_, &event_log_, iteration_);
}

std::vector<double> Simulation::polarizationSeries() const {
    std::vector<double> series;
    series.reserve(history_.size());
    for (const auto& snap : history_.snapshots()) {
        series.push_back(polarizationOf(snap));
    }
    return series;
}

std::map<std::string, std::string> Simulation::metadata() const {
    std::map<std::string, std::string> meta;
    meta["topology"] = topologyLabel_;
    meta["base_topology"] = topologyName(cfg_.topology);
    meta["K"] = std::to_string(cfg_.K);
    meta["S"] = formatDouble(cfg_.initialScale);
    meta["noise_level"] = formatDouble(cfg_.noiseLevel);
    meta["rewiring_target"] = rewiringTarget_;
    meta["edges_added"] = std::to_string(edgesAdded_);
    meta["n_iterations"] = std::to_string(iteration_);
    meta["seed"] = std::to_string(cfg_.seed);
    meta["n_caves"] = std::to_string(cfg_.nCaves);
    meta["n_per_cave"] = std::to_string(cfg_.nPerCave);
    meta["update_variant"] = updateVariantName(cfg_.variant);
    meta["ordering"] = orderingName(lastOrdering_);
    meta["distance_metric"] = cfg_.nonnegativeWeights ? "nonnegative" : "signed";
    meta["sample_interval"] = std::to_string(cfg_.sampleInterval);
    meta["state"] = stateName(state_);
    return meta;
}
