#include "modules/Rewiring.h"
#include "kernel/Errors.h"
#include <string>

void NonNeighborPool::rebuild(const Network& network) {
    pairs_.clear();
    slot_.clear();

    const std::uint32_t N = network.size();
    const std::uint64_t allPairs = static_cast<std::uint64_t>(N) * (N > 0 ? N - 1 : 0) / 2;
    const std::size_t expected = static_cast<std::size_t>(allPairs - network.edgeCount());
    pairs_.reserve(expected);
    slot_.reserve(expected);

    for (std::uint32_t i = 0; i < N; ++i) {
        for (std::uint32_t j = i + 1; j < N; ++j) {
            if (network.hasEdge(i, j)) continue;
            slot_.emplace(Network::edgeKey(i, j), pairs_.size());
            pairs_.emplace_back(i, j);
        }
    }
}

bool NonNeighborPool::contains(std::uint32_t a, std::uint32_t b) const {
    if (a == b) return false;
    return slot_.count(Network::edgeKey(a, b)) != 0;
}

bool NonNeighborPool::remove(std::uint32_t a, std::uint32_t b) {
    if (a == b) return false;
    auto it = slot_.find(Network::edgeKey(a, b));
    if (it == slot_.end()) return false;

    const std::size_t idx = it->second;
    const std::size_t last = pairs_.size() - 1;
    if (idx != last) {
        pairs_[idx] = pairs_[last];
        slot_[Network::edgeKey(pairs_[idx].first, pairs_[idx].second)] = idx;
    }
    pairs_.pop_back();
    slot_.erase(it);
    return true;
}

RewiringEngine::RewiringEngine(Network& network, NonNeighborPool& pool)
    : network_(network), pool_(pool) {}

void RewiringEngine::connect(const Network::Edge& e) {
    // Copy first: `e` may alias a pool slot that remove() overwrites
    const Network::Edge edge = e;
    if (!pool_.remove(edge.first, edge.second)) {
        throw std::logic_error("rewiring: pair (" + std::to_string(edge.first) + ", " +
                               std::to_string(edge.second) + ") not in non-neighbor pool");
    }
    network_.addEdge(edge.first, edge.second);
}

Network::Edge RewiringEngine::addRandomConnection(std::mt19937_64& rng) {
    if (pool_.empty()) {
        throw EdgeExhaustedError("addRandomConnection: no non-neighbors left to connect");
    }
    std::uniform_int_distribution<std::size_t> pick(0, pool_.size() - 1);
    const Network::Edge edge = pool_.at(pick(rng));
    connect(edge);
    return edge;
}

std::size_t RewiringEngine::addRandomConnections(double targetProbability, std::mt19937_64& rng) {
    if (!(targetProbability >= 0.0 && targetProbability <= 1.0)) {
        throw ConfigurationError("addRandomConnections: probability must be in [0,1] (got " +
                                 std::to_string(targetProbability) + ")");
    }

    // Iterate a stable snapshot; the live pool is reordered by every removal
    const std::vector<Network::Edge> candidates = pool_.pairs();
    std::bernoulli_distribution coin(targetProbability);

    std::size_t added = 0;
    for (const auto& edge : candidates) {
        if (coin(rng)) {
            connect(edge);
            ++added;
        }
    }
    return added;
}

std::size_t RewiringEngine::addRandomConnectionCount(std::size_t count, std::mt19937_64& rng) {
    for (std::size_t i = 0; i < count; ++i) {
        addRandomConnection(rng);
    }
    return count;
}

bool RewiringEngine::areAdjacentCaves(std::uint32_t caveA, std::uint32_t caveB) const {
    const std::uint32_t n = network_.caveCount();
    if (n < 2 || caveA == caveB) return false;
    return (caveA + 1) % n == caveB || (caveB + 1) % n == caveA;
}

Network::Edge RewiringEngine::addShortRangeConnection(std::mt19937_64& rng) {
    std::vector<std::size_t> candidates;
    for (std::size_t i = 0; i < pool_.size(); ++i) {
        const auto& e = pool_.at(i);
        if (areAdjacentCaves(network_.caveOf(e.first), network_.caveOf(e.second))) {
            candidates.push_back(i);
        }
    }
    if (candidates.empty()) {
        throw EdgeExhaustedError("addShortRangeConnection: no short-range non-neighbors left to connect");
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    const Network::Edge edge = pool_.at(candidates[pick(rng)]);
    connect(edge);
    return edge;
}

bool RewiringEngine::checkPartition() const {
    const std::uint64_t N = network_.size();
    const std::uint64_t allPairs = N * (N > 0 ? N - 1 : 0) / 2;
    if (pool_.size() + network_.edgeCount() != allPairs) return false;
    for (const auto& e : pool_.pairs()) {
        if (e.first == e.second || network_.hasEdge(e.first, e.second)) return false;
    }
    return true;
}
