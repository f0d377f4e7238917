#ifndef CAVESIM_HISTORY_H
#define CAVESIM_HISTORY_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "kernel/Agent.h"

// Copy of every agent's opinion vector at one iteration, indexed by agent id
struct Snapshot {
    std::uint64_t iteration = 0;
    std::vector<OpinionVec> opinions;
};

// Ordered, append-only sequence of snapshots owned by one run
class History {
public:
    void clear() { snapshots_.clear(); }
    void append(Snapshot snap) { snapshots_.push_back(std::move(snap)); }

    std::size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }
    const Snapshot& at(std::size_t index) const { return snapshots_.at(index); }
    const Snapshot& back() const { return snapshots_.back(); }
    const std::vector<Snapshot>& snapshots() const { return snapshots_; }

    // Opinions of one agent in one snapshot
    const OpinionVec& opinionAt(std::size_t index, std::uint32_t agent) const {
        return snapshots_.at(index).opinions.at(agent);
    }

    // Snapshot taken at `iteration`, or nullptr if that iteration was not sampled
    const Snapshot* findIteration(std::uint64_t iteration) const {
        for (const auto& s : snapshots_) {
            if (s.iteration == iteration) return &s;
        }
        return nullptr;
    }

    std::uint64_t lastIteration() const {
        if (snapshots_.empty()) throw std::out_of_range("History::lastIteration on empty history");
        return snapshots_.back().iteration;
    }

private:
    std::vector<Snapshot> snapshots_;
};

#endif // CAVESIM_HISTORY_H
