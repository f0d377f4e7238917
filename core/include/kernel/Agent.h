#ifndef CAVESIM_AGENT_H
#define CAVESIM_AGENT_H

#include <cstdint>
#include <vector>

// Opinion vector: K components, each in [-1,1]
using OpinionVec = std::vector<double>;

// ---------- Agent Structure ----------
struct Agent {
    // Identity (stable node index in the network)
    std::uint32_t id = 0;
    std::uint32_t cave = 0;

    // Opinion state, mutated in place by the simulation driver
    OpinionVec opinions;

    std::size_t dims() const { return opinions.size(); }
};

#endif // CAVESIM_AGENT_H
