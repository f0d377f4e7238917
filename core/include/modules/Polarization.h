#ifndef CAVESIM_POLARIZATION_H
#define CAVESIM_POLARIZATION_H

#include <cstdint>
#include <vector>
#include "kernel/Agent.h"

class EventLog;

// Mean absolute difference per dimension, in [0,2] for opinions in [-1,1]
double opinionDistance(const OpinionVec& a, const OpinionVec& b);

/**
 * Variance of pairwise opinion distances around their mean, over all ordered
 * pairs i != j:
 *
 *   d_exp = sum_{i!=j} d(i,j) / (L(L-1))
 *   P     = sum_{i!=j} (d(i,j) - d_exp)^2 / (L(L-1))
 *
 * Throws EmptyNetworkError for L < 2 and DimensionMismatchError if the
 * vectors are not all the same nonzero length. When `trace` is enabled every
 * pair distance and d_exp are logged to it, tagged with `iteration`.
 */
double polarization(const std::vector<OpinionVec>& opinions, EventLog* trace = nullptr,
                    std::uint64_t iteration = 0);
double polarization(const std::vector<Agent>& agents, EventLog* trace = nullptr,
                    std::uint64_t iteration = 0);

#endif // CAVESIM_POLARIZATION_H
