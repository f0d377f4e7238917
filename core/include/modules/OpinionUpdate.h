#ifndef CAVESIM_OPINION_UPDATE_H
#define CAVESIM_OPINION_UPDATE_H

#include <cstdint>
#include <string>
#include <vector>
#include "kernel/Agent.h"

/**
 * Flache-Macy weighted influence rule.
 *
 *   weight(a, b) = 1 - sum_i |a_i - b_i| / (f * K)      f = 2 if nonnegative, else 1
 *   raw_i        = 1 / (2|N|) * sum_n weight(a, n) * (o_n,i - o_a,i)
 *
 * The raw update is then applied with a bounding nonlinearity selected by
 * UpdateVariant. Trajectories produced by the two variants are not comparable.
 */
enum class UpdateVariant : std::uint8_t {
    // o + raw * (1 - o) for o > 0, o + raw * (1 + o) otherwise
    SignDependent = 0,
    // o + raw * (1 - o) for every o, clamped to [-1,1]
    Symmetric = 1
};

const char* updateVariantName(UpdateVariant variant);
UpdateVariant parseUpdateVariant(const std::string& name);

// Throws DimensionMismatchError if the vectors differ in length
double connectionWeight(const OpinionVec& o1, const OpinionVec& o2, bool nonnegative = false);

// Throws NoNeighborsError for an empty neighbor list
OpinionVec rawUpdate(const OpinionVec& self,
                     const std::vector<const OpinionVec*>& neighbors,
                     bool nonnegative = false);

// Applies `raw` to `opinion`; every component of the result lies in [-1,1]
OpinionVec boundedUpdate(const OpinionVec& opinion, const OpinionVec& raw,
                         UpdateVariant variant = UpdateVariant::SignDependent);

inline OpinionVec updateOpinion(const OpinionVec& self,
                                const std::vector<const OpinionVec*>& neighbors,
                                bool nonnegative = false,
                                UpdateVariant variant = UpdateVariant::SignDependent) {
    return boundedUpdate(self, rawUpdate(self, neighbors, nonnegative), variant);
}

#endif // CAVESIM_OPINION_UPDATE_H
