#include "modules/OpinionUpdate.h"
#include "kernel/Errors.h"
#include <algorithm>
#include <cmath>

namespace {

void requireSameDims(const OpinionVec& a, const OpinionVec& b, const char* where) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(std::string(where) + ": opinion vectors have different lengths (" +
                                     std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
    }
}

}

const char* updateVariantName(UpdateVariant variant) {
    switch (variant) {
        case UpdateVariant::SignDependent: return "sign-dependent";
        case UpdateVariant::Symmetric: return "symmetric";
    }
    return "unknown";
}

UpdateVariant parseUpdateVariant(const std::string& name) {
    if (name == "sign-dependent" || name == "sign") return UpdateVariant::SignDependent;
    if (name == "symmetric" || name == "sym") return UpdateVariant::Symmetric;
    throw ConfigurationError("unknown update variant '" + name + "'");
}

double connectionWeight(const OpinionVec& o1, const OpinionVec& o2, bool nonnegative) {
    requireSameDims(o1, o2, "connectionWeight");
    const std::size_t K = o1.size();
    if (K == 0) {
        throw DimensionMismatchError("connectionWeight: opinion vectors are empty");
    }

    double numerator = 0.0;
    for (std::size_t i = 0; i < K; ++i) {
        numerator += std::abs(o1[i] - o2[i]);
    }
    const double f = nonnegative ? 2.0 : 1.0;
    return 1.0 - numerator / (f * static_cast<double>(K));
}

OpinionVec rawUpdate(const OpinionVec& self,
                     const std::vector<const OpinionVec*>& neighbors,
                     bool nonnegative) {
    if (neighbors.empty()) {
        throw NoNeighborsError("rawUpdate: agent has no neighbors");
    }

    const std::size_t K = self.size();
    OpinionVec acc(K, 0.0);
    for (const OpinionVec* nb : neighbors) {
        const double w = connectionWeight(self, *nb, nonnegative);
        for (std::size_t i = 0; i < K; ++i) {
            acc[i] += w * ((*nb)[i] - self[i]);
        }
    }

    const double factor = 1.0 / (2.0 * static_cast<double>(neighbors.size()));
    for (auto& v : acc) v *= factor;
    return acc;
}

OpinionVec boundedUpdate(const OpinionVec& opinion, const OpinionVec& raw, UpdateVariant variant) {
    requireSameDims(opinion, raw, "boundedUpdate");

    OpinionVec next(opinion.size());
    for (std::size_t i = 0; i < opinion.size(); ++i) {
        const double o = opinion[i];
        double v;
        if (variant == UpdateVariant::SignDependent) {
            v = o > 0.0 ? o + raw[i] * (1.0 - o) : o + raw[i] * (1.0 + o);
        } else {
            v = o + raw[i] * (1.0 - o);
        }
        // The symmetric form can leave [-1,1] for o < 0; the sign-dependent
        // one only by rounding.
        next[i] = std::clamp(v, -1.0, 1.0);
    }
    return next;
}
