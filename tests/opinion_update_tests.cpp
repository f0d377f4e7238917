#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "modules/OpinionUpdate.h"
#include <random>

namespace {

std::vector<const OpinionVec*> refs(const std::vector<OpinionVec>& v) {
    std::vector<const OpinionVec*> out;
    for (const auto& o : v) out.push_back(&o);
    return out;
}

}

TEST(OpinionUpdateTest, IdenticalOpinionsHaveFullWeight) {
    std::mt19937_64 rng(17);
    std::uniform_real_distribution<double> U(-1.0, 1.0);
    for (std::size_t K : {1u, 2u, 5u}) {
        OpinionVec o(K);
        for (auto& v : o) v = U(rng);
        EXPECT_DOUBLE_EQ(connectionWeight(o, o), 1.0);
        EXPECT_DOUBLE_EQ(connectionWeight(o, o, true), 1.0);
    }
}

TEST(OpinionUpdateTest, OppositeCornersRepel) {
    OpinionVec a{1.0, 1.0};
    OpinionVec b{-1.0, -1.0};
    EXPECT_DOUBLE_EQ(connectionWeight(a, b), -1.0);
    EXPECT_DOUBLE_EQ(connectionWeight(a, b, true), 0.0);
}

TEST(OpinionUpdateTest, WeightIsSymmetricAndBounded) {
    std::mt19937_64 rng(5);
    std::uniform_real_distribution<double> U(-1.0, 1.0);
    for (int i = 0; i < 200; ++i) {
        OpinionVec a{U(rng), U(rng), U(rng)};
        OpinionVec b{U(rng), U(rng), U(rng)};
        const double w = connectionWeight(a, b);
        EXPECT_DOUBLE_EQ(w, connectionWeight(b, a));
        EXPECT_GE(w, -1.0);
        EXPECT_LE(w, 1.0);
        const double wn = connectionWeight(a, b, true);
        EXPECT_GE(wn, 0.0);
        EXPECT_LE(wn, 1.0);
    }
}

TEST(OpinionUpdateTest, WeightDimensionMismatch) {
    EXPECT_THROW(connectionWeight({0.1, 0.2}, {0.1}), DimensionMismatchError);
    EXPECT_THROW(connectionWeight({}, {}), DimensionMismatchError);
}

TEST(OpinionUpdateTest, RawUpdateRequiresNeighbors) {
    std::vector<const OpinionVec*> none;
    EXPECT_THROW(rawUpdate({0.5}, none), NoNeighborsError);
}

// Hand-computed single-neighbor cases with K = 1
TEST(OpinionUpdateTest, PositiveOpinionPulledTowardNeighbor) {
    std::vector<OpinionVec> nbrs{{0.0}};
    // weight = 1 - 0.5 = 0.5; raw = 1/2 * 0.5 * (0 - 0.5) = -0.125
    const OpinionVec raw = rawUpdate({0.5}, refs(nbrs));
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_DOUBLE_EQ(raw[0], -0.125);

    // o > 0: 0.5 + (-0.125)(1 - 0.5)
    EXPECT_DOUBLE_EQ(updateOpinion({0.5}, refs(nbrs))[0], 0.4375);
    // the two variants agree for positive opinions
    EXPECT_DOUBLE_EQ(updateOpinion({0.5}, refs(nbrs), false, UpdateVariant::Symmetric)[0], 0.4375);
}

TEST(OpinionUpdateTest, NegativeOpinionPulledTowardNeighbor) {
    std::vector<OpinionVec> nbrs{{0.0}};
    // raw = 0.125; o <= 0: -0.5 + 0.125(1 - 0.5)
    EXPECT_DOUBLE_EQ(updateOpinion({-0.5}, refs(nbrs))[0], -0.4375);
    // symmetric shrink uses (1 - o) regardless of sign: -0.5 + 0.125(1.5)
    EXPECT_DOUBLE_EQ(updateOpinion({-0.5}, refs(nbrs), false, UpdateVariant::Symmetric)[0], -0.3125);
}

TEST(OpinionUpdateTest, NegativeWeightPushesApart) {
    std::vector<OpinionVec> nbrs{{-0.9, -0.9}};
    // weight = 1 - 3.6/2 = -0.8; raw = 1/2 * -0.8 * -1.8 = 0.72 per component
    const OpinionVec raw = rawUpdate({0.9, 0.9}, refs(nbrs));
    EXPECT_NEAR(raw[0], 0.72, 1e-12);
    EXPECT_NEAR(raw[1], 0.72, 1e-12);

    const OpinionVec next = updateOpinion({0.9, 0.9}, refs(nbrs));
    EXPECT_NEAR(next[0], 0.9 + 0.72 * 0.1, 1e-12);
    EXPECT_LE(next[0], 1.0);

    const OpinionVec sym = updateOpinion({0.9, 0.9}, refs(nbrs), false, UpdateVariant::Symmetric);
    EXPECT_NEAR(sym[0], 0.972, 1e-12);

    // mirrored case: raw = -0.72 and the symmetric shrink (1 + 0.9) overshoots -1
    std::vector<OpinionVec> positive{{0.9, 0.9}};
    EXPECT_NEAR(updateOpinion({-0.9, -0.9}, refs(positive))[0], -0.972, 1e-12);
    const OpinionVec clamped = updateOpinion({-0.9, -0.9}, refs(positive), false, UpdateVariant::Symmetric);
    EXPECT_DOUBLE_EQ(clamped[0], -1.0);
    EXPECT_DOUBLE_EQ(clamped[1], -1.0);

    // nonnegative weights: weight = 1 - 3.6/4 = 0.1, so the pull is toward the neighbor
    const OpinionVec attract = updateOpinion({0.9, 0.9}, refs(nbrs), true);
    EXPECT_LT(attract[0], 0.9);
}

TEST(OpinionUpdateTest, RawUpdateAveragesOverNeighbors) {
    std::vector<OpinionVec> nbrs{{0.0}, {0.5}};
    // neighbor 0: 0.5 * -0.5; neighbor 1: 1.0 * 0.0; sum / (2 * 2)
    EXPECT_DOUBLE_EQ(rawUpdate({0.5}, refs(nbrs))[0], -0.0625);
}

TEST(OpinionUpdateTest, BoundedUpdateClampsEveryComponent) {
    // 0.9 + 0.5(0.1) stays inside; -0.9 - 0.5(1.9) is clamped
    const OpinionVec out = boundedUpdate({0.9, -0.9}, {0.5, -0.5}, UpdateVariant::Symmetric);
    EXPECT_NEAR(out[0], 0.95, 1e-12);
    EXPECT_DOUBLE_EQ(out[1], -1.0);
    EXPECT_THROW(boundedUpdate({0.1, 0.2}, {0.1}), DimensionMismatchError);
}

TEST(OpinionUpdateTest, UpdatesStayInUnitCube) {
    std::mt19937_64 rng(31);
    std::uniform_real_distribution<double> U(-1.0, 1.0);
    const std::size_t K = 3;
    for (int trial = 0; trial < 500; ++trial) {
        OpinionVec self(K);
        for (auto& v : self) v = U(rng);
        std::vector<OpinionVec> nbrs(1 + trial % 6, OpinionVec(K));
        for (auto& n : nbrs) {
            for (auto& v : n) v = U(rng);
        }
        for (auto variant : {UpdateVariant::SignDependent, UpdateVariant::Symmetric}) {
            for (bool nonneg : {false, true}) {
                const OpinionVec next = updateOpinion(self, refs(nbrs), nonneg, variant);
                for (double v : next) {
                    EXPECT_GE(v, -1.0);
                    EXPECT_LE(v, 1.0);
                }
            }
        }
    }
}

TEST(OpinionUpdateTest, ParseVariantNames) {
    EXPECT_EQ(parseUpdateVariant("sign"), UpdateVariant::SignDependent);
    EXPECT_EQ(parseUpdateVariant("sym"), UpdateVariant::Symmetric);
    EXPECT_EQ(parseUpdateVariant(updateVariantName(UpdateVariant::Symmetric)), UpdateVariant::Symmetric);
    EXPECT_THROW(parseUpdateVariant("linear"), ConfigurationError);
}
