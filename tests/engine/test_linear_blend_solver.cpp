/**
 * @file test_linear_blend_solver.cpp
 * @brief Unit tests for 1D blend weight calculation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "animation/blending/LinearBlendSolver.hpp"

#include "utils/TestHelpers.hpp"

#include <array>
#include <limits>
#include <vector>

using namespace Cadence;
using namespace Cadence::Test;
using ::testing::ElementsAre;
using ::testing::FloatNear;
using ::testing::Pointwise;

// =============================================================================
// Linear Blend Solver Tests
// =============================================================================

class LinearBlendSolverTest : public ::testing::Test {
protected:
    static std::vector<BlendClip1D> MakeClips(std::initializer_list<float> positions) {
        std::vector<BlendClip1D> clips;
        for (float p : positions) {
            BlendClip1D clip;
            clip.position = p;
            clips.push_back(clip);
        }
        return clips;
    }
};

TEST_F(LinearBlendSolverTest, EmptyClipsWriteNothing) {
    const std::vector<BlendClip1D> clips;
    std::array<float, 2> weights = {7.0f, 7.0f};

    LinearBlendSolver::ComputeWeights(clips, 0.5f, weights);

    EXPECT_FLOAT_EQ(7.0f, weights[0]);
    EXPECT_FLOAT_EQ(7.0f, weights[1]);
    EXPECT_TRUE(LinearBlendSolver::ComputeWeights(clips, 0.5f).empty());
}

TEST_F(LinearBlendSolverTest, SingleClipGetsFullWeight) {
    const auto clips = MakeClips({3.0f});

    for (float p : {-10.0f, 3.0f, 10.0f}) {
        const auto weights = LinearBlendSolver::ComputeWeights(clips, p);
        ASSERT_EQ(1u, weights.size());
        EXPECT_FLOAT_EQ(1.0f, weights[0]);
    }
}

TEST_F(LinearBlendSolverTest, ClampsBelowAndAboveRange) {
    const auto clips = MakeClips({0.0f, 1.0f, 2.0f});

    EXPECT_THAT(LinearBlendSolver::ComputeWeights(clips, -5.0f), Pointwise(FloatNear(1e-6f), std::vector<float>({1.0f, 0.0f, 0.0f})));
    EXPECT_THAT(LinearBlendSolver::ComputeWeights(clips, 5.0f), Pointwise(FloatNear(1e-6f), std::vector<float>({0.0f, 0.0f, 1.0f})));
}

TEST_F(LinearBlendSolverTest, InterpolatesBetweenNeighbours) {
    const auto clips = MakeClips({0.0f, 1.0f, 2.0f});

    EXPECT_THAT(LinearBlendSolver::ComputeWeights(clips, 1.5f), Pointwise(FloatNear(1e-6f), std::vector<float>({0.0f, 0.5f, 0.5f})));
    EXPECT_THAT(LinearBlendSolver::ComputeWeights(clips, 0.25f), Pointwise(FloatNear(1e-6f), std::vector<float>({0.75f, 0.25f, 0.0f})));
}

TEST_F(LinearBlendSolverTest, ExactThresholdSelectsSingleClip) {
    const auto clips = MakeClips({0.0f, 1.0f, 2.0f});

    for (size_t i = 0; i < clips.size(); ++i) {
        const auto weights = LinearBlendSolver::ComputeWeights(clips, clips[i].position);
        EXPECT_FLOAT_EQ(1.0f, weights[i]) << "threshold " << i;
        EXPECT_WEIGHTS_NORMALIZED(weights);
    }
}

TEST_F(LinearBlendSolverTest, NarrowRangeResolvesToLowerClip) {
    const auto clips = MakeClips({0.0f, 1.0f, 1.00005f, 2.0f});

    const auto weights = LinearBlendSolver::ComputeWeights(clips, 1.00002f);

    EXPECT_THAT(weights, Pointwise(FloatNear(1e-6f), std::vector<float>({0.0f, 1.0f, 0.0f, 0.0f})));
}

TEST_F(LinearBlendSolverTest, DuplicateThresholdsStayNormalized) {
    const auto clips = MakeClips({0.0f, 1.0f, 1.0f, 2.0f});

    for (float p = -0.5f; p <= 2.5f; p += 0.125f) {
        EXPECT_WEIGHTS_NORMALIZED(LinearBlendSolver::ComputeWeights(clips, p)) << "p = " << p;
    }
}

TEST_F(LinearBlendSolverTest, NonFiniteParameterSelectsFirstClip) {
    const auto clips = MakeClips({0.0f, 1.0f, 2.0f});

    for (float p : {std::numeric_limits<float>::quiet_NaN(),
                    std::numeric_limits<float>::infinity(),
                    -std::numeric_limits<float>::infinity()}) {
        EXPECT_THAT(LinearBlendSolver::ComputeWeights(clips, p), ElementsAre(1.0f, 0.0f, 0.0f));
    }
}

TEST_F(LinearBlendSolverTest, WeightsAlwaysNormalized) {
    const auto clips = MakeClips({-1.0f, 0.0f, 0.3f, 2.0f, 7.5f});

    for (float p = -3.0f; p <= 9.0f; p += 0.1f) {
        EXPECT_WEIGHTS_NORMALIZED(LinearBlendSolver::ComputeWeights(clips, p)) << "p = " << p;
    }
}

TEST_F(LinearBlendSolverTest, FindBlendIndicesReportsUpperWeight) {
    const auto clips = MakeClips({0.0f, 2.0f, 4.0f});

    const auto indices = LinearBlendSolver::FindBlendIndices(clips, 3.0f);

    EXPECT_EQ(1u, indices.lower);
    EXPECT_EQ(2u, indices.upper);
    EXPECT_FLOAT_EQ(0.5f, indices.t);
}

// =============================================================================
// Int Parameter Tests
// =============================================================================

TEST(NormalizeIntParameterTest, MapsRangeToUnitInterval) {
    EXPECT_FLOAT_EQ(0.0f, LinearBlendSolver::NormalizeIntParameter(0, 0, 4));
    EXPECT_FLOAT_EQ(0.5f, LinearBlendSolver::NormalizeIntParameter(2, 0, 4));
    EXPECT_FLOAT_EQ(1.0f, LinearBlendSolver::NormalizeIntParameter(4, 0, 4));
    EXPECT_FLOAT_EQ(0.25f, LinearBlendSolver::NormalizeIntParameter(-5, -6, -2));
}

TEST(NormalizeIntParameterTest, ClampsOutsideRange) {
    EXPECT_FLOAT_EQ(0.0f, LinearBlendSolver::NormalizeIntParameter(-3, 0, 4));
    EXPECT_FLOAT_EQ(1.0f, LinearBlendSolver::NormalizeIntParameter(9, 0, 4));
}

TEST(NormalizeIntParameterTest, EmptyRangeIsZero) {
    EXPECT_FLOAT_EQ(0.0f, LinearBlendSolver::NormalizeIntParameter(3, 3, 3));
    EXPECT_FLOAT_EQ(0.0f, LinearBlendSolver::NormalizeIntParameter(3, 5, 1));
}
