/**
 * @file test_directional_blend_solver.cpp
 * @brief Unit tests for 2D blend weight calculation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "animation/blending/DirectionalBlendSolver.hpp"

#include "utils/TestHelpers.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace Cadence;
using namespace Cadence::Test;
using ::testing::FloatNear;
using ::testing::Pointwise;

// =============================================================================
// Fixtures
// =============================================================================

class DirectionalBlendSolverTest : public ::testing::Test {
protected:
    static std::vector<BlendClip2D> MakeClips(std::initializer_list<glm::vec2> positions) {
        std::vector<BlendClip2D> clips;
        for (const auto& p : positions) {
            BlendClip2D clip;
            clip.position = p;
            clips.push_back(clip);
        }
        return clips;
    }

    std::vector<float> Solve(const glm::vec2& input) const {
        return DirectionalBlendSolver::ComputeWeights(m_clips, input, m_settings);
    }

    std::vector<BlendClip2D> m_clips;
    DirectionalBlendSettings m_settings;
};

/**
 * @brief East, North, West, South at unit distance
 */
class CardinalBlendTest : public DirectionalBlendSolverTest {
protected:
    void SetUp() override {
        m_clips = MakeClips({{1.0f, 0.0f}, {0.0f, 1.0f}, {-1.0f, 0.0f}, {0.0f, -1.0f}});
    }

    static constexpr size_t kEast = 0;
    static constexpr size_t kNorth = 1;
    static constexpr size_t kWest = 2;
    static constexpr size_t kSouth = 3;
};

/**
 * @brief Idle at the origin surrounded by eight directions
 */
class EightWayBlendTest : public DirectionalBlendSolverTest {
protected:
    void SetUp() override {
        m_clips = MakeClips({
            {0.0f, 0.0f},                                   // Idle
            {0.0f, 1.0f}, {1.0f, 1.0f}, {1.0f, 0.0f},       // N, NE, E
            {1.0f, -1.0f}, {0.0f, -1.0f}, {-1.0f, -1.0f},   // SE, S, SW
            {-1.0f, 0.0f}, {-1.0f, 1.0f}                    // W, NW
        });
    }
};

// =============================================================================
// Common Cases
// =============================================================================

TEST_F(DirectionalBlendSolverTest, EmptyClipsWriteNothing) {
    std::vector<float> weights = {5.0f};

    DirectionalBlendSolver::ComputeWeights(m_clips, glm::vec2(1.0f, 0.0f), m_settings, weights);

    EXPECT_FLOAT_EQ(5.0f, weights[0]);
    EXPECT_TRUE(Solve(glm::vec2(1.0f, 0.0f)).empty());
}

TEST_F(DirectionalBlendSolverTest, SingleClipGetsFullWeight) {
    m_clips = MakeClips({{1.0f, 0.0f}});

    for (auto algorithm : {Directional2DAlgorithm::SimpleDirectional,
                           Directional2DAlgorithm::InverseDistanceWeighting}) {
        m_settings.algorithm = algorithm;
        EXPECT_FLOAT_EQ(1.0f, Solve(glm::vec2(1.0f, 1.0f))[0]);
        EXPECT_FLOAT_EQ(1.0f, Solve(glm::vec2(0.0f, 0.0f))[0]);
    }
}

TEST_F(DirectionalBlendSolverTest, CoincidentClipsSplitEvenly) {
    m_clips = MakeClips({{0.0f, 0.0f}, {0.0f, 0.0f}});

    for (auto algorithm : {Directional2DAlgorithm::SimpleDirectional,
                           Directional2DAlgorithm::InverseDistanceWeighting}) {
        m_settings.algorithm = algorithm;
        for (const auto& query : {glm::vec2(0.0f), glm::vec2(2.0f, -1.0f)}) {
            const auto weights = Solve(query);
            EXPECT_THAT(weights, Pointwise(FloatNear(1e-6f), std::vector<float>({0.5f, 0.5f})));
        }
    }
}

TEST_F(DirectionalBlendSolverTest, CoincidentOffOriginClipsSplitEvenly) {
    m_clips = MakeClips({{1.0f, 1.0f}, {1.0f, 1.00001f}, {1.00001f, 1.0f}});

    const auto weights = Solve(glm::vec2(1.0f, 1.0f));

    for (float w : weights) {
        EXPECT_NEAR(1.0f / 3.0f, w, 1e-6f);
    }
}

TEST_F(DirectionalBlendSolverTest, AlgorithmNamesRoundTrip) {
    for (auto algorithm : {Directional2DAlgorithm::SimpleDirectional,
                           Directional2DAlgorithm::InverseDistanceWeighting}) {
        const auto parsed = Directional2DAlgorithmFromString(Directional2DAlgorithmToString(algorithm));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(algorithm, *parsed);
    }
    EXPECT_FALSE(Directional2DAlgorithmFromString("freeform_cartesian").has_value());
}

// =============================================================================
// Simple Directional: idle handling
// =============================================================================

TEST_F(DirectionalBlendSolverTest, OriginInputUsesIdleClip) {
    m_clips = MakeClips({{0.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 1.0f}});

    EXPECT_THAT(Solve(glm::vec2(0.0f)), Pointwise(FloatNear(1e-6f), std::vector<float>({1.0f, 0.0f, 0.0f})));
    EXPECT_EQ(0, DirectionalBlendSolver::FindIdleClip(m_clips));
}

TEST_F(DirectionalBlendSolverTest, OriginInputWithoutIdleUsesNearestClip) {
    m_clips = MakeClips({{2.0f, 0.0f}, {0.0f, 0.5f}});

    EXPECT_THAT(Solve(glm::vec2(0.0f)), Pointwise(FloatNear(1e-6f), std::vector<float>({0.0f, 1.0f})));
    EXPECT_EQ(-1, DirectionalBlendSolver::FindIdleClip(m_clips));
}

TEST_F(DirectionalBlendSolverTest, IdleWeightFallsWithMagnitude) {
    m_clips = MakeClips({{0.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 1.0f}});

    const auto slow = Solve(glm::vec2(0.2f, 0.0f));
    const auto fast = Solve(glm::vec2(0.8f, 0.0f));

    EXPECT_NEAR(0.8f, slow[0], 1e-5f);
    EXPECT_NEAR(0.2f, slow[1], 1e-5f);
    EXPECT_GT(slow[0], fast[0]);
    EXPECT_WEIGHTS_NORMALIZED(slow);
    EXPECT_WEIGHTS_NORMALIZED(fast);
}

TEST_F(DirectionalBlendSolverTest, SingleDirectionRampsFromIdle) {
    m_clips = MakeClips({{0.0f, 0.0f}, {2.0f, 0.0f}});

    EXPECT_THAT(Solve(glm::vec2(0.5f, 0.0f)), Pointwise(FloatNear(1e-5f), std::vector<float>({0.75f, 0.25f})));
    // Past the clip the idle contribution is gone
    EXPECT_THAT(Solve(glm::vec2(0.0f, 5.0f)), Pointwise(FloatNear(1e-5f), std::vector<float>({0.0f, 1.0f})));
}

TEST_F(DirectionalBlendSolverTest, RadialRatioUsesInterpolatedReach) {
    m_clips = MakeClips({{0.0f, 0.0f}, {2.0f, 0.0f}, {0.0f, 0.5f}});

    // Halfway in angle: reach is the mean of the two clip distances
    const glm::vec2 input(0.5f, 0.5f);
    const float reach = 0.5f * 2.0f + 0.5f * 0.5f;
    const float radial = glm::length(input) / reach;

    const auto weights = Solve(input);

    EXPECT_NEAR(1.0f - radial, weights[0], 1e-5f);
    EXPECT_NEAR(0.5f * radial, weights[1], 1e-5f);
    EXPECT_NEAR(0.5f * radial, weights[2], 1e-5f);
    EXPECT_WEIGHTS_NORMALIZED(weights);
}

// =============================================================================
// Simple Directional: cardinal and diagonal inputs
// =============================================================================

TEST_F(CardinalBlendTest, CardinalInputSelectsMatchingClip) {
    const glm::vec2 inputs[] = {{1.0f, 0.0f}, {0.0f, 1.0f}, {-1.0f, 0.0f}, {0.0f, -1.0f}};

    for (size_t i = 0; i < 4; ++i) {
        const auto weights = Solve(inputs[i]);
        for (size_t j = 0; j < 4; ++j) {
            EXPECT_NEAR(i == j ? 1.0f : 0.0f, weights[j], 1e-5f) << "input " << i << " clip " << j;
        }
    }
}

TEST_F(CardinalBlendTest, DiagonalBlendsTwoNeighbours) {
    struct Case { glm::vec2 input; size_t a; size_t b; };
    const Case cases[] = {
        {{1.0f, 1.0f}, kEast, kNorth},
        {{-1.0f, 1.0f}, kNorth, kWest},
        {{-1.0f, -1.0f}, kWest, kSouth},
        {{1.0f, -1.0f}, kSouth, kEast},
    };

    for (const auto& c : cases) {
        const auto weights = Solve(c.input);
        EXPECT_NEAR(0.5f, weights[c.a], 1e-5f);
        EXPECT_NEAR(0.5f, weights[c.b], 1e-5f);
        EXPECT_WEIGHTS_NORMALIZED(weights);
    }
}

TEST_F(CardinalBlendTest, OppositeSideReceivesNothing) {
    const auto weights = Solve(glm::vec2(0.3f, 0.9f));

    EXPECT_FLOAT_EQ(0.0f, weights[kWest]);
    EXPECT_FLOAT_EQ(0.0f, weights[kSouth]);
    EXPECT_GT(weights[kNorth], weights[kEast]);
}

TEST_F(CardinalBlendTest, MirroredInputsGiveMirroredWeights) {
    const auto upper = Solve(glm::vec2(0.5f, 0.5f));
    const auto lower = Solve(glm::vec2(0.5f, -0.5f));

    EXPECT_NEAR(upper[kEast], lower[kEast], 1e-5f);
    EXPECT_NEAR(upper[kNorth], lower[kSouth], 1e-5f);
    EXPECT_NEAR(upper[kSouth], lower[kNorth], 1e-5f);
}

TEST_F(CardinalBlendTest, WeightsNormalizedForAnyInput) {
    for (float x = -3.0f; x <= 3.0f; x += 0.25f) {
        for (float y = -3.0f; y <= 3.0f; y += 0.25f) {
            EXPECT_WEIGHTS_NORMALIZED(Solve(glm::vec2(x, y))) << "(" << x << ", " << y << ")";
        }
    }
    EXPECT_WEIGHTS_NORMALIZED(Solve(glm::vec2(100.0f, 100.0f)));
}

TEST_F(CardinalBlendTest, NonFiniteInputTreatedAsZero) {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    // (NaN, 1) behaves as (0, 1)
    const auto weights = Solve(glm::vec2(nan, 1.0f));

    EXPECT_WEIGHTS_NORMALIZED(weights);
    EXPECT_NEAR(1.0f, weights[kNorth], 1e-5f);
}

TEST_F(DirectionalBlendSolverTest, SameAngleClipsStayNormalized) {
    m_clips = MakeClips({{1.0f, 0.0f}, {2.0f, 0.0f}, {3.0f, 0.0f}});

    const auto weights = Solve(glm::vec2(1.0f, 0.0f));

    EXPECT_WEIGHTS_NORMALIZED(weights);
}

TEST_F(DirectionalBlendSolverTest, VeryCloseAnglesStayNormalized) {
    m_clips = MakeClips({{1.0f, 0.0f}, {1.0f, 0.01f}, {1.0f, -0.01f}});

    EXPECT_WEIGHTS_NORMALIZED(Solve(glm::vec2(1.0f, 0.005f)));
}

TEST_F(EightWayBlendTest, CardinalInputUsesCardinalClip) {
    const auto weights = Solve(glm::vec2(0.0f, 1.0f));

    EXPECT_NEAR(1.0f, weights[1], 1e-5f);
    EXPECT_WEIGHTS_NORMALIZED(weights);
}

TEST_F(EightWayBlendTest, DiagonalInputUsesDiagonalClip) {
    const auto weights = Solve(glm::normalize(glm::vec2(1.0f, 1.0f)));

    EXPECT_GT(weights[2], 0.6f);
    EXPECT_WEIGHTS_NORMALIZED(weights);
}

// =============================================================================
// Inverse Distance Weighting
// =============================================================================

class InverseDistanceBlendTest : public CardinalBlendTest {
protected:
    void SetUp() override {
        CardinalBlendTest::SetUp();
        m_settings.algorithm = Directional2DAlgorithm::InverseDistanceWeighting;
    }
};

TEST_F(InverseDistanceBlendTest, ExactPositionGetsFullWeight) {
    EXPECT_THAT(Solve(glm::vec2(1.0f, 0.0f)), Pointwise(FloatNear(1e-6f), std::vector<float>({1.0f, 0.0f, 0.0f, 0.0f})));
    EXPECT_THAT(Solve(glm::vec2(-1.00005f, 0.0f)), Pointwise(FloatNear(1e-6f), std::vector<float>({0.0f, 0.0f, 1.0f, 0.0f})));
}

TEST_F(InverseDistanceBlendTest, CenterDistributesEvenly) {
    const auto weights = Solve(glm::vec2(0.0f));

    for (float w : weights) {
        EXPECT_NEAR(0.25f, w, 1e-5f);
    }
}

TEST_F(InverseDistanceBlendTest, AllClipsContribute) {
    const auto weights = Solve(glm::vec2(0.5f, 0.5f));

    for (float w : weights) {
        EXPECT_GT(w, 0.0f);
    }
    EXPECT_GT(weights[kEast], weights[kWest]);
    EXPECT_GT(weights[kNorth], weights[kSouth]);
    EXPECT_WEIGHTS_NORMALIZED(weights);
}

TEST_F(InverseDistanceBlendTest, MatchesInverseSquareFormula) {
    const glm::vec2 query(0.25f, 0.1f);

    float expected[4];
    float sum = 0.0f;
    for (size_t i = 0; i < 4; ++i) {
        const float d = glm::distance(m_clips[i].position, query);
        expected[i] = 1.0f / (d * d);
        sum += expected[i];
    }

    const auto weights = Solve(query);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_NEAR(expected[i] / sum, weights[i], 1e-5f);
    }
}

TEST_F(InverseDistanceBlendTest, HigherPowerFavoursNearestClip) {
    const glm::vec2 query(0.5f, 0.2f);

    const auto quadratic = Solve(query);
    m_settings.idwPower = 4.0f;
    const auto quartic = Solve(query);

    EXPECT_GT(quartic[kEast], quadratic[kEast]);
    EXPECT_WEIGHTS_NORMALIZED(quartic);
}

TEST_F(InverseDistanceBlendTest, InvalidPowerFallsBackToQuadratic) {
    const glm::vec2 query(0.5f, 0.2f);

    const auto expected = Solve(query);
    m_settings.idwPower = -1.0f;

    EXPECT_THAT(Solve(query), Pointwise(FloatNear(1e-6f), expected));
}
