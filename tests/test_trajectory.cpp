#include <vector>
#include <gtest/gtest.h>
#include "mechc/trajectory.hpp"
#include "mechc/exceptions.hpp"

using namespace mechc;

namespace
{
    MECHC_Trajectory make_square()
    {
        // Unit square corners, observed from the world origin
        return MECHC_Trajectory::discrete(
            {MECHC_V3dT(0.0, 0.0, 0.0),
             MECHC_V3dT(1.0, 0.0, 0.0),
             MECHC_V3dT(1.0, 1.0, 0.0),
             MECHC_V3dT(0.0, 1.0, 0.0)},
            0.5,
            MECHC_V3dT::zeros());
    }
}

TEST(TrajectoryTest, ConstructionKeepsStepInvariant)
{
    MECHC_Trajectory empty;
    EXPECT_EQ(empty.get_size(), 0u);
    EXPECT_TRUE(empty.get_steps().empty());

    MECHC_Trajectory square = make_square();
    EXPECT_EQ(square.get_size(), 4u);
    EXPECT_EQ(square.get_steps().size(), 3u);
}

TEST(TrajectoryTest, StepArrayMustMatchSampleCount)
{
    std::vector<MECHC_Pair> pairs(3, MECHC_Pair());
    EXPECT_NO_THROW(MECHC_Trajectory(pairs, std::vector<double>{0.1, 0.2}));
    EXPECT_THROW(MECHC_Trajectory(pairs, std::vector<double>{0.1}), MECHC_InvalidArgumentError);
    EXPECT_THROW(MECHC_Trajectory(pairs, std::vector<double>{0.1, 0.2, 0.3}), MECHC_InvalidArgumentError);
    EXPECT_THROW(MECHC_Trajectory(pairs, 0.0), MECHC_InvalidArgumentError);
}

TEST(TrajectoryTest, AddRepeatsLastStepOrDefaultsToOne)
{
    MECHC_Trajectory trajectory;
    trajectory.add(MECHC_Pair::vect(MECHC_V3dT(0.0, 0.0, 0.0)));
    EXPECT_TRUE(trajectory.get_steps().empty());

    trajectory.add(MECHC_Pair::vect(MECHC_V3dT(1.0, 0.0, 0.0)));
    ASSERT_EQ(trajectory.get_steps().size(), 1u);
    EXPECT_DOUBLE_EQ(trajectory.step(0), 1.0);

    trajectory.add(MECHC_Pair::vect(MECHC_V3dT(2.0, 0.0, 0.0)), 0.25);
    trajectory.add(MECHC_Pair::vect(MECHC_V3dT(3.0, 0.0, 0.0)));
    EXPECT_DOUBLE_EQ(trajectory.step(1), 0.25);
    EXPECT_DOUBLE_EQ(trajectory.step(2), 0.25);
    EXPECT_DOUBLE_EQ(trajectory.last_step(), 0.25);

    EXPECT_THROW(trajectory.add(MECHC_Pair(), -1.0), MECHC_InvalidArgumentError);
}

TEST(TrajectoryTest, GetOutOfRangeThrows)
{
    MECHC_Trajectory square = make_square();
    EXPECT_NO_THROW(square.get(3));
    EXPECT_THROW(square.get(4), MECHC_OutOfRangeError);
    EXPECT_THROW(MECHC_Trajectory().last(), MECHC_OutOfRangeError);
}

TEST(TrajectoryTest, AtIntegerIndexReturnsSampleExactly)
{
    MECHC_Trajectory square = make_square();
    for (std::size_t i = 0; i < square.get_size(); ++i)
    {
        EXPECT_TRUE(square.at(static_cast<double>(i)).exact(square.get(i))) << "i=" << i;
    }
}

TEST(TrajectoryTest, AtInterpolatesBetweenNeighbors)
{
    MECHC_Trajectory square = make_square();
    MECHC_Pair p = square.at(1.25);
    EXPECT_TRUE(p.position.equal2(MECHC_V3dT(1.0, 0.25, 0.0), 1e-15));

    EXPECT_THROW(square.at(-0.1), MECHC_OutOfRangeError);
    EXPECT_THROW(square.at(3.01), MECHC_OutOfRangeError);
}

TEST(TrajectoryTest, DurationAndTime)
{
    std::vector<MECHC_Pair> pairs(4, MECHC_Pair());
    MECHC_Trajectory trajectory(pairs, std::vector<double>{0.1, 0.2, 0.4});

    EXPECT_DOUBLE_EQ(trajectory.duration(0), 0.0);
    EXPECT_DOUBLE_EQ(trajectory.duration(2), 0.3);
    EXPECT_DOUBLE_EQ(trajectory.duration(), 0.7);
    EXPECT_NEAR(trajectory.duration(1) + trajectory.duration(1, 3), trajectory.duration(3), 1e-15);
    EXPECT_THROW(trajectory.duration(4), MECHC_OutOfRangeError);

    EXPECT_DOUBLE_EQ(trajectory.t(2.0), 0.3);
    EXPECT_NEAR(trajectory.t(2.5), 0.5, 1e-15);
    EXPECT_NEAR(trajectory.t(3.0), 0.7, 1e-15);
}

TEST(TrajectoryTest, LengthIsPolylineOfRelativePositions)
{
    MECHC_Trajectory square = make_square();
    EXPECT_DOUBLE_EQ(square.length(), 3.0);

    // Moving the observer with the mobile leaves nothing to measure
    MECHC_Trajectory following = MECHC_Trajectory::zeros(MECHC_V3dT(1.0, 2.0, 3.0), 5, 0.1);
    EXPECT_DOUBLE_EQ(following.length(), 0.0);
    EXPECT_TRUE(following.is_zero(1e-12));
}

TEST(TrajectoryTest, FirstLastNexto)
{
    MECHC_Trajectory square = make_square();
    EXPECT_TRUE(square.first().exact(square.get(0)));
    EXPECT_TRUE(square.last().exact(square.get(3)));
    EXPECT_TRUE(square.nexto().exact(square.get(2)));

    MECHC_Trajectory single;
    single.add(MECHC_Pair());
    EXPECT_THROW(single.nexto(), MECHC_OutOfRangeError);
}

TEST(TrajectoryTest, TranslateAndHomotheticKeepShape)
{
    MECHC_Trajectory square = make_square();
    MECHC_Trajectory moved = make_square();
    moved.translate(MECHC_V3dT(10.0, -3.0, 2.0));

    EXPECT_TRUE(square.is_equal(moved, 1e-12));
    EXPECT_TRUE(moved.origins()[0].exact(MECHC_V3dT(10.0, -3.0, 2.0)));

    moved.homothetic(2.0);
    EXPECT_DOUBLE_EQ(moved.length(), 6.0);
    EXPECT_FALSE(square.is_equal(moved, 1e-12));
}

TEST(TrajectoryTest, FlatArrayRoundTrip)
{
    MECHC_Trajectory square = make_square();
    square.translate(MECHC_V3dT(0.0, 0.0, 1.0));

    std::vector<double> flat = square.to_array();
    ASSERT_EQ(flat.size(), 24u);
    EXPECT_DOUBLE_EQ(flat[2], 1.0); // origin z of the first sample
    EXPECT_DOUBLE_EQ(flat[9], 1.0); // position x of the second sample

    MECHC_Trajectory restored = MECHC_Trajectory::from_array(flat, 0.5);
    ASSERT_EQ(restored.get_size(), 4u);
    for (std::size_t i = 0; i < 4; ++i)
    {
        EXPECT_TRUE(restored.get(i).exact(square.get(i)));
    }
    flat.pop_back();
    EXPECT_THROW(MECHC_Trajectory::from_array(flat, 0.5), MECHC_InvalidArgumentError);
}

TEST(TrajectoryTest, LinearGenerator)
{
    MECHC_Trajectory line = MECHC_Trajectory::linear(5, 0.5, MECHC_V3dT(2.0, 0.0, 0.0), MECHC_V3dT(0.0, 1.0, 0.0));
    EXPECT_TRUE(line.get(4).position.equal2(MECHC_V3dT(4.0, 1.0, 0.0), 1e-15));
    EXPECT_DOUBLE_EQ(line.duration(), 2.0);
    EXPECT_DOUBLE_EQ(line.length(), 4.0);
}

TEST(TrajectoryTest, ClearEmptiesSamplesAndSteps)
{
    MECHC_Trajectory square = make_square();
    square.clear();
    EXPECT_EQ(square.get_size(), 0u);
    EXPECT_TRUE(square.get_steps().empty());
    EXPECT_DOUBLE_EQ(square.duration(), 0.0);
}

TEST(TrajectoryTest, FlatArrayDropsVariableSteps)
{
    std::vector<MECHC_Pair> pairs(3, MECHC_Pair());
    MECHC_Trajectory uneven(pairs, std::vector<double>{0.1, 0.4});

    MECHC_Trajectory restored = MECHC_Trajectory::from_array(uneven.to_array(), 0.25);
    ASSERT_EQ(restored.get_steps().size(), 2u);
    EXPECT_DOUBLE_EQ(restored.step(0), 0.25);
    EXPECT_DOUBLE_EQ(restored.step(1), 0.25);

    MECHC_Trajectory rebuilt(pairs, uneven.get_steps());
    EXPECT_DOUBLE_EQ(rebuilt.duration(), 0.5);
}
