#include <cmath>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "mechc.hpp"
#include "mechc/exceptions.hpp"

using namespace mechc;

namespace
{
    // Newtonian attraction with G = 1
    MECHC_V3dT gravity(const MECHC_PointState &self, const MECHC_PointState &other, double)
    {
        const MECHC_V3dT d = other.position - self.position;
        const double r = d.mag();
        return d * (other.mass / (r * r * r));
    }

    MECHC_V3dT no_force(const MECHC_PointState &, const MECHC_PointState &, double)
    {
        return MECHC_V3dT::zeros();
    }

    std::vector<MECHC_Point> two_bodies()
    {
        // Total momentum and barycenter both start at zero
        return {
            MECHC_Point("light", 1.0, MECHC_V3dT(-2.0, 0.0, 0.0), MECHC_V3dT(0.0, 0.4, 0.0), 16),
            MECHC_Point("heavy", 2.0, MECHC_V3dT(1.0, 0.0, 0.0), MECHC_V3dT(0.0, -0.2, 0.0), 16),
        };
    }

    std::vector<MECHC_Point> three_bodies()
    {
        return {
            MECHC_Point("a", 1.0, MECHC_V3dT(0.0, 0.0, 0.0), MECHC_V3dT(0.0, 0.1, 0.0), 8),
            MECHC_Point("b", 3.0, MECHC_V3dT(2.0, 1.0, 0.0), MECHC_V3dT(-0.1, 0.0, 0.2), 8),
            MECHC_Point("c", 0.5, MECHC_V3dT(-1.0, 3.0, 1.0), MECHC_V3dT(0.0, 0.0, -0.3), 8),
        };
    }
}

TEST(PointTest, CapacityMustHoldTwoSamples)
{
    EXPECT_THROW(MECHC_Point("p", 1.0, MECHC_V3dT::zeros(), MECHC_V3dT::zeros(), 1), MECHC_InvalidArgumentError);
    EXPECT_THROW(MECHC_Point("p", 1.0, MECHC_V3dT::zeros(), MECHC_V3dT::zeros(), 0), MECHC_InvalidArgumentError);
    EXPECT_NO_THROW(MECHC_Point("p", 1.0, MECHC_V3dT::zeros(), MECHC_V3dT::zeros(), 2));
}

TEST(PointTest, SpeedBeforeAndAfterHistory)
{
    MECHC_Point point("p", 1.0, MECHC_V3dT(1.0, 1.0, 1.0), MECHC_V3dT(0.0, 0.0, 5.0), 4);
    EXPECT_FALSE(point.has_history());
    EXPECT_TRUE(point.position().exact(MECHC_V3dT(1.0, 1.0, 1.0)));
    EXPECT_TRUE(point.speed().exact(MECHC_V3dT(0.0, 0.0, 5.0)));

    point.trajectory.add(MECHC_Pair::vect(MECHC_V3dT(1.0, 2.0, 1.0)), 0.5);
    EXPECT_TRUE(point.has_history());
    EXPECT_TRUE(point.speed().exact(MECHC_V3dT(0.0, 2.0, 0.0)));

    MECHC_PointState state = point.state();
    EXPECT_EQ(state.id, "p");
    EXPECT_DOUBLE_EQ(state.mass, 1.0);
    EXPECT_TRUE(state.position.exact(MECHC_V3dT(1.0, 2.0, 1.0)));
}

TEST(PointTest, ConfigSuppliesCapacity)
{
    MECHC_Config config;
    config.cBufferCapacity = 5;
    MECHC_Point point("p", 1.0, MECHC_V3dT::zeros(), MECHC_V3dT::zeros(), config);
    EXPECT_EQ(point.trajectory.get_capacity(), 5u);
}

TEST(InteractionSolverTest, RejectsEmptyField)
{
    MECHC_Timer timer(0.1);
    EXPECT_THROW(MECHC_InteractionSolver(two_bodies(), MECHC_PairwiseField(), timer), MECHC_InvalidArgumentError);
}

TEST(InteractionSolverTest, BootstrapStepsClockOnce)
{
    MECHC_Timer timer(0.1);
    MECHC_InteractionSolver solver(two_bodies(), gravity, timer);

    EXPECT_DOUBLE_EQ(timer.get_t1(), 0.1);
    EXPECT_EQ(timer.get_idx1(), 1);
    for (const MECHC_Point &body : solver.get_bodies())
    {
        EXPECT_TRUE(body.has_history()) << body.id;
        EXPECT_DOUBLE_EQ(body.trajectory.last_step(), 0.1);
    }

    solver.iterate(5);
    EXPECT_EQ(timer.get_idx1(), 6);
    EXPECT_NEAR(timer.get_t1(), 0.6, 1e-12);
}

TEST(InteractionSolverTest, FreeBodiesMoveUniformly)
{
    MECHC_Timer timer(0.01);
    std::vector<MECHC_Point> bodies{
        MECHC_Point("a", 1.0, MECHC_V3dT(0.0, 0.0, 0.0), MECHC_V3dT(1.0, 0.0, 0.0), 4),
        MECHC_Point("b", 1.0, MECHC_V3dT(5.0, 0.0, 0.0), MECHC_V3dT(0.0, -2.0, 0.0), 4),
    };
    MECHC_InteractionSolver solver(bodies, no_force, timer);

    solver.iterate(99);
    EXPECT_TRUE(solver.get_body("a").position().equal2(MECHC_V3dT(1.0, 0.0, 0.0), 1e-12));
    EXPECT_TRUE(solver.get_body("b").position().equal2(MECHC_V3dT(5.0, -2.0, 0.0), 1e-12));
    EXPECT_TRUE(solver.get_body("b").speed().equal2(MECHC_V3dT(0.0, -2.0, 0.0), 1e-9));
}

TEST(InteractionSolverTest, TwoBodyBarycenterStaysPut)
{
    MECHC_Timer timer(1e-3);
    MECHC_InteractionSolver solver(two_bodies(), gravity, timer);

    EXPECT_TRUE(solver.barycenter().equal2(MECHC_V3dT::zeros(), 1e-12));
    solver.iterate(1000);

    EXPECT_TRUE(solver.barycenter().equal2(MECHC_V3dT::zeros(), 1e-9));
    EXPECT_TRUE(solver.momentum().equal2(MECHC_V3dT::zeros(), 1e-9));

    // Attraction has brought the bodies closer
    const double distance = (solver.get_body("heavy").position() - solver.get_body("light").position()).mag();
    EXPECT_LT(distance, 3.0);
}

TEST(InteractionSolverTest, BodyOrderDoesNotMatter)
{
    MECHC_Timer forward_timer(1e-2);
    MECHC_Timer backward_timer(1e-2);

    std::vector<MECHC_Point> forward_bodies = three_bodies();
    std::vector<MECHC_Point> backward_bodies(forward_bodies.rbegin(), forward_bodies.rend());

    MECHC_InteractionSolver forward(forward_bodies, gravity, forward_timer);
    MECHC_InteractionSolver backward(backward_bodies, gravity, backward_timer);
    forward.iterate(50);
    backward.iterate(50);

    for (const std::string id : {"a", "b", "c"})
    {
        EXPECT_TRUE(forward.get_body(id).position().exact(backward.get_body(id).position())) << id;
    }
}

TEST(InteractionSolverTest, NextStatesDoesNotCommit)
{
    MECHC_Timer timer(1e-2);
    MECHC_InteractionSolver solver(three_bodies(), gravity, timer);

    const std::vector<MECHC_PointState> before = solver.snapshot();
    const std::vector<MECHC_V3dT> first = solver.next_states(timer.get_dt(), timer.get_t1());
    const std::vector<MECHC_V3dT> second = solver.next_states(timer.get_dt(), timer.get_t1());
    const std::vector<MECHC_PointState> after = solver.snapshot();

    ASSERT_EQ(first.size(), 3u);
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_TRUE(first[i].exact(second[i]));
        EXPECT_TRUE(before[i].position.exact(after[i].position));
    }

    solver.step();
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_TRUE(solver.get_bodies()[i].position().exact(first[i]));
    }
}

TEST(InteractionSolverTest, FieldSeesEveryOrderedPairOnce)
{
    MECHC_Timer timer(0.1);
    int calls = 0;
    MECHC_PairwiseField counting = [&calls](const MECHC_PointState &self, const MECHC_PointState &other, double)
    {
        EXPECT_NE(self.id, other.id);
        ++calls;
        return MECHC_V3dT::zeros();
    };
    MECHC_InteractionSolver solver(three_bodies(), counting, timer);
    EXPECT_EQ(calls, 6);

    solver.step();
    EXPECT_EQ(calls, 12);
}

TEST(InteractionSolverTest, AdvanceCoversDuration)
{
    MECHC_Timer timer(0.1);
    MECHC_InteractionSolver solver(two_bodies(), no_force, timer);

    EXPECT_EQ(solver.advance(1.0), 10u);
    EXPECT_NEAR(timer.get_t1(), 1.1, 1e-12);
}

TEST(InteractionSolverTest, CentersAndLookup)
{
    MECHC_Timer timer(0.1);
    std::vector<MECHC_Point> massless{
        MECHC_Point("a", 0.0, MECHC_V3dT(0.0, 0.0, 0.0), MECHC_V3dT::zeros(), 4),
        MECHC_Point("b", 0.0, MECHC_V3dT(4.0, 2.0, 0.0), MECHC_V3dT::zeros(), 4),
    };
    MECHC_InteractionSolver solver(massless, no_force, timer);

    EXPECT_TRUE(solver.center().exact(MECHC_V3dT(2.0, 1.0, 0.0)));
    EXPECT_TRUE(solver.barycenter().exact(solver.center()));
    EXPECT_TRUE(solver.momentum().exact(MECHC_V3dT::zeros()));

    EXPECT_EQ(solver.get_body("b").id, "b");
    EXPECT_THROW(solver.get_body("z"), MECHC_OutOfRangeError);
}

TEST(InteractionSolverTest, MixedBootstrapKeepsBodiesInStep)
{
    MECHC_Timer timer(0.1);
    MECHC_Point moving("moving", 1.0, MECHC_V3dT(0.0, 0.0, 0.0), MECHC_V3dT::zeros(), 4);
    moving.trajectory.add(MECHC_Pair::vect(MECHC_V3dT(0.1, 0.0, 0.0)), 0.1);
    MECHC_Point fresh("fresh", 1.0, MECHC_V3dT(5.0, 0.0, 0.0), MECHC_V3dT(0.0, 1.0, 0.0), 4);

    MECHC_InteractionSolver solver({moving, fresh}, no_force, timer);

    EXPECT_DOUBLE_EQ(timer.get_t1(), 0.1);
    EXPECT_TRUE(solver.get_body("moving").position().equal2(MECHC_V3dT(0.2, 0.0, 0.0), 1e-15));
    EXPECT_TRUE(solver.get_body("fresh").position().equal2(MECHC_V3dT(5.0, 0.1, 0.0), 1e-15));
    for (const MECHC_Point &body : solver.get_bodies())
    {
        EXPECT_DOUBLE_EQ(body.trajectory.last_step(), 0.1) << body.id;
    }

    solver.iterate(8);
    EXPECT_TRUE(solver.get_body("moving").position().equal2(MECHC_V3dT(1.0, 0.0, 0.0), 1e-12));
    EXPECT_TRUE(solver.get_body("fresh").position().equal2(MECHC_V3dT(5.0, 0.9, 0.0), 1e-12));
}

TEST(InteractionSolverTest, NoBootstrapWhenEveryBodyHasHistory)
{
    MECHC_Timer timer(0.1);
    MECHC_Point body("a", 1.0, MECHC_V3dT::zeros(), MECHC_V3dT::zeros(), 4);
    body.trajectory.add(MECHC_Pair::vect(MECHC_V3dT(0.1, 0.0, 0.0)), 0.1);

    MECHC_InteractionSolver solver({body}, no_force, timer);
    EXPECT_DOUBLE_EQ(timer.get_t1(), 0.0);
    EXPECT_TRUE(solver.get_body("a").position().exact(MECHC_V3dT(0.1, 0.0, 0.0)));
}
