#ifndef MECHC_INTERACTION_SOLVER_HPP
#define MECHC_INTERACTION_SOLVER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "mechc/v3d.hpp"
#include "mechc/config.hpp"
#include "mechc/timer.hpp"
#include "mechc/point.hpp"

/*
Step protocol:

MECHC_InteractionSolver.step
 └─> MECHC_Timer.step(action)
      ├─> MECHC_InteractionSolver.next_states
      │    ├─> MECHC_InteractionSolver.snapshot       (no body mutated yet)
      │    ├─> MECHC_InteractionSolver.accelerations  (sum over the snapshot)
      │    └─> MECHC_two_step                         (per body history)
      └─> MECHC_InteractionSolver.commit              (all bodies at once)
*/

namespace mechc
{
    /**
     * @brief Acceleration of `self` caused by `other` at time t.
     */
    using MECHC_PairwiseField = std::function<MECHC_V3dT(
        const MECHC_PointState &self,
        const MECHC_PointState &other,
        double t)>;

    /**
     * @brief Drives N bodies on one shared clock.
     *
     * Every step evaluates all pairwise accelerations against a snapshot taken
     * before any body moves, then commits every new state, then moves the clock
     * once. Bodies are owned by the solver; the clock is borrowed and must
     * outlive it.
     */
    class MECHC_InteractionSolver
    {
    private:
        std::vector<MECHC_Point> bodies;
        MECHC_PairwiseField accel;
        MECHC_Timer &timer;
        MECHC_Config config;

        void bootstrap();
        void commit(const std::vector<MECHC_V3dT> &states, double dt);

    public:
        /**
         * @brief Takes the bodies and bootstraps those without a history.
         *
         * Bodies without history receive initial_transform-style Taylor steps
         * computed from the initial snapshot. If only some bodies lack a
         * history, the others take a regular step in the same tick. The clock
         * is then stepped once. Nothing happens when every body has a history.
         *
         * @param bodies Bodies to integrate.
         * @param accel Pairwise acceleration.
         * @param timer Shared clock.
         * @param config Tunables; cEpsilon bounds the total mass used by barycenter().
         *
         * @throws MECHC_InvalidArgumentError if accel is empty.
         */
        MECHC_InteractionSolver(
            std::vector<MECHC_Point> bodies,
            MECHC_PairwiseField accel,
            MECHC_Timer &timer,
            const MECHC_Config &config = MECHC_Config());

        /**
         * @brief States of every body, in body order.
         */
        std::vector<MECHC_PointState> snapshot() const;

        /**
         * @brief Net acceleration of every body against a snapshot, self excluded.
         */
        std::vector<MECHC_V3dT> accelerations(const std::vector<MECHC_PointState> &states, double t) const;

        /**
         * @brief Next position of every body, computed without committing.
         *
         * @param dt Step size.
         * @param t Current time.
         */
        std::vector<MECHC_V3dT> next_states(double dt, double t) const;

        /**
         * @brief One synchronized step of every body, then one clock step.
         */
        void step();

        /**
         * @brief Steps until the duration is covered.
         * @return Number of steps performed.
         */
        std::size_t advance(double duration);

        /**
         * @brief Performs exactly n steps.
         */
        void iterate(std::size_t n);

        /**
         * @brief Geometric center of the current positions.
         */
        MECHC_V3dT center() const;

        /**
         * @brief Mass-weighted center; center() when the total mass is negligible.
         */
        MECHC_V3dT barycenter() const;

        /**
         * @brief Sum of mass times speed.
         */
        MECHC_V3dT momentum() const;

        const std::vector<MECHC_Point> &get_bodies() const;

        /**
         * @throws MECHC_OutOfRangeError if no body has this id.
         */
        const MECHC_Point &get_body(const std::string &id) const;

        const MECHC_Timer &get_timer() const;
    };
}; // namespace mechc

#endif // MECHC_INTERACTION_SOLVER_HPP
