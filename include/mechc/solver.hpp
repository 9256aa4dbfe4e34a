#ifndef MECHC_SOLVER_HPP
#define MECHC_SOLVER_HPP

#include <cstddef>
#include <functional>
#include <vector>
#include "mechc/v3d.hpp"
#include "mechc/config.hpp"
#include "mechc/timer.hpp"
#include "mechc/trajectory.hpp"
#include "mechc/buffer_trajectory.hpp"

/*
Call chains driving a buffer:

MECHC_Solver.advance / iterate
 └─> MECHC_Timer.advance / iterate
      └─> MECHC_Timer.step(action)
           └─> MECHC_Solver.buffer_next
                ├─> MECHC_Solver.step
                │    └─> MECHC_two_step
                └─> MECHC_BufferTrajectory.add
*/

namespace mechc
{
    /**
     * @brief Acceleration field of d²u/dt² = f(u, t).
     */
    using MECHC_Field = std::function<MECHC_V3dT(const MECHC_V3dT &u, double t)>;

    /**
     * @brief One step of the explicit position-only two-step scheme.
     *
     * u_{n+1} = 2 u_n - u_{n-1} + a dt²
     *
     * @param u1 Current state u_n.
     * @param u0 Previous state u_{n-1}.
     * @param a Acceleration at (u_n, t_n).
     * @param dt Step size.
     * @return Next state u_{n+1}.
     */
    MECHC_V3dT MECHC_two_step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, const MECHC_V3dT &a, double dt);

    /**
     * @brief Second-order Taylor bootstrap: u0 + v0 dt + a dt² / 2.
     *
     * @param u0 Initial position.
     * @param v0 Initial velocity.
     * @param a Acceleration at u0.
     * @param dt Step size.
     * @return Position after one step.
     */
    MECHC_V3dT MECHC_taylor_step(const MECHC_V3dT &u0, const MECHC_V3dT &v0, const MECHC_V3dT &a, double dt);

    /**
     * @brief Single-body integrator of d²u/dt² = f(u, t).
     *
     * The scheme needs two past states; initial_transform() produces the
     * second one from an initial position and velocity. The local truncation
     * error is O(dt³) and the method is only conditionally stable: oscillatory
     * fields bound the usable dt by their characteristic frequency.
     *
     * The solver owns its clock. Driving a BufferTrajectory with init(),
     * buffer(), advance() or iterate() moves that clock; solve() does not.
     */
    class MECHC_Solver
    {
    private:
        MECHC_Field field;
        MECHC_Config config;
        MECHC_Timer timer;
        double dt0;
        double dt1;

        void buffer_next(MECHC_BufferTrajectory &trajectory, double dt, double t, const MECHC_V3dT *origin);

    public:
        /**
         * @param field Acceleration field.
         * @param dt Step size of the solver clock.
         * @param config Tunables; cStepTolerance is handed to the clock.
         *
         * @throws MECHC_InvalidArgumentError if field is empty or dt <= 0.
         */
        MECHC_Solver(MECHC_Field field, double dt, const MECHC_Config &config = MECHC_Config());

        /**
         * @brief Computes u_{n+1} from u_n = u1 and u_{n-1} = u0 at time t.
         *
         * Records dt as the current step; the former current step becomes the previous one.
         *
         * @throws MECHC_InvalidStepError if dt <= 0.
         */
        MECHC_V3dT step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, double t, double dt);

        /**
         * @brief Same as step(u1, u0, t, dt) using the clock step size.
         */
        MECHC_V3dT step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, double t);

        /**
         * @brief u0 + v0 dt + f(u0, 0) dt² / 2.
         */
        MECHC_V3dT initial_transform(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double dt) const;

        /**
         * @brief Integrates count states with a constant step.
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        std::vector<MECHC_V3dT> solve(const MECHC_V3dT &u0, const MECHC_V3dT &v0, std::size_t count, double dt);

        /**
         * @brief Integrates count states with variable steps.
         *
         * State 0 is u0, state 1 is initial_transform(u0, v0, dt[0]) and each
         * next state i is stepped from state i - 1, at its time, with dt[i - 1].
         * The step history of the solver is left as it was.
         *
         * @param dt Steps between consecutive states, count - 1 of them.
         * @return The count states.
         *
         * @throws MECHC_InvalidArgumentError if dt.size() != max(count - 1, 0).
         * @throws MECHC_InvalidStepError if a step is <= 0.
         */
        std::vector<MECHC_V3dT> solve(
            const MECHC_V3dT &u0,
            const MECHC_V3dT &v0,
            std::size_t count,
            const std::vector<double> &dt);

        /**
         * @brief States covering [0, tmax] at constant step: floor(tmax / dt) + 1 of them.
         *
         * @throws MECHC_InvalidArgumentError if tmax < 0, dt <= 0, or the state count overflows std::size_t.
         */
        std::vector<MECHC_V3dT> solve_duration(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double tmax, double dt);
        std::vector<MECHC_V3dT> solve_duration(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double tmax);

        /**
         * @brief solve() observed from a fixed origin, as a trajectory.
         */
        MECHC_Trajectory trajectory(
            const MECHC_V3dT &u0,
            const MECHC_V3dT &v0,
            std::size_t count,
            double dt,
            const MECHC_V3dT &origin = MECHC_V3dT::zeros());

        /**
         * @brief Writes u0 and the bootstrapped u1 into a buffer and steps the clock once.
         *
         * Afterwards the clock time t1 is the time of the newest sample.
         */
        void init(
            MECHC_BufferTrajectory &trajectory,
            const MECHC_V3dT &u0,
            const MECHC_V3dT &v0,
            const MECHC_V3dT &origin = MECHC_V3dT::zeros());

        /**
         * @brief Appends the next state of a buffer and steps the clock once.
         *
         * Reads last() and nexto(), steps at the clock time and appends the
         * result observed from the origin of the last sample.
         */
        void buffer(MECHC_BufferTrajectory &trajectory);

        /**
         * @brief Like buffer(trajectory), with a new clock step size.
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        void buffer(MECHC_BufferTrajectory &trajectory, double dt);

        /**
         * @brief Like buffer(trajectory, dt), observed from a given origin.
         */
        void buffer(MECHC_BufferTrajectory &trajectory, double dt, const MECHC_V3dT &origin);

        /**
         * @brief Buffers states until the duration is covered.
         * @return Number of steps performed.
         */
        std::size_t advance(MECHC_BufferTrajectory &trajectory, double duration);

        /**
         * @brief Buffers exactly n states.
         */
        void iterate(MECHC_BufferTrajectory &trajectory, std::size_t n);

        MECHC_Timer &get_timer();
        const MECHC_Timer &get_timer() const;
        const MECHC_Config &get_config() const;
        double get_dt0() const;
        double get_dt1() const;
    };
}; // namespace mechc

#endif // MECHC_SOLVER_HPP
