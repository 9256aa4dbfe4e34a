#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include "mechc/solver.hpp"
#include "mechc/scope_guard.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    MECHC_V3dT MECHC_two_step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, const MECHC_V3dT &a, double dt)
    {
        MECHC_V3dT next;
        next.linear_combination(u1, 2.0, u0, -1.0);
        next.fused_multiply_add(a, dt * dt);
        return next;
    }

    MECHC_V3dT MECHC_taylor_step(const MECHC_V3dT &u0, const MECHC_V3dT &v0, const MECHC_V3dT &a, double dt)
    {
        MECHC_V3dT next = u0;
        next.fused_multiply_add(v0, dt);
        next.fused_multiply_add(a, 0.5 * dt * dt);
        return next;
    }

    MECHC_Solver::MECHC_Solver(MECHC_Field field, double dt, const MECHC_Config &config)
        : field(std::move(field)),
          config(config),
          timer(dt, 0.0, config.cStepTolerance),
          dt0(dt),
          dt1(dt)
    {
        if (!this->field)
        {
            throw MECHC_InvalidArgumentError("Acceleration field is empty");
        }
    }

    /**
     * @brief Computes u_{n+1} from u_n = u1 and u_{n-1} = u0 at time t.
     *
     * @param u1 Current state.
     * @param u0 Previous state.
     * @param t Time of the current state.
     * @param dt Step size, > 0.
     * @return Next state. NaN or Inf produced by a singular field are returned as is.
     *
     * @throws MECHC_InvalidStepError if dt <= 0.
     */
    MECHC_V3dT MECHC_Solver::step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, double t, double dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidStepError("Step must be positive, got " + std::to_string(dt), dt);
        }
        this->dt0 = this->dt1;
        this->dt1 = dt;
        return MECHC_two_step(u1, u0, this->field(u1, t), dt);
    }

    MECHC_V3dT MECHC_Solver::step(const MECHC_V3dT &u1, const MECHC_V3dT &u0, double t)
    {
        return this->step(u1, u0, t, this->timer.get_dt());
    }

    MECHC_V3dT MECHC_Solver::initial_transform(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double dt) const
    {
        return MECHC_taylor_step(u0, v0, this->field(u0, 0.0), dt);
    }

    std::vector<MECHC_V3dT> MECHC_Solver::solve(const MECHC_V3dT &u0, const MECHC_V3dT &v0, std::size_t count, double dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidArgumentError("Step must be positive, got " + std::to_string(dt));
        }
        return this->solve(u0, v0, count, std::vector<double>(count > 0 ? count - 1 : 0, dt));
    }

    std::vector<MECHC_V3dT> MECHC_Solver::solve(
        const MECHC_V3dT &u0,
        const MECHC_V3dT &v0,
        std::size_t count,
        const std::vector<double> &dt)
    {
        const std::size_t expected = count > 0 ? count - 1 : 0;
        if (dt.size() != expected)
        {
            throw MECHC_InvalidArgumentError(
                "Expected " + std::to_string(expected) + " steps for " +
                std::to_string(count) + " states, got " + std::to_string(dt.size()));
        }

        std::vector<MECHC_V3dT> states;
        if (count == 0)
        {
            return states;
        }
        states.reserve(count);
        states.push_back(u0);
        if (count == 1)
        {
            return states;
        }
        if (!(dt[0] > 0.0))
        {
            throw MECHC_InvalidStepError("Step must be positive, got " + std::to_string(dt[0]), dt[0]);
        }
        states.push_back(this->initial_transform(u0, v0, dt[0]));

        // Batch integration must not leak into the step history
        MECHC_ValueGuard<double> guard_dt0(&this->dt0, this->dt0);
        MECHC_ValueGuard<double> guard_dt1(&this->dt1, this->dt1);

        double t = dt[0];
        for (std::size_t i = 2; i < count; ++i)
        {
            states.push_back(this->step(states[i - 1], states[i - 2], t, dt[i - 1]));
            t += dt[i - 1];
        }
        MECHC_DEBUG("Solved %zu states up to t=%f", count, t);
        return states;
    }

    std::vector<MECHC_V3dT> MECHC_Solver::solve_duration(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double tmax, double dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidArgumentError("Step must be positive, got " + std::to_string(dt));
        }
        if (!(tmax >= 0.0) || !std::isfinite(tmax))
        {
            throw MECHC_InvalidArgumentError("Duration must be non-negative, got " + std::to_string(tmax));
        }
        const double ratio = tmax / dt;
        const double steps = std::floor(ratio + ratio * this->config.cStepTolerance);
        if (!(steps < static_cast<double>(std::numeric_limits<std::size_t>::max())))
        {
            throw MECHC_InvalidArgumentError(
                "Duration " + std::to_string(tmax) + " needs too many steps of " + std::to_string(dt));
        }
        return this->solve(u0, v0, static_cast<std::size_t>(steps) + 1, dt);
    }

    std::vector<MECHC_V3dT> MECHC_Solver::solve_duration(const MECHC_V3dT &u0, const MECHC_V3dT &v0, double tmax)
    {
        return this->solve_duration(u0, v0, tmax, this->timer.get_dt());
    }

    MECHC_Trajectory MECHC_Solver::trajectory(
        const MECHC_V3dT &u0,
        const MECHC_V3dT &v0,
        std::size_t count,
        double dt,
        const MECHC_V3dT &origin)
    {
        const std::vector<MECHC_V3dT> states = this->solve(u0, v0, count, dt);
        return MECHC_Trajectory::discrete(states, dt, origin);
    }

    void MECHC_Solver::init(
        MECHC_BufferTrajectory &trajectory,
        const MECHC_V3dT &u0,
        const MECHC_V3dT &v0,
        const MECHC_V3dT &origin)
    {
        const double dt = this->timer.get_dt();
        trajectory.add(MECHC_Pair(u0, origin), dt);
        trajectory.add(MECHC_Pair(this->initial_transform(u0, v0, dt), origin), dt);
        this->timer.step();
    }

    void MECHC_Solver::buffer_next(MECHC_BufferTrajectory &trajectory, double dt, double t, const MECHC_V3dT *origin)
    {
        const MECHC_Pair last = trajectory.last();
        const MECHC_V3dT previous = trajectory.nexto().position;
        const MECHC_V3dT next = this->step(last.position, previous, t, dt);
        if (!std::isfinite(next.x) || !std::isfinite(next.y) || !std::isfinite(next.z))
        {
            MECHC_DEBUG("Non-finite state at t=%f: (%f, %f, %f)", t, next.x, next.y, next.z);
        }
        trajectory.add(MECHC_Pair(next, origin != nullptr ? *origin : last.origin), dt);
    }

    void MECHC_Solver::buffer(MECHC_BufferTrajectory &trajectory)
    {
        this->timer.step(
            [this, &trajectory](double dt, double t, std::int64_t)
            {
                this->buffer_next(trajectory, dt, t, nullptr);
            });
    }

    void MECHC_Solver::buffer(MECHC_BufferTrajectory &trajectory, double dt)
    {
        this->timer.set_dt(dt);
        this->buffer(trajectory);
    }

    void MECHC_Solver::buffer(MECHC_BufferTrajectory &trajectory, double dt, const MECHC_V3dT &origin)
    {
        this->timer.set_dt(dt);
        this->timer.step(
            [this, &trajectory, &origin](double step_dt, double t, std::int64_t)
            {
                this->buffer_next(trajectory, step_dt, t, &origin);
            });
    }

    std::size_t MECHC_Solver::advance(MECHC_BufferTrajectory &trajectory, double duration)
    {
        return this->timer.advance(
            duration,
            [this, &trajectory](double dt, double t, std::int64_t)
            {
                this->buffer_next(trajectory, dt, t, nullptr);
            });
    }

    void MECHC_Solver::iterate(MECHC_BufferTrajectory &trajectory, std::size_t n)
    {
        this->timer.iterate(
            n,
            [this, &trajectory](double dt, double t, std::int64_t)
            {
                this->buffer_next(trajectory, dt, t, nullptr);
            });
    }

    MECHC_Timer &MECHC_Solver::get_timer()
    {
        return this->timer;
    }

    const MECHC_Timer &MECHC_Solver::get_timer() const
    {
        return this->timer;
    }

    const MECHC_Config &MECHC_Solver::get_config() const
    {
        return this->config;
    }

    double MECHC_Solver::get_dt0() const
    {
        return this->dt0;
    }

    double MECHC_Solver::get_dt1() const
    {
        return this->dt1;
    }
}; // namespace mechc
