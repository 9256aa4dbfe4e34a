#include <cmath>
#include <string>
#include <utility>
#include "mechc/interaction_solver.hpp"
#include "mechc/solver.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    MECHC_InteractionSolver::MECHC_InteractionSolver(
        std::vector<MECHC_Point> bodies,
        MECHC_PairwiseField accel,
        MECHC_Timer &timer,
        const MECHC_Config &config)
        : bodies(std::move(bodies)),
          accel(std::move(accel)),
          timer(timer),
          config(config)
    {
        if (!this->accel)
        {
            throw MECHC_InvalidArgumentError("Pairwise acceleration field is empty");
        }
        this->bootstrap();
    }

    /**
     * @brief Gives a second sample to every body that has only its initial position.
     *
     * The net accelerations come from one snapshot of the initial states, so
     * the bootstrap is independent of body order. Bodies that already have a
     * history take a regular two-step in the same tick, keeping every
     * trajectory aligned with the clock.
     */
    void MECHC_InteractionSolver::bootstrap()
    {
        std::size_t pending = 0;
        for (const MECHC_Point &body : this->bodies)
        {
            if (!body.has_history())
            {
                ++pending;
            }
        }
        if (pending == 0)
        {
            return;
        }
        if (pending != this->bodies.size())
        {
            MECHC_WARN("Bootstrapping %zu of %zu bodies; the others step from their history",
                       pending, this->bodies.size());
        }

        const double dt = this->timer.get_dt();
        const std::vector<MECHC_PointState> states = this->snapshot();
        const std::vector<MECHC_V3dT> acc = this->accelerations(states, this->timer.get_t1());

        std::vector<MECHC_V3dT> next;
        next.reserve(this->bodies.size());
        for (std::size_t i = 0; i < this->bodies.size(); ++i)
        {
            const MECHC_BufferTrajectory &history = this->bodies[i].trajectory;
            if (this->bodies[i].has_history())
            {
                next.push_back(MECHC_two_step(history.last().position, history.nexto().position, acc[i], dt));
            }
            else
            {
                next.push_back(MECHC_taylor_step(states[i].position, states[i].speed, acc[i], dt));
            }
        }
        this->commit(next, dt);
        this->timer.step();
        MECHC_DEBUG("Bootstrapped %zu bodies, t=%f", pending, this->timer.get_t1());
    }

    std::vector<MECHC_PointState> MECHC_InteractionSolver::snapshot() const
    {
        std::vector<MECHC_PointState> states;
        states.reserve(this->bodies.size());
        for (const MECHC_Point &body : this->bodies)
        {
            states.push_back(body.state());
        }
        return states;
    }

    std::vector<MECHC_V3dT> MECHC_InteractionSolver::accelerations(
        const std::vector<MECHC_PointState> &states,
        double t) const
    {
        std::vector<MECHC_V3dT> acc(states.size(), MECHC_V3dT::zeros());
        for (std::size_t i = 0; i < states.size(); ++i)
        {
            for (std::size_t j = 0; j < states.size(); ++j)
            {
                if (i == j)
                {
                    continue;
                }
                acc[i] += this->accel(states[i], states[j], t);
            }
        }
        return acc;
    }

    std::vector<MECHC_V3dT> MECHC_InteractionSolver::next_states(double dt, double t) const
    {
        const std::vector<MECHC_PointState> states = this->snapshot();
        const std::vector<MECHC_V3dT> acc = this->accelerations(states, t);

        std::vector<MECHC_V3dT> next;
        next.reserve(this->bodies.size());
        for (std::size_t i = 0; i < this->bodies.size(); ++i)
        {
            const MECHC_BufferTrajectory &history = this->bodies[i].trajectory;
            next.push_back(MECHC_two_step(history.last().position, history.nexto().position, acc[i], dt));
        }
        return next;
    }

    void MECHC_InteractionSolver::commit(const std::vector<MECHC_V3dT> &states, double dt)
    {
        for (std::size_t i = 0; i < this->bodies.size(); ++i)
        {
            const MECHC_V3dT &u = states[i];
            if (!std::isfinite(u.x) || !std::isfinite(u.y) || !std::isfinite(u.z))
            {
                MECHC_DEBUG("Body '%s' reached a non-finite state", this->bodies[i].id.c_str());
            }
            this->bodies[i].trajectory.add(MECHC_Pair::vect(u), dt);
        }
    }

    void MECHC_InteractionSolver::step()
    {
        this->timer.step(
            [this](double dt, double t, std::int64_t)
            {
                this->commit(this->next_states(dt, t), dt);
            });
    }

    std::size_t MECHC_InteractionSolver::advance(double duration)
    {
        return this->timer.advance(
            duration,
            [this](double dt, double t, std::int64_t)
            {
                this->commit(this->next_states(dt, t), dt);
            });
    }

    void MECHC_InteractionSolver::iterate(std::size_t n)
    {
        this->timer.iterate(
            n,
            [this](double dt, double t, std::int64_t)
            {
                this->commit(this->next_states(dt, t), dt);
            });
    }

    MECHC_V3dT MECHC_InteractionSolver::center() const
    {
        MECHC_V3dT sum = MECHC_V3dT::zeros();
        if (this->bodies.empty())
        {
            return sum;
        }
        for (const MECHC_Point &body : this->bodies)
        {
            sum += body.position();
        }
        return sum / static_cast<double>(this->bodies.size());
    }

    MECHC_V3dT MECHC_InteractionSolver::barycenter() const
    {
        double total = 0.0;
        MECHC_V3dT sum = MECHC_V3dT::zeros();
        for (const MECHC_Point &body : this->bodies)
        {
            total += body.mass;
            sum.fused_multiply_add(body.position(), body.mass);
        }
        if (std::fabs(total) < this->config.cEpsilon)
        {
            return this->center();
        }
        return sum / total;
    }

    MECHC_V3dT MECHC_InteractionSolver::momentum() const
    {
        MECHC_V3dT sum = MECHC_V3dT::zeros();
        for (const MECHC_Point &body : this->bodies)
        {
            sum.fused_multiply_add(body.speed(), body.mass);
        }
        return sum;
    }

    const std::vector<MECHC_Point> &MECHC_InteractionSolver::get_bodies() const
    {
        return this->bodies;
    }

    const MECHC_Point &MECHC_InteractionSolver::get_body(const std::string &id) const
    {
        for (const MECHC_Point &body : this->bodies)
        {
            if (body.id == id)
            {
                return body;
            }
        }
        throw MECHC_OutOfRangeError("No body with id '" + id + "'", this->bodies.size(), this->bodies.size());
    }

    const MECHC_Timer &MECHC_InteractionSolver::get_timer() const
    {
        return this->timer;
    }
}; // namespace mechc
