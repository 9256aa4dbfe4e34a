#include <cmath>
#include <limits>
#include <string>
#include "mechc/timer.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    MECHC_Timer::MECHC_Timer(double dt, double t, double tolerance)
        : t0(t), t1(t), dt(dt), idx0(0), idx1(0), tolerance(tolerance)
    {
        if (!(dt > 0.0) || !std::isfinite(dt))
        {
            throw MECHC_InvalidArgumentError("Timer step must be positive, got " + std::to_string(dt));
        }
        this->idx1 = static_cast<std::int64_t>(std::floor(t / dt));
        this->idx0 = this->idx1;
    }

    void MECHC_Timer::step()
    {
        this->t0 = this->t1;
        this->t1 += this->dt;
        this->idx0 = this->idx1;
        this->idx1 += 1;
    }

    void MECHC_Timer::step(const MECHC_TimerAction &action)
    {
        if (action)
        {
            action(this->dt, this->t1, this->idx1);
        }
        this->step();
    }

    std::size_t MECHC_Timer::steps_for(double duration) const
    {
        if (!(duration >= 0.0) || !std::isfinite(duration))
        {
            throw MECHC_InvalidArgumentError("Duration must be non-negative, got " + std::to_string(duration));
        }
        const double ratio = duration / this->dt;
        const double count = std::ceil(ratio - ratio * this->tolerance);
        if (!(count < static_cast<double>(std::numeric_limits<std::size_t>::max())))
        {
            throw MECHC_InvalidArgumentError(
                "Duration " + std::to_string(duration) + " needs too many steps of " + std::to_string(this->dt));
        }
        return static_cast<std::size_t>(count);
    }

    std::size_t MECHC_Timer::advance(double duration, const MECHC_TimerAction &action)
    {
        const std::size_t count = this->steps_for(duration);
        MECHC_DEBUG("Advancing %f with dt=%f: %zu steps", duration, this->dt, count);
        this->iterate(count, action);
        return count;
    }

    void MECHC_Timer::iterate(std::size_t n, const MECHC_TimerAction &action)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            this->step(action);
        }
    }

    double MECHC_Timer::get_t0() const
    {
        return this->t0;
    }

    double MECHC_Timer::get_t1() const
    {
        return this->t1;
    }

    double MECHC_Timer::get_dt() const
    {
        return this->dt;
    }

    std::int64_t MECHC_Timer::get_idx0() const
    {
        return this->idx0;
    }

    std::int64_t MECHC_Timer::get_idx1() const
    {
        return this->idx1;
    }

    void MECHC_Timer::set_dt(double dt)
    {
        if (!(dt > 0.0) || !std::isfinite(dt))
        {
            throw MECHC_InvalidArgumentError("Timer step must be positive, got " + std::to_string(dt));
        }
        this->dt = dt;
    }
}; // namespace mechc
