#include <cmath>
#include <string>
#include "mechc/trajectory.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    // ============================================================================
    // MECHC_TrajectoryInterface
    // ============================================================================

    double MECHC_TrajectoryInterface::duration(std::size_t i) const
    {
        return this->duration(0, i);
    }

    double MECHC_TrajectoryInterface::duration() const
    {
        const std::size_t n = this->get_size();
        return n < 2 ? 0.0 : this->duration(0, n - 1);
    }

    void MECHC_TrajectoryInterface::split_abscissa(double s, std::size_t &k, double &w) const
    {
        const std::size_t n = this->get_size();
        if (n == 0 || !std::isfinite(s) || s < 0.0 || s > static_cast<double>(n - 1))
        {
            throw MECHC_OutOfRangeError(
                "Abscissa " + std::to_string(s) + " outside of trajectory range",
                std::isfinite(s) && s > 0.0 ? n : 0, n);
        }
        const double whole = std::floor(s);
        k = static_cast<std::size_t>(whole);
        w = s - whole;
        if (k == n - 1)
        {
            w = 0.0;
        }
    }

    MECHC_Pair MECHC_TrajectoryInterface::at(double s) const
    {
        std::size_t k;
        double w;
        this->split_abscissa(s, k, w);
        if (w == 0.0)
        {
            return this->get(k);
        }
        return MECHC_Pair::lerp(this->get(k), this->get(k + 1), w);
    }

    double MECHC_TrajectoryInterface::t(double s) const
    {
        std::size_t k;
        double w;
        this->split_abscissa(s, k, w);
        const double tk = this->duration(k);
        if (w == 0.0)
        {
            return tk;
        }
        return tk + w * this->step(k);
    }

    double MECHC_TrajectoryInterface::length() const
    {
        const std::size_t n = this->get_size();
        double total = 0.0;
        for (std::size_t i = 1; i < n; ++i)
        {
            total += this->get(i).relative().dist(this->get(i - 1).relative());
        }
        return total;
    }

    const MECHC_Pair &MECHC_TrajectoryInterface::first() const
    {
        return this->get(0);
    }

    const MECHC_Pair &MECHC_TrajectoryInterface::last() const
    {
        const std::size_t n = this->get_size();
        if (n == 0)
        {
            throw MECHC_OutOfRangeError("Empty trajectory has no last sample", 0, 0);
        }
        return this->get(n - 1);
    }

    const MECHC_Pair &MECHC_TrajectoryInterface::nexto() const
    {
        const std::size_t n = this->get_size();
        if (n < 2)
        {
            throw MECHC_OutOfRangeError("Trajectory holds fewer than two samples", 1, n);
        }
        return this->get(n - 2);
    }

    double MECHC_TrajectoryInterface::last_step() const
    {
        const std::size_t n = this->get_size();
        if (n < 2)
        {
            throw MECHC_OutOfRangeError("Trajectory holds fewer than two samples", 1, n);
        }
        return this->step(n - 2);
    }

    std::vector<MECHC_V3dT> MECHC_TrajectoryInterface::origins() const
    {
        std::vector<MECHC_V3dT> out;
        out.reserve(this->get_size());
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            out.push_back(this->get(i).origin);
        }
        return out;
    }

    std::vector<MECHC_V3dT> MECHC_TrajectoryInterface::absolute() const
    {
        std::vector<MECHC_V3dT> out;
        out.reserve(this->get_size());
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            out.push_back(this->get(i).position);
        }
        return out;
    }

    std::vector<MECHC_V3dT> MECHC_TrajectoryInterface::relative() const
    {
        std::vector<MECHC_V3dT> out;
        out.reserve(this->get_size());
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            out.push_back(this->get(i).relative());
        }
        return out;
    }

    void MECHC_TrajectoryInterface::translate(const MECHC_V3dT &u)
    {
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            MECHC_Pair pair = this->get(i);
            this->set(i, pair.translate(u));
        }
    }

    void MECHC_TrajectoryInterface::homothetic(double s)
    {
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            MECHC_Pair pair = this->get(i);
            this->set(i, pair.homothetic(s));
        }
    }

    bool MECHC_TrajectoryInterface::is_equal(const MECHC_TrajectoryInterface &other, double epsilon) const
    {
        if (this->get_size() != other.get_size())
        {
            return false;
        }
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            if (!this->get(i).is_equal(other.get(i), epsilon))
            {
                return false;
            }
        }
        return true;
    }

    bool MECHC_TrajectoryInterface::is_zero(double epsilon) const
    {
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            if (!this->get(i).is_zero(epsilon))
            {
                return false;
            }
        }
        return true;
    }

    std::vector<double> MECHC_TrajectoryInterface::to_array() const
    {
        std::vector<double> out;
        out.reserve(6 * this->get_size());
        for (std::size_t i = 0; i < this->get_size(); ++i)
        {
            const MECHC_Pair &pair = this->get(i);
            pair.origin.to_array(out);
            pair.position.to_array(out);
        }
        return out;
    }

    // ============================================================================
    // MECHC_Trajectory
    // ============================================================================

    MECHC_Trajectory::MECHC_Trajectory(double default_step)
        : default_step(default_step)
    {
        if (!(default_step > 0.0))
        {
            throw MECHC_InvalidArgumentError("Default step must be positive, got " + std::to_string(default_step));
        }
    }

    MECHC_Trajectory::MECHC_Trajectory(const std::vector<MECHC_Pair> &pairs, double dt)
        : pairs(pairs), default_step(dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidArgumentError("Step must be positive, got " + std::to_string(dt));
        }
        this->dt.assign(pairs.empty() ? 0 : pairs.size() - 1, dt);
    }

    MECHC_Trajectory::MECHC_Trajectory(const std::vector<MECHC_Pair> &pairs, const std::vector<double> &dt)
        : pairs(pairs), dt(dt), default_step(1.0)
    {
        const std::size_t expected = pairs.empty() ? 0 : pairs.size() - 1;
        if (dt.size() != expected)
        {
            throw MECHC_InvalidArgumentError(
                "Expected " + std::to_string(expected) + " steps for " +
                std::to_string(pairs.size()) + " samples, got " + std::to_string(dt.size()));
        }
        for (double value : dt)
        {
            if (value < 0.0)
            {
                throw MECHC_InvalidArgumentError("Steps must not be negative, got " + std::to_string(value));
            }
        }
    }

    std::size_t MECHC_Trajectory::get_size() const
    {
        return this->pairs.size();
    }

    const MECHC_Pair &MECHC_Trajectory::get(std::size_t i) const
    {
        if (i >= this->pairs.size())
        {
            throw MECHC_OutOfRangeError(
                "Index " + std::to_string(i) + " out of bounds", i, this->pairs.size());
        }
        return this->pairs[i];
    }

    void MECHC_Trajectory::set(std::size_t i, const MECHC_Pair &pair)
    {
        if (i >= this->pairs.size())
        {
            throw MECHC_OutOfRangeError(
                "Index " + std::to_string(i) + " out of bounds", i, this->pairs.size());
        }
        this->pairs[i] = pair;
    }

    void MECHC_Trajectory::add(const MECHC_Pair &pair, double dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidArgumentError("Step must be positive, got " + std::to_string(dt));
        }
        if (!this->pairs.empty())
        {
            this->dt.push_back(dt);
        }
        this->pairs.push_back(pair);
    }

    void MECHC_Trajectory::add(const MECHC_Pair &pair)
    {
        double dt = this->default_step;
        if (!this->dt.empty() && this->dt.back() > 0.0)
        {
            dt = this->dt.back();
        }
        this->add(pair, dt);
    }

    double MECHC_Trajectory::step(std::size_t k) const
    {
        if (k >= this->dt.size())
        {
            throw MECHC_OutOfRangeError(
                "Step index " + std::to_string(k) + " out of bounds", k, this->dt.size());
        }
        return this->dt[k];
    }

    double MECHC_Trajectory::duration(std::size_t i, std::size_t j) const
    {
        if (i > j || j > this->dt.size())
        {
            throw MECHC_OutOfRangeError(
                "Invalid duration range [" + std::to_string(i) + ", " + std::to_string(j) + ")",
                j, this->pairs.size());
        }
        double total = 0.0;
        for (std::size_t k = i; k < j; ++k)
        {
            total += this->dt[k];
        }
        return total;
    }

    void MECHC_Trajectory::clear()
    {
        this->pairs.clear();
        this->dt.clear();
    }

    const std::vector<double> &MECHC_Trajectory::get_steps() const
    {
        return this->dt;
    }

    double MECHC_Trajectory::get_default_step() const
    {
        return this->default_step;
    }

    MECHC_Trajectory MECHC_Trajectory::from_array(const std::vector<double> &values, double dt)
    {
        if (values.size() % 6 != 0)
        {
            throw MECHC_InvalidArgumentError(
                "Flat trajectory array size " + std::to_string(values.size()) + " is not a multiple of 6");
        }
        std::vector<MECHC_Pair> pairs;
        pairs.reserve(values.size() / 6);
        for (std::size_t offset = 0; offset < values.size(); offset += 6)
        {
            pairs.emplace_back(
                MECHC_V3dT::from_array(values, offset + 3),
                MECHC_V3dT::from_array(values, offset));
        }
        MECHC_DEBUG("Loaded %zu samples from flat array", pairs.size());
        return MECHC_Trajectory(pairs, dt);
    }

    MECHC_Trajectory MECHC_Trajectory::zeros(const MECHC_V3dT &u, std::size_t size, double dt)
    {
        return MECHC_Trajectory(std::vector<MECHC_Pair>(size, MECHC_Pair::zeros(u)), dt);
    }

    MECHC_Trajectory MECHC_Trajectory::discrete(
        const std::vector<MECHC_V3dT> &positions,
        double dt,
        const MECHC_V3dT &origin)
    {
        std::vector<MECHC_Pair> pairs;
        pairs.reserve(positions.size());
        for (const MECHC_V3dT &position : positions)
        {
            pairs.emplace_back(position, origin);
        }
        return MECHC_Trajectory(pairs, dt);
    }

    MECHC_Trajectory MECHC_Trajectory::linear(
        std::size_t count,
        double dt,
        const MECHC_V3dT &v,
        const MECHC_V3dT &origin)
    {
        std::vector<MECHC_Pair> pairs;
        pairs.reserve(count);
        for (std::size_t k = 0; k < count; ++k)
        {
            MECHC_V3dT position = origin;
            position.fused_multiply_add(v, static_cast<double>(k) * dt);
            pairs.emplace_back(position, origin);
        }
        return MECHC_Trajectory(pairs, dt);
    }
}; // namespace mechc
