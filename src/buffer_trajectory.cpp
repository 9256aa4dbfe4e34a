#include <string>
#include "mechc/buffer_trajectory.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    MECHC_BufferTrajectory::MECHC_BufferTrajectory(std::size_t capacity, double default_step)
        : capacity(capacity), write_index(0), default_step(default_step)
    {
        if (capacity == 0)
        {
            throw MECHC_InvalidArgumentError("Buffer capacity must be positive");
        }
        if (!(default_step > 0.0))
        {
            throw MECHC_InvalidArgumentError("Default step must be positive, got " + std::to_string(default_step));
        }
        this->pairs.assign(capacity, MECHC_Pair());
        this->dt.assign(capacity, 0.0);
    }

    MECHC_BufferTrajectory::MECHC_BufferTrajectory(
        std::size_t capacity,
        const MECHC_TrajectoryInterface &source,
        double default_step)
        : MECHC_BufferTrajectory(capacity, default_step)
    {
        this->bufferize(source);
    }

    std::size_t MECHC_BufferTrajectory::physical(std::size_t i) const
    {
        return (i + this->write_index) % this->capacity;
    }

    std::size_t MECHC_BufferTrajectory::previous(std::size_t slot) const
    {
        return slot == 0 ? this->capacity - 1 : slot - 1;
    }

    void MECHC_BufferTrajectory::check_index(std::size_t i) const
    {
        if (i >= this->capacity)
        {
            throw MECHC_OutOfRangeError(
                "Index " + std::to_string(i) + " out of buffer capacity " + std::to_string(this->capacity),
                i, this->capacity);
        }
    }

    void MECHC_BufferTrajectory::bufferize(const MECHC_TrajectoryInterface &source)
    {
        if (&source == this)
        {
            const MECHC_Trajectory snapshot = this->to_trajectory();
            this->bufferize(snapshot);
            return;
        }

        const std::size_t n = source.get_size();
        const std::size_t c = this->capacity;
        const double last_step = n >= 2 ? source.step(n - 2) : 0.0;

        this->pairs.assign(c, MECHC_Pair());
        this->dt.assign(c, 0.0);

        if (n >= c)
        {
            // Keep the newest c samples, drop the oldest n - c
            const std::size_t offset = n - c;
            for (std::size_t k = 0; k < c; ++k)
            {
                this->pairs[k] = source.get(offset + k);
            }
            for (std::size_t k = 0; k + 1 < c; ++k)
            {
                this->dt[k] = source.step(offset + k);
            }
            this->dt[c - 1] = last_step;
            this->write_index = 0;
        }
        else
        {
            for (std::size_t k = 0; k < n; ++k)
            {
                this->pairs[k] = source.get(k);
            }
            for (std::size_t k = 0; k + 1 < n; ++k)
            {
                this->dt[k] = source.step(k);
            }
            if (n > 0)
            {
                this->dt[n - 1] = last_step;
            }
            this->write_index = n;
        }
        MECHC_DEBUG("Bufferized %zu samples into capacity %zu, write index %zu", n, c, this->write_index);
    }

    void MECHC_BufferTrajectory::resize(std::size_t new_capacity)
    {
        if (new_capacity == 0)
        {
            throw MECHC_InvalidArgumentError("Buffer capacity must be positive");
        }
        const MECHC_Trajectory snapshot = this->to_trajectory();
        this->capacity = new_capacity;
        this->write_index = 0;
        this->bufferize(snapshot);
    }

    std::size_t MECHC_BufferTrajectory::get_size() const
    {
        return this->capacity;
    }

    const MECHC_Pair &MECHC_BufferTrajectory::get(std::size_t i) const
    {
        this->check_index(i);
        return this->pairs[this->physical(i)];
    }

    void MECHC_BufferTrajectory::set(std::size_t i, const MECHC_Pair &pair)
    {
        this->check_index(i);
        this->pairs[this->physical(i)] = pair;
    }

    void MECHC_BufferTrajectory::add(const MECHC_Pair &pair, double dt)
    {
        if (!(dt > 0.0))
        {
            throw MECHC_InvalidArgumentError("Step must be positive, got " + std::to_string(dt));
        }
        // The step leads from the current newest sample to the new one
        this->dt[this->previous(this->write_index)] = dt;
        this->pairs[this->write_index] = pair;
        this->write_index = (this->write_index + 1) % this->capacity;
    }

    void MECHC_BufferTrajectory::add(const MECHC_Pair &pair)
    {
        const double last = this->dt[this->previous(this->previous(this->write_index))];
        this->add(pair, last > 0.0 ? last : this->default_step);
    }

    double MECHC_BufferTrajectory::step(std::size_t k) const
    {
        if (k >= this->capacity - 1)
        {
            throw MECHC_OutOfRangeError(
                "Step index " + std::to_string(k) + " out of bounds", k, this->capacity - 1);
        }
        return this->dt[this->physical(k)];
    }

    double MECHC_BufferTrajectory::duration(std::size_t i, std::size_t j) const
    {
        if (i > j || j >= this->capacity)
        {
            throw MECHC_OutOfRangeError(
                "Invalid duration range [" + std::to_string(i) + ", " + std::to_string(j) + ")",
                j, this->capacity);
        }
        const std::size_t start = this->physical(i);
        const std::size_t end = start + (j - i);
        double total = 0.0;
        if (end <= this->capacity)
        {
            for (std::size_t k = start; k < end; ++k)
            {
                total += this->dt[k];
            }
            return total;
        }
        // Range wraps: [start, capacity) then [0, end - capacity)
        double tail = 0.0;
        for (std::size_t k = start; k < this->capacity; ++k)
        {
            tail += this->dt[k];
        }
        double head = 0.0;
        for (std::size_t k = 0; k < end - this->capacity; ++k)
        {
            head += this->dt[k];
        }
        return tail + head;
    }

    void MECHC_BufferTrajectory::clear()
    {
        this->pairs.assign(this->capacity, MECHC_Pair());
        this->dt.assign(this->capacity, 0.0);
        this->write_index = 0;
    }

    std::size_t MECHC_BufferTrajectory::get_capacity() const
    {
        return this->capacity;
    }

    std::size_t MECHC_BufferTrajectory::get_write_index() const
    {
        return this->write_index;
    }

    MECHC_Trajectory MECHC_BufferTrajectory::to_trajectory() const
    {
        std::vector<MECHC_Pair> samples;
        std::vector<double> steps;
        samples.reserve(this->capacity);
        steps.reserve(this->capacity - 1);
        for (std::size_t i = 0; i < this->capacity; ++i)
        {
            samples.push_back(this->pairs[this->physical(i)]);
            if (i + 1 < this->capacity)
            {
                steps.push_back(this->dt[this->physical(i)]);
            }
        }
        return MECHC_Trajectory(samples, steps);
    }

    MECHC_BufferTrajectory MECHC_BufferTrajectory::zeros(const MECHC_V3dT &u, std::size_t capacity, double dt)
    {
        return MECHC_BufferTrajectory(capacity, MECHC_Trajectory::zeros(u, capacity, dt), dt);
    }

    MECHC_BufferTrajectory MECHC_BufferTrajectory::discrete(
        const std::vector<MECHC_V3dT> &positions,
        std::size_t capacity,
        double dt,
        const MECHC_V3dT &origin)
    {
        return MECHC_BufferTrajectory(capacity, MECHC_Trajectory::discrete(positions, dt, origin), dt);
    }
}; // namespace mechc
