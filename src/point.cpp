#include <string>
#include "mechc/point.hpp"
#include "mechc/exceptions.hpp"

namespace mechc
{
    MECHC_Point::MECHC_Point(
        const std::string &id,
        double mass,
        const MECHC_V3dT &position,
        const MECHC_V3dT &speed,
        std::size_t capacity,
        double default_step)
        : id(id),
          mass(mass),
          trajectory(capacity, default_step),
          initial_speed(speed)
    {
        if (capacity < MECHC_MIN_BUFFER_CAPACITY)
        {
            throw MECHC_InvalidArgumentError(
                "Point '" + id + "' needs a trajectory capacity of at least 2, got " + std::to_string(capacity));
        }
        for (std::size_t i = 0; i < capacity; ++i)
        {
            this->trajectory.set(i, MECHC_Pair::vect(position));
        }
    }

    MECHC_Point::MECHC_Point(
        const std::string &id,
        double mass,
        const MECHC_V3dT &position,
        const MECHC_V3dT &speed,
        const MECHC_Config &config)
        : MECHC_Point(id, mass, position, speed, config.cBufferCapacity, config.cDefaultStep) {}

    bool MECHC_Point::has_history() const
    {
        return this->trajectory.last_step() > 0.0;
    }

    MECHC_V3dT MECHC_Point::position() const
    {
        return this->trajectory.last().position;
    }

    MECHC_V3dT MECHC_Point::speed() const
    {
        if (!this->has_history())
        {
            return this->initial_speed;
        }
        return (this->trajectory.last().position - this->trajectory.nexto().position) / this->trajectory.last_step();
    }

    MECHC_PointState MECHC_Point::state() const
    {
        return MECHC_PointState{this->id, this->mass, this->position(), this->speed()};
    }
}; // namespace mechc
