#ifndef MECHC_POINT_HPP
#define MECHC_POINT_HPP

#include <cstddef>
#include <string>
#include "mechc/v3d.hpp"
#include "mechc/config.hpp"
#include "mechc/buffer_trajectory.hpp"

namespace mechc
{
    /**
     * @brief Read-only view of a body used by pairwise fields.
     */
    struct MECHC_PointState
    {
        std::string id;
        double mass;
        MECHC_V3dT position;
        MECHC_V3dT speed;
    };

    /**
     * @brief Point mass with its own bounded history.
     *
     * The trajectory starts filled with the initial position and no recorded
     * step. Until a step is recorded, speed() reports the initial speed; once
     * the body has a history, speed() is the backward difference of the two
     * newest samples.
     */
    class MECHC_Point
    {
    public:
        std::string id;
        double mass;
        MECHC_BufferTrajectory trajectory;

        /**
         * @param id Body identifier.
         * @param mass Body mass.
         * @param position Initial position.
         * @param speed Initial speed.
         * @param capacity Trajectory capacity, at least 2.
         * @param default_step Default step of the trajectory.
         *
         * @throws MECHC_InvalidArgumentError if capacity < 2.
         */
        MECHC_Point(
            const std::string &id,
            double mass,
            const MECHC_V3dT &position,
            const MECHC_V3dT &speed,
            std::size_t capacity,
            double default_step = 1.0);

        /**
         * @brief Body with the trajectory capacity and default step of a config.
         */
        MECHC_Point(
            const std::string &id,
            double mass,
            const MECHC_V3dT &position,
            const MECHC_V3dT &speed,
            const MECHC_Config &config = MECHC_Config());

        /**
         * @brief True once the trajectory holds a step leading to its newest sample.
         */
        bool has_history() const;

        /**
         * @brief Position of the newest sample.
         */
        MECHC_V3dT position() const;

        /**
         * @brief (last - nexto) / last_step, or the initial speed without history.
         */
        MECHC_V3dT speed() const;

        MECHC_PointState state() const;

    private:
        MECHC_V3dT initial_speed;
    };
}; // namespace mechc

#endif // MECHC_POINT_HPP
