#ifndef MECHC_CONFIG_HPP
#define MECHC_CONFIG_HPP

#include <cstddef>

namespace mechc
{
    // Bounds accepted for cBufferCapacity from the environment
    constexpr std::size_t MECHC_MIN_BUFFER_CAPACITY = 2;
    constexpr std::size_t MECHC_MAX_BUFFER_CAPACITY = std::size_t(1) << 24;

    /**
     * @brief Tunables shared by trajectories and solvers.
     *
     * Solvers keep a copy, so a config can be changed per solver without
     * affecting others.
     */
    struct MECHC_Config
    {
    public:
        double cDefaultStep;          ///< Step used by add() when no step was ever recorded
        std::size_t cBufferCapacity;  ///< Default ring buffer capacity of a body trajectory
        double cEpsilon;              ///< Tolerance of epsilon comparisons (equal1/equal2, is_zero)
        double cStepTolerance;        ///< Relative slack when turning a duration into a step count

        MECHC_Config();
        MECHC_Config(
            double cDefaultStep,
            std::size_t cBufferCapacity,
            double cEpsilon,
            double cStepTolerance);

        /**
         * @brief Builds a config from defaults overridden by environment variables.
         *
         * Reads MECHC_DEFAULT_STEP, MECHC_BUFFER_CAPACITY, MECHC_EPSILON and
         * MECHC_STEP_TOLERANCE. Values that do not parse, or that are not
         * strictly positive, are ignored with a warning. The capacity must be
         * a plain integer within [MECHC_MIN_BUFFER_CAPACITY, MECHC_MAX_BUFFER_CAPACITY].
         *
         * @return Resulting configuration.
         */
        static MECHC_Config from_env();
    };
}; // namespace mechc

#endif // MECHC_CONFIG_HPP
