#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>
#include "mechc/config.hpp"
#include "mechc/log.hpp"

namespace mechc
{
    MECHC_Config::MECHC_Config()
        : cDefaultStep(1.0),
          cBufferCapacity(2048),
          cEpsilon(1e-12),
          cStepTolerance(1e-9) {};

    MECHC_Config::MECHC_Config(
        double cDefaultStep,
        std::size_t cBufferCapacity,
        double cEpsilon,
        double cStepTolerance)
        : cDefaultStep(cDefaultStep),
          cBufferCapacity(cBufferCapacity),
          cEpsilon(cEpsilon),
          cStepTolerance(cStepTolerance) {};

    /**
     * @brief Reads a strictly positive double from the environment.
     *
     * @param name Environment variable name.
     * @param value Overwritten only when the variable is set and valid.
     */
    static void read_positive_env(const char *name, double &value)
    {
        const char *raw = std::getenv(name);
        if (raw == nullptr)
        {
            return;
        }
        const std::string text(raw);
        try
        {
            std::size_t pos = 0;
            double parsed = std::stod(text, &pos);
            if (pos != text.size())
            {
                MECHC_WARN("Ignoring %s='%s': trailing characters", name, raw);
                return;
            }
            if (parsed > 0.0 && std::isfinite(parsed))
            {
                value = parsed;
                return;
            }
        }
        catch (const std::exception &e)
        {
            MECHC_WARN("Cannot parse %s='%s': %s", name, raw, e.what());
            return;
        }
        MECHC_WARN("Ignoring non-positive or non-finite %s='%s'", name, raw);
    }

    /**
     * @brief Reads a body trajectory capacity from the environment.
     *
     * Accepts a plain decimal integer in [MECHC_MIN_BUFFER_CAPACITY, MECHC_MAX_BUFFER_CAPACITY].
     *
     * @param name Environment variable name.
     * @param value Overwritten only when the variable is set and valid.
     */
    static void read_capacity_env(const char *name, std::size_t &value)
    {
        const char *raw = std::getenv(name);
        if (raw == nullptr)
        {
            return;
        }
        const std::string text(raw);
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        {
            MECHC_WARN("Ignoring %s='%s': not a positive integer", name, raw);
            return;
        }
        try
        {
            unsigned long long parsed = std::stoull(text);
            if (parsed < MECHC_MIN_BUFFER_CAPACITY || parsed > MECHC_MAX_BUFFER_CAPACITY)
            {
                MECHC_WARN("Ignoring %s='%s': outside [%zu, %zu]",
                           name, raw, MECHC_MIN_BUFFER_CAPACITY, MECHC_MAX_BUFFER_CAPACITY);
                return;
            }
            value = static_cast<std::size_t>(parsed);
        }
        catch (const std::exception &e)
        {
            MECHC_WARN("Cannot parse %s='%s': %s", name, raw, e.what());
        }
    }

    MECHC_Config MECHC_Config::from_env()
    {
        MECHC_Config config;

        read_positive_env("MECHC_DEFAULT_STEP", config.cDefaultStep);
        read_capacity_env("MECHC_BUFFER_CAPACITY", config.cBufferCapacity);
        read_positive_env("MECHC_EPSILON", config.cEpsilon);
        read_positive_env("MECHC_STEP_TOLERANCE", config.cStepTolerance);

        MECHC_DEBUG("Config: step=%f, capacity=%zu, eps=%g, tol=%g",
                    config.cDefaultStep, config.cBufferCapacity, config.cEpsilon, config.cStepTolerance);
        return config;
    }
}; // namespace mechc
