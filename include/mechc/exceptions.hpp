#ifndef MECHC_EXCEPTIONS_HPP
#define MECHC_EXCEPTIONS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mechc
{
    class MECHC_SolverRuntimeError : public std::runtime_error
    {
    public:
        MECHC_SolverRuntimeError(const std::string &message)
            : std::runtime_error(message) {};
    };

    /**
     * @brief Raised when a constructor or an operation receives an unusable argument:
     * zero capacity, non-positive step size, mismatched step array, malformed flat array.
     */
    class MECHC_InvalidArgumentError : public MECHC_SolverRuntimeError
    {
    public:
        MECHC_InvalidArgumentError(const std::string &message)
            : MECHC_SolverRuntimeError(message) {};
    };

    /**
     * @brief Raised by the two-step integrator when asked to step with dt <= 0.
     */
    class MECHC_InvalidStepError : public MECHC_InvalidArgumentError
    {
    public:
        double dt;

        MECHC_InvalidStepError(
            const std::string &message,
            double dt)
            : MECHC_InvalidArgumentError(message),
              dt(dt) {};
    };

    /**
     * @brief Raised when an index or abscissa falls outside the sampled range.
     */
    class MECHC_OutOfRangeError : public MECHC_SolverRuntimeError
    {
    public:
        std::size_t index;
        std::size_t size;

        MECHC_OutOfRangeError(
            const std::string &message,
            std::size_t index,
            std::size_t size)
            : MECHC_SolverRuntimeError(message),
              index(index),
              size(size) {};
    };
}; // mechc

#endif //  MECHC_EXCEPTIONS_HPP
