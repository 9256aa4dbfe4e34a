#ifndef MECHC_SCOPE_GUARD_HPP
#define MECHC_SCOPE_GUARD_HPP

#include <utility>

namespace mechc
{
    /**
     * @brief RAII guard for temporarily changing a variable's value.
     *
     * Saves the current value of a variable and restores it when the guard
     * goes out of scope. The solver uses it to run a batch integration
     * without disturbing its step history.
     *
     * @tparam T Type of the variable to guard.
     *
     * @example
     * double dt = 0.1;
     * {
     *     MECHC_ValueGuard<double> guard(&dt, 0.01); // dt = 0.01
     * } // dt is 0.1 again
     */
    template <typename T>
    class MECHC_ValueGuard
    {
    public:
        /**
         * @param target Pointer to the variable to temporarily modify.
         * @param new_value The new value to assign to the variable.
         */
        MECHC_ValueGuard(T *target, T new_value)
            : target(target), old_value(*target)
        {
            *target = std::move(new_value);
        }

        ~MECHC_ValueGuard()
        {
            *target = old_value;
        }

        MECHC_ValueGuard(const MECHC_ValueGuard &) = delete;
        MECHC_ValueGuard &operator=(const MECHC_ValueGuard &) = delete;

    private:
        T *target;   ///< Pointer to the guarded variable
        T old_value; ///< Value restored on destruction
    };
}; // namespace mechc

#endif // MECHC_SCOPE_GUARD_HPP
