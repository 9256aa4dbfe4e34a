#ifndef MECHC_TIMER_HPP
#define MECHC_TIMER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

namespace mechc
{
    /**
     * @brief Callback run by the timer once per step, before the clock moves.
     *
     * Receives the step size, the current time t1 and the current iteration idx1.
     */
    using MECHC_TimerAction = std::function<void(double dt, double t, std::int64_t idx)>;

    /**
     * @brief Simulation clock shared by every body of a run.
     *
     * Holds the previous and current time (t0, t1) and iteration (idx0, idx1).
     * After each step t1 - t0 == dt and idx1 - idx0 == 1. The step size may be
     * changed between steps; a step always uses the value in effect when it
     * starts.
     */
    class MECHC_Timer
    {
    private:
        double t0;
        double t1;
        double dt;
        std::int64_t idx0;
        std::int64_t idx1;
        double tolerance;

    public:
        /**
         * @brief Creates a clock at time t.
         *
         * @param dt Step size.
         * @param t Start time; the iteration counters start at floor(t / dt).
         * @param tolerance Relative slack used by steps_for().
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        explicit MECHC_Timer(double dt, double t = 0.0, double tolerance = 1e-9);

        /**
         * @brief Bookkeeping only: t0 = t1, t1 += dt, idx0 = idx1, idx1 += 1.
         */
        void step();

        /**
         * @brief Runs action(dt, t1, idx1), then step().
         */
        void step(const MECHC_TimerAction &action);

        /**
         * @brief Number of steps needed to cover a duration: ceil(duration / dt).
         *
         * A relative tolerance absorbs rounding, so that a duration of exactly
         * n steps does not produce n + 1.
         *
         * @throws MECHC_InvalidArgumentError if duration is negative or not finite,
         *         or if the step count does not fit in std::size_t.
         */
        std::size_t steps_for(double duration) const;

        /**
         * @brief Steps until the duration is covered.
         *
         * @param duration Time to cover, >= 0.
         * @param action Called once per step.
         * @return Number of steps performed.
         *
         * @throws MECHC_InvalidArgumentError if duration is negative.
         */
        std::size_t advance(double duration, const MECHC_TimerAction &action = nullptr);

        /**
         * @brief Performs exactly n steps.
         */
        void iterate(std::size_t n, const MECHC_TimerAction &action = nullptr);

        double get_t0() const;
        double get_t1() const;
        double get_dt() const;
        std::int64_t get_idx0() const;
        std::int64_t get_idx1() const;

        /**
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        void set_dt(double dt);
    };
}; // namespace mechc

#endif // MECHC_TIMER_HPP
