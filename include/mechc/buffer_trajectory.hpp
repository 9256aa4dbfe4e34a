#ifndef MECHC_BUFFER_TRAJECTORY_HPP
#define MECHC_BUFFER_TRAJECTORY_HPP

#include <cstddef>
#include <vector>
#include "mechc/trajectory.hpp"

namespace mechc
{
    /**
     * @brief Fixed-capacity trajectory stored as a ring buffer.
     *
     * Physical storage is two arrays of `capacity` slots (pairs and steps) and a
     * write index pointing at the oldest slot, the next one to be overwritten.
     * Logical index i (0 = oldest) lives in physical slot (i + write_index) % capacity,
     * so get_size() is always the capacity. Slots never written hold a zero Pair
     * and a zero step.
     *
     * The step stored in the physical slot of logical sample k is the time from
     * sample k to sample k + 1. The step slot of the newest sample is scratch:
     * it is never part of a duration.
     */
    class MECHC_BufferTrajectory : public MECHC_TrajectoryInterface
    {
    private:
        std::vector<MECHC_Pair> pairs;
        std::vector<double> dt;
        std::size_t capacity;
        std::size_t write_index;
        double default_step;

        std::size_t physical(std::size_t i) const;
        std::size_t previous(std::size_t slot) const;
        void check_index(std::size_t i) const;

    public:
        /**
         * @brief Zero-filled buffer.
         *
         * @param capacity Number of retained samples, at least 1.
         * @param default_step Step used by add(pair) before any step is recorded.
         *
         * @throws MECHC_InvalidArgumentError if capacity == 0 or default_step <= 0.
         */
        explicit MECHC_BufferTrajectory(std::size_t capacity, double default_step = 1.0);

        /**
         * @brief Buffer bulk-loaded from a source trajectory (see bufferize()).
         *
         * @throws MECHC_InvalidArgumentError if capacity == 0 or default_step <= 0.
         */
        MECHC_BufferTrajectory(std::size_t capacity, const MECHC_TrajectoryInterface &source, double default_step = 1.0);

        /**
         * @brief Loads a source trajectory of length L.
         *
         * - L >= capacity: keeps the last `capacity` samples and their steps, write_index = 0.
         * - L < capacity: samples go to physical slots [0, L), the remaining
         *   slots are zero-filled and write_index = L.
         *
         * In both cases the next add(pair) repeats the last step of the source.
         *
         * @param source Trajectory to copy. Must not be this buffer.
         */
        void bufferize(const MECHC_TrajectoryInterface &source);

        /**
         * @brief Changes the capacity, keeping the most recent min(old, new) samples in order.
         *
         * Equivalent to bufferizing a snapshot of the current contents.
         *
         * @throws MECHC_InvalidArgumentError if new_capacity == 0.
         */
        void resize(std::size_t new_capacity);

        std::size_t get_size() const override;
        const MECHC_Pair &get(std::size_t i) const override;
        void set(std::size_t i, const MECHC_Pair &pair) override;

        /**
         * @brief Overwrites the oldest slot with pair and advances the write index.
         *
         * @param pair New newest sample.
         * @param dt Time from the previous newest sample to pair.
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        void add(const MECHC_Pair &pair, double dt) override;
        void add(const MECHC_Pair &pair) override;

        double step(std::size_t k) const override;

        /**
         * @brief Sums the steps of logical samples [i, j).
         *
         * When the physical range crosses the end of the storage the sum is
         * split in two: [start, capacity) and [0, end - capacity).
         */
        using MECHC_TrajectoryInterface::duration;
        double duration(std::size_t i, std::size_t j) const override;

        /**
         * @brief Zero-fills every slot and resets the write index.
         */
        void clear() override;

        std::size_t get_capacity() const;
        std::size_t get_write_index() const;

        /**
         * @brief Chronological copy of the buffer as an unbounded trajectory.
         */
        MECHC_Trajectory to_trajectory() const;

        /**
         * @brief `capacity` samples standing still at u, all steps equal to dt.
         */
        static MECHC_BufferTrajectory zeros(const MECHC_V3dT &u, std::size_t capacity, double dt);

        /**
         * @brief Buffer loaded with positions observed from origin.
         */
        static MECHC_BufferTrajectory discrete(
            const std::vector<MECHC_V3dT> &positions,
            std::size_t capacity,
            double dt,
            const MECHC_V3dT &origin);
    };
}; // namespace mechc

#endif // MECHC_BUFFER_TRAJECTORY_HPP
