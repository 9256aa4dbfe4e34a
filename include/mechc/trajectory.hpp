#ifndef MECHC_TRAJECTORY_HPP
#define MECHC_TRAJECTORY_HPP

#include <cstddef>
#include <vector>
#include "mechc/pair.hpp"

namespace mechc
{
    /**
     * @brief Query and append contract shared by every trajectory.
     *
     * A trajectory is a chronological sequence of Pair samples indexed from 0
     * (oldest) to get_size() - 1 (newest), with one time step between each two
     * consecutive samples: step(k) is the time elapsed from sample k to k + 1.
     *
     * Implementations provide storage access (get, set, add, step, the range
     * duration and clear). Interpolation, time lookup and the derived
     * geometric queries are implemented here on top of that access, so they
     * behave the same for unbounded and ring-buffered storage.
     */
    class MECHC_TrajectoryInterface
    {
    public:
        virtual ~MECHC_TrajectoryInterface() = default;

        /**
         * @brief Returns the number of samples.
         */
        virtual std::size_t get_size() const = 0;

        /**
         * @brief Returns the sample at logical index i.
         *
         * @throws MECHC_OutOfRangeError if i >= get_size().
         */
        virtual const MECHC_Pair &get(std::size_t i) const = 0;

        /**
         * @brief Replaces the sample at logical index i. Steps are kept.
         *
         * @throws MECHC_OutOfRangeError if i >= get_size().
         */
        virtual void set(std::size_t i, const MECHC_Pair &pair) = 0;

        /**
         * @brief Appends a sample reached after a step of dt.
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        virtual void add(const MECHC_Pair &pair, double dt) = 0;

        /**
         * @brief Appends a sample, repeating the last recorded step.
         *
         * The default step is used when no step was recorded yet.
         */
        virtual void add(const MECHC_Pair &pair) = 0;

        /**
         * @brief Returns the time step between samples k and k + 1.
         *
         * @throws MECHC_OutOfRangeError if k + 1 >= get_size().
         */
        virtual double step(std::size_t k) const = 0;

        /**
         * @brief Sums the steps of samples [i, j), that is the time from sample i to sample j.
         *
         * @throws MECHC_OutOfRangeError unless i <= j < get_size().
         */
        virtual double duration(std::size_t i, std::size_t j) const = 0;

        /**
         * @brief Removes (or zero-fills) every sample and step.
         */
        virtual void clear() = 0;

        /**
         * @brief Time from the first sample to sample i.
         */
        double duration(std::size_t i) const;

        /**
         * @brief Time from the first to the last sample. Zero for fewer than two samples.
         */
        double duration() const;

        /**
         * @brief Pair interpolated at curvilinear abscissa s.
         *
         * For k = floor(s) and w = s - k, origin and position are interpolated
         * independently between get(k) and get(k + 1). Integer abscissas
         * return the stored sample exactly.
         *
         * @param s Real index in [0, get_size() - 1].
         * @return Interpolated pair.
         *
         * @throws MECHC_OutOfRangeError if s is outside the range or not finite.
         */
        MECHC_Pair at(double s) const;

        /**
         * @brief Time at curvilinear abscissa s.
         *
         * duration(floor(s)) plus the fraction of step(floor(s)) given by s - floor(s).
         *
         * @throws MECHC_OutOfRangeError if s is outside [0, get_size() - 1] or not finite.
         */
        double t(double s) const;

        /**
         * @brief Polyline length of the relative vectors.
         */
        double length() const;

        const MECHC_Pair &first() const;
        const MECHC_Pair &last() const;

        /**
         * @brief Second-to-last sample.
         *
         * @throws MECHC_OutOfRangeError if fewer than two samples are stored.
         */
        const MECHC_Pair &nexto() const;

        /**
         * @brief Step leading to the last sample.
         *
         * @throws MECHC_OutOfRangeError if fewer than two samples are stored.
         */
        double last_step() const;

        std::vector<MECHC_V3dT> origins() const;
        std::vector<MECHC_V3dT> absolute() const;
        std::vector<MECHC_V3dT> relative() const;

        /**
         * @brief Translates every sample (origin and position) by u.
         */
        void translate(const MECHC_V3dT &u);

        /**
         * @brief Scales every relative vector by s around its origin.
         */
        void homothetic(double s);

        /**
         * @brief Pair-wise relative equality within epsilon. Sizes must match.
         */
        bool is_equal(const MECHC_TrajectoryInterface &other, double epsilon) const;

        /**
         * @brief True if every relative vector is shorter than epsilon.
         */
        bool is_zero(double epsilon) const;

        /**
         * @brief Flattens the samples, six doubles each: origin xyz then position xyz.
         *
         * Steps are not part of the array; keep them separately to rebuild a
         * trajectory with variable steps.
         */
        std::vector<double> to_array() const;

    protected:
        /**
         * @brief Splits a curvilinear abscissa into an index and a weight.
         *
         * @param s Abscissa.
         * @param k Output integer part.
         * @param w Output fractional part, 0 when s is the last index.
         *
         * @throws MECHC_OutOfRangeError if s is outside [0, get_size() - 1] or not finite.
         */
        void split_abscissa(double s, std::size_t &k, double &w) const;
    };

    /**
     * @brief Unbounded, append-only trajectory.
     *
     * Holds get_size() samples and max(get_size() - 1, 0) steps.
     */
    class MECHC_Trajectory : public MECHC_TrajectoryInterface
    {
    private:
        std::vector<MECHC_Pair> pairs;
        std::vector<double> dt;
        double default_step;

    public:
        /**
         * @brief Empty trajectory.
         *
         * @param default_step Step used by add(pair) before any step is recorded.
         *
         * @throws MECHC_InvalidArgumentError if default_step <= 0.
         */
        explicit MECHC_Trajectory(double default_step = 1.0);

        /**
         * @brief Trajectory of uniformly spaced samples.
         *
         * @param pairs Samples, oldest first.
         * @param dt Constant step between samples.
         *
         * @throws MECHC_InvalidArgumentError if dt <= 0.
         */
        MECHC_Trajectory(const std::vector<MECHC_Pair> &pairs, double dt);

        /**
         * @brief Trajectory with an explicit step array.
         *
         * @param pairs Samples, oldest first.
         * @param dt Steps, dt[k] between pairs[k] and pairs[k + 1].
         *
         * @throws MECHC_InvalidArgumentError if dt.size() != max(pairs.size() - 1, 0)
         *         or a step is negative.
         */
        MECHC_Trajectory(const std::vector<MECHC_Pair> &pairs, const std::vector<double> &dt);

        std::size_t get_size() const override;
        const MECHC_Pair &get(std::size_t i) const override;
        void set(std::size_t i, const MECHC_Pair &pair) override;

        /**
         * @brief Appends a sample. The first sample of an empty trajectory records no step.
         */
        void add(const MECHC_Pair &pair, double dt) override;
        void add(const MECHC_Pair &pair) override;

        double step(std::size_t k) const override;

        using MECHC_TrajectoryInterface::duration;
        double duration(std::size_t i, std::size_t j) const override;

        void clear() override;

        const std::vector<double> &get_steps() const;
        double get_default_step() const;

        /**
         * @brief Rebuilds a trajectory from to_array() output.
         *
         * Every step is set to dt. A source with variable steps is only
         * restored exactly through MECHC_Trajectory(pairs, steps).
         *
         * @param values Flat array, six doubles per sample.
         * @param dt Constant step between samples.
         *
         * @throws MECHC_InvalidArgumentError if values.size() is not a multiple of six, or dt <= 0.
         */
        static MECHC_Trajectory from_array(const std::vector<double> &values, double dt);

        /**
         * @brief size samples standing still at u (position == origin == u).
         */
        static MECHC_Trajectory zeros(const MECHC_V3dT &u, std::size_t size, double dt);

        /**
         * @brief Samples at the given positions, all observed from origin.
         */
        static MECHC_Trajectory discrete(
            const std::vector<MECHC_V3dT> &positions,
            double dt,
            const MECHC_V3dT &origin);

        /**
         * @brief Uniform motion from origin at velocity v: sample k is at origin + v * k * dt.
         */
        static MECHC_Trajectory linear(
            std::size_t count,
            double dt,
            const MECHC_V3dT &v,
            const MECHC_V3dT &origin);
    };
}; // namespace mechc

#endif // MECHC_TRAJECTORY_HPP
