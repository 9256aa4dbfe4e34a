#ifndef MECHC_PAIR_HPP
#define MECHC_PAIR_HPP

#include "mechc/v3d.hpp"

namespace mechc
{
    /**
     * @brief A mobile observed from a frame: (origin, position).
     *
     * The relative vector (position - origin) and its length are derived
     * on demand, so they always agree with origin and position. Writing the
     * relative vector or the length moves the position and keeps the origin.
     */
    struct MECHC_Pair
    {
    public:
        MECHC_V3dT origin;
        MECHC_V3dT position;

        /**
         * @brief Zero pair: origin and position both at (0, 0, 0).
         */
        MECHC_Pair();

        /**
         * @brief Pair observed from the world origin.
         */
        explicit MECHC_Pair(const MECHC_V3dT &position);

        MECHC_Pair(const MECHC_V3dT &position, const MECHC_V3dT &origin);

        /**
         * @brief Returns position - origin.
         */
        MECHC_V3dT relative() const;

        /**
         * @brief Moves position so that position - origin == value.
         */
        void set_relative(const MECHC_V3dT &value);

        /**
         * @brief Returns |position - origin|.
         */
        double length() const;

        /**
         * @brief Rescales the relative vector to the given length.
         *
         * A pair whose position coincides with its origin has no direction
         * and is left unchanged.
         *
         * @param value New length.
         */
        void set_length(double value);

        /**
         * @brief Translates origin and position by u.
         * @return Reference to this pair for chaining.
         */
        MECHC_Pair &translate(const MECHC_V3dT &u);

        /**
         * @brief Scales the relative vector by s around the origin.
         * @return Reference to this pair for chaining.
         */
        MECHC_Pair &homothetic(double s);

        /**
         * @brief Compares relative vectors within epsilon (norm-1).
         *
         * Two pairs seeing the same displacement from different origins are equal.
         */
        bool is_equal(const MECHC_Pair &other, double epsilon) const;

        /**
         * @brief Exact comparison of both origin and position.
         */
        bool exact(const MECHC_Pair &other) const;

        /**
         * @brief True if the relative vector is shorter than epsilon.
         */
        bool is_zero(double epsilon) const;

        /**
         * @brief Pair with position == origin == u.
         */
        static MECHC_Pair zeros(const MECHC_V3dT &u);

        /**
         * @brief Pair from the world origin to u.
         */
        static MECHC_Pair vect(const MECHC_V3dT &u);

        /**
         * @brief Interpolates origin and position independently.
         *
         * @param a Pair at s = 0.
         * @param b Pair at s = 1.
         * @param s Interpolation weight.
         * @return Recombined pair.
         */
        static MECHC_Pair lerp(const MECHC_Pair &a, const MECHC_Pair &b, double s);
    };
}; // namespace mechc

#endif // MECHC_PAIR_HPP
