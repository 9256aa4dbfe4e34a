#ifndef MECHC_V3dT_HPP
#define MECHC_V3dT_HPP

#include <cmath>
#include <cstddef>
#include <vector>

namespace mechc
{

    // Structure definition for 3D vector
    struct MECHC_V3dT
    {
    public:
        double x;
        double y;
        double z;

        // ============================================================================
        // Constructors
        // ============================================================================

        MECHC_V3dT() = default;

        inline MECHC_V3dT(double x, double y, double z)
            : x(x), y(y), z(z) {}

        // ============================================================================
        // Arithmetic Operators (Create new vectors)
        // ============================================================================

        /**
         * @brief Adds two vectors component-wise.
         * @return New vector representing the sum.
         */
        inline MECHC_V3dT operator+(const MECHC_V3dT &other) const
        {
            return MECHC_V3dT(x + other.x, y + other.y, z + other.z);
        }

        /**
         * @brief Negates all vector components.
         * @return New vector with negated components.
         */
        inline MECHC_V3dT operator-() const
        {
            return MECHC_V3dT(-x, -y, -z);
        }

        /**
         * @brief Subtracts one vector from another component-wise.
         * @return New vector representing the difference.
         */
        inline MECHC_V3dT operator-(const MECHC_V3dT &other) const
        {
            return MECHC_V3dT(x - other.x, y - other.y, z - other.z);
        }

        /**
         * @brief Multiplies vector by a scalar.
         * @return New scaled vector.
         */
        inline MECHC_V3dT operator*(double scalar) const
        {
            return MECHC_V3dT(x * scalar, y * scalar, z * scalar);
        }

        /**
         * @brief Divides vector by a scalar.
         * @note Division by zero follows IEEE-754, components become Inf or NaN.
         * @return New scaled vector.
         */
        inline MECHC_V3dT operator/(double scalar) const
        {
            return MECHC_V3dT(x / scalar, y / scalar, z / scalar);
        }

        /**
         * @brief Computes dot product of two vectors.
         * @return Scalar dot product value.
         */
        inline double operator*(const MECHC_V3dT &other) const
        {
            return (x * other.x) + (y * other.y) + (z * other.z);
        }

        // ============================================================================
        // Compound Assignment Operators
        // ============================================================================

        inline MECHC_V3dT &operator+=(const MECHC_V3dT &other)
        {
            x += other.x;
            y += other.y;
            z += other.z;
            return *this;
        }

        inline MECHC_V3dT &operator-=(const MECHC_V3dT &other)
        {
            x -= other.x;
            y -= other.y;
            z -= other.z;
            return *this;
        }

        inline MECHC_V3dT &operator*=(double scalar)
        {
            x *= scalar;
            y *= scalar;
            z *= scalar;
            return *this;
        }

        inline MECHC_V3dT &operator/=(double scalar)
        {
            x /= scalar;
            y /= scalar;
            z /= scalar;
            return *this;
        }

        // ============================================================================
        // Fused Operations
        // ============================================================================

        /**
         * @brief Fused multiply-add operation: this += other * scalar.
         *
         * Used to accumulate net accelerations and the dt² term of the
         * two-step scheme without temporaries.
         *
         * @param other The vector to be scaled and added.
         * @param scalar The scaling factor.
         * @return Reference to this vector for chaining.
         */
        inline MECHC_V3dT &fused_multiply_add(const MECHC_V3dT &other, double scalar)
        {
            x += other.x * scalar;
            y += other.y * scalar;
            z += other.z * scalar;
            return *this;
        }

        /**
         * @brief Computes linear combination: this = a * vec_a + b * vec_b.
         *
         * Example: next.linear_combination(u1, 2.0, u0, -1.0)
         *
         * @param vec_a First vector.
         * @param scalar_a Scaling factor for first vector.
         * @param vec_b Second vector.
         * @param scalar_b Scaling factor for second vector.
         * @return Reference to this vector for chaining.
         */
        inline MECHC_V3dT &linear_combination(
            const MECHC_V3dT &vec_a, double scalar_a,
            const MECHC_V3dT &vec_b, double scalar_b)
        {
            x = vec_a.x * scalar_a + vec_b.x * scalar_b;
            y = vec_a.y * scalar_a + vec_b.y * scalar_b;
            z = vec_a.z * scalar_a + vec_b.z * scalar_b;
            return *this;
        }

        // ============================================================================
        // Vector Properties
        // ============================================================================

        /**
         * @brief Computes the magnitude (length) of the vector.
         * @return The Euclidean length of the vector.
         */
        inline double mag() const
        {
            return std::sqrt((*this) * (*this));
        }

        /**
         * @brief Computes squared magnitude without taking square root.
         * @return The squared Euclidean length.
         */
        inline double mag_squared() const
        {
            return (*this) * (*this);
        }

        /**
         * @brief Returns a normalized (unit length) version of this vector.
         *
         * Returns the original vector if magnitude is near zero.
         *
         * @return New unit vector in the same direction.
         */
        inline MECHC_V3dT norm() const
        {
            const double m_sq = x * x + y * y + z * z;
            if (m_sq < 1e-20)
            {
                return *this;
            }
            const double inv_mag = 1.0 / std::sqrt(m_sq);
            return MECHC_V3dT(x * inv_mag, y * inv_mag, z * inv_mag);
        }

        /**
         * @brief Normalizes this vector in-place.
         * @return Reference to this vector for chaining.
         */
        inline MECHC_V3dT &normalize()
        {
            const double m_sq = x * x + y * y + z * z;
            if (m_sq < 1e-20)
            {
                return *this;
            }
            const double inv_mag = 1.0 / std::sqrt(m_sq);
            x *= inv_mag;
            y *= inv_mag;
            z *= inv_mag;
            return *this;
        }

        // ============================================================================
        // Products, Distances and Comparisons
        // ============================================================================

        inline double dot(const MECHC_V3dT &other) const
        {
            return (*this) * other;
        }

        /**
         * @brief Computes the cross product this × other.
         * @return New vector orthogonal to both operands.
         */
        MECHC_V3dT cross(const MECHC_V3dT &other) const;

        /**
         * @brief Euclidean distance to another vector.
         */
        double dist(const MECHC_V3dT &other) const;

        /**
         * @brief Manhattan (norm-1) distance to another vector.
         */
        double dist1(const MECHC_V3dT &other) const;

        /**
         * @brief Squared Euclidean distance to another vector.
         */
        double dist2(const MECHC_V3dT &other) const;

        /**
         * @brief Exact component-wise equality.
         */
        bool exact(const MECHC_V3dT &other) const;

        /**
         * @brief Norm-1 epsilon equality: every component differs by less than epsilon.
         *
         * @param other Vector to compare with.
         * @param epsilon Strictly positive tolerance.
         * @return True when |dx| < epsilon, |dy| < epsilon and |dz| < epsilon.
         */
        bool equal1(const MECHC_V3dT &other, double epsilon) const;

        /**
         * @brief Norm-2 epsilon equality: squared distance below epsilon².
         *
         * @param other Vector to compare with.
         * @param epsilon Strictly positive tolerance.
         * @return True when dist2(other) < epsilon * epsilon.
         */
        bool equal2(const MECHC_V3dT &other, double epsilon) const;

        /**
         * @brief Checks if the vector has a norm-2 length below epsilon.
         */
        bool zero2(double epsilon) const;

        // ============================================================================
        // Interpolation
        // ============================================================================

        /**
         * @brief Linear interpolation between this vector (s = 0) and other (s = 1).
         *
         * @param other End point.
         * @param s Interpolation parameter, not clamped.
         * @return this + (other - this) * s.
         */
        MECHC_V3dT lerp(const MECHC_V3dT &other, double s) const;

        /**
         * @brief Cubic Hermite interpolation between this vector and other.
         *
         * Each component is evaluated with MECHC_hermite on the unit interval.
         *
         * @param other End point (s = 1).
         * @param a Tangent at the start point.
         * @param b Tangent at the end point.
         * @param s Interpolation parameter in [0, 1].
         * @return Interpolated vector.
         */
        MECHC_V3dT herp(const MECHC_V3dT &other, const MECHC_V3dT &a, const MECHC_V3dT &b, double s) const;

        // ============================================================================
        // Flat array conversion
        // ============================================================================

        /**
         * @brief Appends x, y, z to a flat array of doubles.
         */
        void to_array(std::vector<double> &out) const;

        /**
         * @brief Reads a vector from three consecutive doubles.
         *
         * @param values Flat array.
         * @param offset Index of the x component.
         * @return Vector (values[offset], values[offset+1], values[offset+2]).
         *
         * @throws MECHC_OutOfRangeError if fewer than three values remain after offset.
         */
        static MECHC_V3dT from_array(const std::vector<double> &values, std::size_t offset = 0);

        static inline MECHC_V3dT zeros() { return MECHC_V3dT(0.0, 0.0, 0.0); }
        static inline MECHC_V3dT ones() { return MECHC_V3dT(1.0, 1.0, 1.0); }
        static inline MECHC_V3dT ex() { return MECHC_V3dT(1.0, 0.0, 0.0); }
        static inline MECHC_V3dT ey() { return MECHC_V3dT(0.0, 1.0, 0.0); }
        static inline MECHC_V3dT ez() { return MECHC_V3dT(0.0, 0.0, 1.0); }
    };

    // ============================================================================
    // Non-member Functions
    // ============================================================================

    /**
     * @brief Allows scalar-vector multiplication in either order.
     *
     * @param scalar The scaling factor.
     * @param vec The vector to scale.
     * @return New scaled vector.
     */
    inline MECHC_V3dT operator*(double scalar, const MECHC_V3dT &vec)
    {
        return vec * scalar;
    }

}; // namespace mechc

#endif // MECHC_V3dT_HPP
