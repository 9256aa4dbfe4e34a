#include <cmath>
#include <string>
#include "mechc/v3d.hpp"
#include "mechc/interp.hpp"
#include "mechc/exceptions.hpp"

namespace mechc
{

    MECHC_V3dT MECHC_V3dT::cross(const MECHC_V3dT &other) const
    {
        return MECHC_V3dT(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x);
    }

    double MECHC_V3dT::dist(const MECHC_V3dT &other) const
    {
        return std::sqrt(this->dist2(other));
    }

    double MECHC_V3dT::dist1(const MECHC_V3dT &other) const
    {
        return std::fabs(x - other.x) + std::fabs(y - other.y) + std::fabs(z - other.z);
    }

    double MECHC_V3dT::dist2(const MECHC_V3dT &other) const
    {
        return (*this - other).mag_squared();
    }

    bool MECHC_V3dT::exact(const MECHC_V3dT &other) const
    {
        return x == other.x && y == other.y && z == other.z;
    }

    bool MECHC_V3dT::equal1(const MECHC_V3dT &other, double epsilon) const
    {
        return std::fabs(x - other.x) < epsilon &&
               std::fabs(y - other.y) < epsilon &&
               std::fabs(z - other.z) < epsilon;
    }

    bool MECHC_V3dT::equal2(const MECHC_V3dT &other, double epsilon) const
    {
        return this->dist2(other) < epsilon * epsilon;
    }

    bool MECHC_V3dT::zero2(double epsilon) const
    {
        return this->mag_squared() < epsilon * epsilon;
    }

    MECHC_V3dT MECHC_V3dT::lerp(const MECHC_V3dT &other, double s) const
    {
        MECHC_V3dT result = *this;
        result.fused_multiply_add(other - *this, s);
        return result;
    }

    MECHC_V3dT MECHC_V3dT::herp(const MECHC_V3dT &other, const MECHC_V3dT &a, const MECHC_V3dT &b, double s) const
    {
        return MECHC_V3dT(
            MECHC_hermite(s, 0.0, 1.0, x, other.x, a.x, b.x),
            MECHC_hermite(s, 0.0, 1.0, y, other.y, a.y, b.y),
            MECHC_hermite(s, 0.0, 1.0, z, other.z, a.z, b.z));
    }

    void MECHC_V3dT::to_array(std::vector<double> &out) const
    {
        out.push_back(x);
        out.push_back(y);
        out.push_back(z);
    }

    MECHC_V3dT MECHC_V3dT::from_array(const std::vector<double> &values, std::size_t offset)
    {
        if (offset + 3 > values.size())
        {
            throw MECHC_OutOfRangeError(
                "Not enough values to read a vector at offset " + std::to_string(offset),
                offset, values.size());
        }
        return MECHC_V3dT(values[offset], values[offset + 1], values[offset + 2]);
    }
};
