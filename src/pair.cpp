#include "mechc/pair.hpp"

namespace mechc
{
    MECHC_Pair::MECHC_Pair()
        : origin(MECHC_V3dT::zeros()), position(MECHC_V3dT::zeros()) {}

    MECHC_Pair::MECHC_Pair(const MECHC_V3dT &position)
        : origin(MECHC_V3dT::zeros()), position(position) {}

    MECHC_Pair::MECHC_Pair(const MECHC_V3dT &position, const MECHC_V3dT &origin)
        : origin(origin), position(position) {}

    MECHC_V3dT MECHC_Pair::relative() const
    {
        return this->position - this->origin;
    }

    void MECHC_Pair::set_relative(const MECHC_V3dT &value)
    {
        this->position = this->origin + value;
    }

    double MECHC_Pair::length() const
    {
        return this->relative().mag();
    }

    void MECHC_Pair::set_length(double value)
    {
        const double current = this->length();
        if (current == 0.0)
        {
            return;
        }
        this->set_relative(this->relative() * (value / current));
    }

    MECHC_Pair &MECHC_Pair::translate(const MECHC_V3dT &u)
    {
        this->origin += u;
        this->position += u;
        return *this;
    }

    MECHC_Pair &MECHC_Pair::homothetic(double s)
    {
        this->set_relative(this->relative() * s);
        return *this;
    }

    bool MECHC_Pair::is_equal(const MECHC_Pair &other, double epsilon) const
    {
        return this->relative().equal1(other.relative(), epsilon);
    }

    bool MECHC_Pair::exact(const MECHC_Pair &other) const
    {
        return this->origin.exact(other.origin) && this->position.exact(other.position);
    }

    bool MECHC_Pair::is_zero(double epsilon) const
    {
        return this->relative().zero2(epsilon);
    }

    MECHC_Pair MECHC_Pair::zeros(const MECHC_V3dT &u)
    {
        return MECHC_Pair(u, u);
    }

    MECHC_Pair MECHC_Pair::vect(const MECHC_V3dT &u)
    {
        return MECHC_Pair(u);
    }

    MECHC_Pair MECHC_Pair::lerp(const MECHC_Pair &a, const MECHC_Pair &b, double s)
    {
        return MECHC_Pair(a.position.lerp(b.position, s), a.origin.lerp(b.origin, s));
    }
}; // namespace mechc
