#ifndef MECHC_INTERP_HPP
#define MECHC_INTERP_HPP

namespace mechc
{
    /**
     * @brief Evaluates a cubic Hermite polynomial at a given point.
     *
     * Uses Hermite basis functions to interpolate between two points with specified slopes.
     *
     * @param x Point at which to evaluate the polynomial.
     * @param xk Left point x-coordinate.
     * @param xk1 Right point x-coordinate.
     * @param yk Left point y-coordinate.
     * @param yk1 Right point y-coordinate.
     * @param mk Slope at left point.
     * @param mk1 Slope at right point.
     * @return Interpolated value at x.
     */
    double MECHC_hermite(double x, double xk, double xk1, double yk, double yk1, double mk, double mk1);
}; // namespace mechc

#endif // MECHC_INTERP_HPP
