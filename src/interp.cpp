#include <cmath>
#include "mechc/interp.hpp"

namespace mechc
{

    /**
     * @brief Evaluates a cubic Hermite polynomial at a given point.
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
    double MECHC_hermite(double x, double xk, double xk1, double yk, double yk1, double mk, double mk1)
    {
        double h = xk1 - xk;
        double t = (x - xk) / h;
        double t2 = t * t;
        double t3 = t2 * t;

        // Basis functions in Horner form
        double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
        double h10 = (t - 2.0) * t2 + t;
        double h01 = -2.0 * t3 + 3.0 * t2;
        double h11 = (t - 1.0) * t2;

        return h00 * yk + h * (h10 * mk + h11 * mk1) + h01 * yk1;
    }
}; // namespace mechc
