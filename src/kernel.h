#ifndef KERNEL_H
#define KERNEL_H

#include <Eigen/Dense>
#include <cmath>

// Quadratic B-spline weights for fractional offset f in grid units, f in [0.5, 1.5)
// for a particle relative to its base node. w[0] + w[1] + w[2] == 1 for any f.
inline void bspline_weights(double f, double w[3])
{
    w[0] = 0.5 * (1.5 - f) * (1.5 - f);
    w[1] = 0.75 - (f - 1.0) * (f - 1.0);
    w[2] = 0.5 * (f - 0.5) * (f - 0.5);
}

// Positions a Stencil can be built from: finite, and small enough in grid
// units for the base node to fit in an int.
inline bool stencil_in_range(const Eigen::Vector2d &x, double inv_dx)
{
    const double limit = 1e9;
    return x.allFinite() && std::abs(x.x() * inv_dx) < limit && std::abs(x.y() * inv_dx) < limit;
}

// 3x3 interpolation stencil of one particle, x must pass stencil_in_range
struct Stencil
{
    // lower-left node of the 3x3 neighbourhood
    Eigen::Vector2i base;
    // particle position relative to base, in grid units
    Eigen::Vector2d fx;
    // per-axis weights, wx[i] * wy[j] is the weight of node base + (i, j)
    double wx[3], wy[3];

    Stencil(const Eigen::Vector2d &x, double inv_dx)
    {
        Eigen::Vector2d xg = x * inv_dx;
        // element-wise floor
        base = Eigen::Vector2i((int)std::floor(xg.x() - 0.5), (int)std::floor(xg.y() - 0.5));
        fx = xg - base.cast<double>();
        bspline_weights(fx.x(), wx);
        bspline_weights(fx.y(), wy);
    }

    double weight(int i, int j) const { return wx[i] * wy[j]; }

    // offset of node base + (i, j) from the particle, in grid units
    Eigen::Vector2d dpos(int i, int j) const { return Eigen::Vector2d(i, j) - fx; }
};

#endif // KERNEL_H
