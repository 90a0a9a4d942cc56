#include "grid.h"

#include <algorithm>
#include <stdexcept>

using namespace Eigen;

mpm_grid::mpm_grid(int n) : n(n)
{
    if (n < 4)
    {
        throw std::invalid_argument("grid resolution must be at least 4");
    }
    nodes.assign(n * n, Vector3d::Zero());
}

void mpm_grid::clear()
{
    std::fill(nodes.begin(), nodes.end(), Vector3d::Zero());
}

double mpm_grid::total_mass() const
{
    double mass = 0.0;
    for (const auto &g : nodes)
    {
        mass += g.z();
    }
    return mass;
}

Vector2d mpm_grid::total_momentum() const
{
    Vector2d momentum = Vector2d::Zero();
    for (const auto &g : nodes)
    {
        momentum += g.head<2>();
    }
    return momentum;
}
