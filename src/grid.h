#ifndef MPM_GRID_H
#define MPM_GRID_H

#include <Eigen/Dense>
#include <vector>

// n x n nodes covering [0,1]^2, node (i, j) sits at (i, j) * dx.
// Each node is [momentum_x, momentum_y, mass]; after the grid update the
// first two components hold velocity.
class mpm_grid
{
public:
    explicit mpm_grid(int n);

    int size() const { return n; }
    double dx() const { return 1.0 / n; }
    int node_count() const { return n * n; }

    bool in_bounds(int i, int j) const { return i >= 0 && i < n && j >= 0 && j < n; }
    int index(int i, int j) const { return i * n + j; }

    Eigen::Vector3d &at(int i, int j) { return nodes[index(i, j)]; }
    const Eigen::Vector3d &at(int i, int j) const { return nodes[index(i, j)]; }
    Eigen::Vector3d &operator[](int idx) { return nodes[idx]; }
    const Eigen::Vector3d &operator[](int idx) const { return nodes[idx]; }

    Eigen::Vector2d velocity(int i, int j) const { return at(i, j).head<2>(); }
    double mass(int i, int j) const { return at(i, j).z(); }

    // Reset grid
    void clear();

    double total_mass() const;
    Eigen::Vector2d total_momentum() const;

private:
    int n;
    std::vector<Eigen::Vector3d> nodes;
};

#endif // MPM_GRID_H
