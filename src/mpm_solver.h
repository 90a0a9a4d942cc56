#ifndef MPM_SOLVER_H
#define MPM_SOLVER_H

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.h"
#include "material.h"
#include "parallel.h"
#include "particle.h"
#include "sim_config.h"

// Thrown when a particle state turns non-finite or F degenerates.
class divergence_error : public std::runtime_error
{
public:
    divergence_error(int particle, MaterialType material, const std::string &reason);

    int particle_index() const { return particle; }
    MaterialType material() const { return mat; }

private:
    int particle;
    MaterialType mat;
};

// 2D MLS-MPM solver. Owns the particles and the background grid; one call to
// substep() advances the state by dt.
class mpm_solver
{
public:
    explicit mpm_solver(const SimConfig &config);
    mpm_solver(const SimConfig &config, std::unique_ptr<executor> exec);

    void add_particle(const Particle &p) { particles.push_back(p); }
    void add_particles(const ParticleList &list);

    // clear grid, P2G, grid update, G2P, then the invariant check if enabled
    void substep();

    // Individual stages, each one finishes for all items before returning
    void clear_grid();
    void particle_to_grid();
    void update_grid();
    void grid_to_particle();

    // throws divergence_error for the first particle with a bad state
    void check_invariants() const;

    const executor &get_executor() const { return *exec; }

    const SimConfig &config() const { return cfg; }
    mpm_grid &get_grid() { return grid; }
    const mpm_grid &get_grid() const { return grid; }

    long long step_count() const { return steps; }
    double elapsed_time() const { return steps * cfg.dt; }

    ParticleList particles;

private:
    struct Contribution
    {
        int node;
        Eigen::Vector3d value;
    };

    // F update, constitutive model and the 9 node contributions of one particle.
    // nodes[k] is -1 where the stencil leaves the grid. Returns false when the
    // particle arrives or leaves with a non-finite or inverted state; such a
    // particle contributes nothing.
    bool scatter_particle(Particle &p, int nodes[9], Eigen::Vector3d values[9]) const;

    void particle_to_grid_atomic();
    void particle_to_grid_reduce();

    SimConfig cfg;
    material_table table;
    std::unique_ptr<executor> exec;
    mpm_grid grid;
    long long steps = 0;

    // scatter-reduce scratch, kept between substeps to avoid reallocation
    std::vector<Contribution> contributions;
    std::vector<int> bucket_start;
    std::vector<int> bucket_slots;
    // per particle, 0 where scatter_particle failed in the last P2G
    std::vector<unsigned char> scatter_ok;
};

#endif // MPM_SOLVER_H
