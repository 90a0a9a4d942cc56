#include "mpm_solver.h"

#include <cmath>
#include <sstream>
#include <utility>

#include "kernel.h"

using namespace Eigen;
using namespace std;

static inline void atomic_add(double &target, double value)
{
#pragma omp atomic
    target += value;
}

static std::string describe(int particle, MaterialType material, const std::string &reason)
{
    std::ostringstream ss;
    ss << "particle " << particle << " (" << material_name(material) << ") diverged: " << reason;
    return ss.str();
}

divergence_error::divergence_error(int particle, MaterialType material, const std::string &reason)
    : std::runtime_error(describe(particle, material, reason)), particle(particle), mat(material)
{
}

mpm_solver::mpm_solver(const SimConfig &config)
    : mpm_solver(config, make_executor(config.backend, config.threads))
{
}

mpm_solver::mpm_solver(const SimConfig &config, std::unique_ptr<executor> exec)
    : cfg(config), table(config.material), exec(std::move(exec)), grid(config.grid_resolution)
{
    cfg.validate();
    if (!this->exec)
    {
        throw std::invalid_argument("mpm_solver needs an executor");
    }
}

void mpm_solver::add_particles(const ParticleList &list)
{
    particles.insert(particles.end(), list.begin(), list.end());
}

void mpm_solver::substep()
{
    clear_grid();
    particle_to_grid();
    update_grid();
    grid_to_particle();
    steps++;

    if (cfg.check_invariants)
    {
        check_invariants();
    }
}

void mpm_solver::clear_grid()
{
    grid.clear();
}

/**************************************/
/**************** P2G *****************/
/**************************************/

bool mpm_solver::scatter_particle(Particle &p, int nodes[9], Vector3d values[9]) const
{
    const double dt = cfg.dt;
    const double dx = cfg.dx();
    const double inv_dx = cfg.inv_dx();
    const double p_vol = cfg.particle_volume();
    const double p_mass = cfg.particle_mass();

    for (int k = 0; k < 9; k++)
    {
        nodes[k] = -1;
    }
    if (!stencil_in_range(p.x, inv_dx) || !p.v.allFinite() || !p.C.allFinite())
    {
        return false;
    }

    Stencil s(p.x, inv_dx);

    // MLS-MPM F-update
    p.F = (Mat::Identity() + dt * p.C) * p.F;

    ConstitutiveState state = constitutive_update(table[p.material], p.F, p.Jp);
    p.F = state.F;
    p.Jp = state.Jp;
    if (!state.F.allFinite() || !(state.F.determinant() > 0.0) || !(state.Jp > 0.0) ||
        !std::isfinite(state.Jp) || !state.stress.allFinite())
    {
        return false;
    }

    // Cauchy stress times dt and inv_dx
    Mat stress = (-dt * p_vol * 4.0 * inv_dx * inv_dx) * state.stress;
    Mat affine = stress + p_mass * p.C;

    int k = 0;
    for (int i = 0; i < 3; i++)
    {
        for (int j = 0; j < 3; j++, k++)
        {
            Vector2i node = s.base + Vector2i(i, j);
            if (!grid.in_bounds(node.x(), node.y()))
                continue;
            Vec dpos = s.dpos(i, j) * dx;
            Vec momentum = p_mass * p.v + affine * dpos;
            nodes[k] = grid.index(node.x(), node.y());
            values[k] = s.weight(i, j) * Vector3d(momentum.x(), momentum.y(), p_mass);
        }
    }
    return true;
}

void mpm_solver::particle_to_grid()
{
    scatter_ok.assign(particles.size(), 1);

    if (cfg.accumulation == Accumulation::ScatterReduce)
    {
        particle_to_grid_reduce();
    }
    else
    {
        particle_to_grid_atomic();
    }

    // report the particle that failed, before its neighbours pick up the damage in G2P
    if (cfg.check_invariants)
    {
        for (int idx = 0; idx < (int)particles.size(); idx++)
        {
            if (!scatter_ok[idx])
            {
                throw divergence_error(idx, particles[idx].material, "non-finite or inverted state in P2G");
            }
        }
    }
}

void mpm_solver::particle_to_grid_atomic()
{
    exec->parallel_for((int)particles.size(), [&](int idx) {
        int nodes[9];
        Vector3d values[9];
        scatter_ok[idx] = scatter_particle(particles[idx], nodes, values);
        for (int k = 0; k < 9; k++)
        {
            if (nodes[k] < 0)
                continue;
            Vector3d &g = grid[nodes[k]];
            atomic_add(g[0], values[k][0]);
            atomic_add(g[1], values[k][1]);
            atomic_add(g[2], values[k][2]);
        }
    });
}

void mpm_solver::particle_to_grid_reduce()
{
    const int slot_count = (int)particles.size() * 9;
    const int node_count = grid.node_count();
    contributions.resize(slot_count);

    // pass 1: every particle fills its own 9 slots
    exec->parallel_for((int)particles.size(), [&](int idx) {
        int nodes[9];
        Vector3d values[9];
        scatter_ok[idx] = scatter_particle(particles[idx], nodes, values);
        for (int k = 0; k < 9; k++)
        {
            Contribution &c = contributions[idx * 9 + k];
            c.node = nodes[k];
            c.value = nodes[k] < 0 ? Vector3d::Zero() : values[k];
        }
    });

    // pass 2: counting sort of slots by node, slot order is kept inside a bucket
    bucket_start.assign(node_count + 1, 0);
    for (const Contribution &c : contributions)
    {
        if (c.node >= 0)
            bucket_start[c.node + 1]++;
    }
    for (int node = 0; node < node_count; node++)
    {
        bucket_start[node + 1] += bucket_start[node];
    }
    bucket_slots.resize(bucket_start[node_count]);
    std::vector<int> fill(bucket_start.begin(), bucket_start.end() - 1);
    for (int slot = 0; slot < slot_count; slot++)
    {
        int node = contributions[slot].node;
        if (node >= 0)
            bucket_slots[fill[node]++] = slot;
    }

    // pass 3: each node sums its own bucket
    exec->parallel_for(node_count, [&](int node) {
        Vector3d sum = Vector3d::Zero();
        for (int b = bucket_start[node]; b < bucket_start[node + 1]; b++)
        {
            sum += contributions[bucket_slots[b]].value;
        }
        grid[node] = sum;
    });
}

/**************************************/
/************ GRID UPDATE *************/
/**************************************/

void mpm_solver::update_grid()
{
    const int n = grid.size();
    const int boundary = cfg.boundary_cells;
    const double dt = cfg.dt;
    const double gravity = cfg.gravity;

    exec->parallel_for_2d(n, n, [&](int i, int j) {
        Vector3d &g = grid.at(i, j);
        // No need for epsilon here
        if (g[2] > 0)
        {
            // momentum to velocity
            g[0] /= g[2];
            g[1] /= g[2];
            g[1] -= dt * gravity;
        }

        // walls: no velocity out of the domain inside the band
        if (i < boundary && g[0] < 0)
            g[0] = 0;
        if (i > n - boundary && g[0] > 0)
            g[0] = 0;
        if (j < boundary && g[1] < 0)
            g[1] = 0;
        if (j > n - boundary && g[1] > 0)
            g[1] = 0;
    });
}

/**************************************/
/**************** G2P *****************/
/**************************************/

void mpm_solver::grid_to_particle()
{
    const double dt = cfg.dt;
    const double inv_dx = cfg.inv_dx();

    exec->parallel_for((int)particles.size(), [&](int idx) {
        Particle &p = particles[idx];
        if (!stencil_in_range(p.x, inv_dx))
            return;
        Stencil s(p.x, inv_dx);

        Vec v_pic = Vec::Zero();
        Mat C_pic = Mat::Zero();
        for (int i = 0; i < 3; i++)
        {
            for (int j = 0; j < 3; j++)
            {
                Vector2i node = s.base + Vector2i(i, j);
                if (!grid.in_bounds(node.x(), node.y()))
                    continue;
                Vec grid_v = grid.velocity(node.x(), node.y());
                double weight = s.weight(i, j);
                v_pic += weight * grid_v;
                // APIC C
                C_pic += 4.0 * inv_dx * weight * grid_v * s.dpos(i, j).transpose();
            }
        }
        p.v = v_pic;
        p.C = C_pic;
        // Advection
        p.x += dt * p.v;
    });
}

void mpm_solver::check_invariants() const
{
    for (int idx = 0; idx < (int)particles.size(); idx++)
    {
        const Particle &p = particles[idx];
        if (!p.x.allFinite() || !p.v.allFinite())
        {
            throw divergence_error(idx, p.material, "non-finite position or velocity");
        }
        if (!p.C.allFinite() || !p.F.allFinite())
        {
            throw divergence_error(idx, p.material, "non-finite C or F");
        }
        double J = p.F.determinant();
        if (!(J > 0.0))
        {
            std::ostringstream ss;
            ss << "det(F) = " << J;
            throw divergence_error(idx, p.material, ss.str());
        }
        if (!(p.Jp > 0.0) || !std::isfinite(p.Jp))
        {
            std::ostringstream ss;
            ss << "Jp = " << p.Jp;
            throw divergence_error(idx, p.material, ss.str());
        }
    }
}
