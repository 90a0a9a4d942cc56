#include <gtest/gtest.h>

#include <Eigen/SVD>
#include <cmath>
#include <limits>
#include <random>

#include "mpm_solver.h"
#include "scene.h"

using namespace Eigen;

static SimConfig make_config(Backend backend, Accumulation accumulation)
{
    SimConfig config;
    config.backend = backend;
    config.threads = backend == Backend::OpenMP ? 4 : 0;
    config.accumulation = accumulation;
    return config;
}

// Lattice scene with random velocities and small random affine fields
static ParticleList moving_scene(int count, unsigned int seed)
{
    ParticleList particles = default_scene(count, Placement::Lattice, 0);
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> value(-1.0, 1.0);
    for (auto &p : particles)
    {
        p.v = Vec(value(rng), value(rng));
        p.C << 0.1 * value(rng), 0.1 * value(rng),
            0.1 * value(rng), 0.1 * value(rng);
    }
    return particles;
}

struct TransferCase
{
    Backend backend;
    Accumulation accumulation;
};

class P2GTest : public ::testing::TestWithParam<TransferCase>
{
};

TEST_P(P2GTest, ConservesMassAndMomentum)
{
    SimConfig config = make_config(GetParam().backend, GetParam().accumulation);
    mpm_solver solver(config);
    solver.add_particles(moving_scene(600, 5));

    Vector2d momentum = Vector2d::Zero();
    for (const auto &p : solver.particles)
    {
        momentum += config.particle_mass() * p.v;
    }

    solver.clear_grid();
    solver.particle_to_grid();

    const double expected_mass = solver.particles.size() * config.particle_mass();
    EXPECT_NEAR(solver.get_grid().total_mass(), expected_mass, 1e-12 * expected_mass);
    // the B-spline first moment vanishes, so the affine part adds no net momentum
    EXPECT_NEAR(solver.get_grid().total_momentum().x(), momentum.x(), 1e-9);
    EXPECT_NEAR(solver.get_grid().total_momentum().y(), momentum.y(), 1e-9);
}

INSTANTIATE_TEST_SUITE_P(AllModes, P2GTest,
                         ::testing::Values(TransferCase{Backend::Serial, Accumulation::Atomic},
                                           TransferCase{Backend::Serial, Accumulation::ScatterReduce},
                                           TransferCase{Backend::OpenMP, Accumulation::Atomic},
                                           TransferCase{Backend::OpenMP, Accumulation::ScatterReduce}));

TEST(P2G, AtomicAndScatterReduceAgree)
{
    mpm_solver atomic(make_config(Backend::OpenMP, Accumulation::Atomic));
    mpm_solver reduce(make_config(Backend::OpenMP, Accumulation::ScatterReduce));
    ParticleList particles = moving_scene(900, 9);
    atomic.add_particles(particles);
    reduce.add_particles(particles);

    atomic.clear_grid();
    atomic.particle_to_grid();
    reduce.clear_grid();
    reduce.particle_to_grid();

    for (int idx = 0; idx < atomic.get_grid().node_count(); idx++)
    {
        Vector3d diff = atomic.get_grid()[idx] - reduce.get_grid()[idx];
        EXPECT_LT(diff.cwiseAbs().maxCoeff(), 1e-12) << "node " << idx;
    }
}

TEST(P2G, ScatterReduceIsBitIdenticalAcrossBackends)
{
    mpm_solver serial(make_config(Backend::Serial, Accumulation::ScatterReduce));
    mpm_solver parallel(make_config(Backend::OpenMP, Accumulation::ScatterReduce));
    ParticleList particles = moving_scene(900, 13);
    serial.add_particles(particles);
    parallel.add_particles(particles);

    for (int step = 0; step < 5; step++)
    {
        serial.substep();
        parallel.substep();
    }

    for (int idx = 0; idx < serial.get_grid().node_count(); idx++)
    {
        EXPECT_TRUE(serial.get_grid()[idx] == parallel.get_grid()[idx]) << "node " << idx;
    }
    for (size_t k = 0; k < serial.particles.size(); k++)
    {
        EXPECT_TRUE(serial.particles[k].x == parallel.particles[k].x) << "particle " << k;
        EXPECT_TRUE(serial.particles[k].F == parallel.particles[k].F) << "particle " << k;
    }
}

TEST(P2G, StencilLeavingTheGridIsClipped)
{
    SimConfig config = make_config(Backend::Serial, Accumulation::ScatterReduce);
    mpm_solver solver(config);
    // base node is -1 on both axes
    solver.add_particle(Particle(Vec(0.2 / 128.0, 0.2 / 128.0), MaterialType::Snow));

    solver.clear_grid();
    solver.particle_to_grid();
    EXPECT_GT(solver.get_grid().total_mass(), 0.0);
    EXPECT_LT(solver.get_grid().total_mass(), config.particle_mass());
}

class AtRestTest : public ::testing::TestWithParam<MaterialType>
{
};

TEST_P(AtRestTest, IsolatedParticleWithoutGravityStaysPut)
{
    SimConfig config = make_config(Backend::Serial, Accumulation::Atomic);
    config.gravity = 0.0;
    mpm_solver solver(config);
    solver.add_particle(Particle(Vec(0.5, 0.5), GetParam()));

    solver.substep();

    const Particle &p = solver.particles[0];
    EXPECT_NEAR((p.x - Vec(0.5, 0.5)).norm(), 0.0, 1e-15);
    EXPECT_NEAR(p.v.norm(), 0.0, 1e-15);
    EXPECT_NEAR(p.C.norm(), 0.0, 1e-15);
    EXPECT_NEAR((p.F - Mat::Identity()).norm(), 0.0, 1e-15);
    EXPECT_NEAR(p.Jp, 1.0, 1e-15);
    EXPECT_EQ(solver.step_count(), 1);
}

INSTANTIATE_TEST_SUITE_P(EachMaterial, AtRestTest,
                         ::testing::Values(MaterialType::Fluid, MaterialType::Jelly, MaterialType::Snow));

TEST(Substep, SnowStaysInsideYieldSurface)
{
    SimConfig config = make_config(Backend::Serial, Accumulation::Atomic);
    mpm_solver solver(config);
    // about four particles per cell, thrown at the floor
    Region block = {0.4, 0.05, 0.2, 0.2, MaterialType::Snow};
    ParticleList particles = lattice_block(block, 2500);
    for (auto &p : particles)
    {
        p.v = Vec(0.0, -1.5);
    }
    solver.add_particles(particles);

    for (int step = 0; step < 300; step++)
    {
        solver.substep();
    }

    const double lower = 1.0 - config.material.critical_compression;
    const double upper = 1.0 + config.material.critical_stretch;
    bool yielded = false;
    for (const auto &p : solver.particles)
    {
        JacobiSVD<Mat> svd(p.F);
        Vector2d sig = svd.singularValues();
        EXPECT_GE(sig.minCoeff(), lower - 1e-9);
        EXPECT_LE(sig.maxCoeff(), upper + 1e-9);
        if (p.Jp != 1.0)
            yielded = true;
    }
    EXPECT_TRUE(yielded);
}

TEST(Substep, FluidDeformationStaysIsotropic)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particles(moving_scene(600, 21));

    solver.substep();

    for (const auto &p : solver.particles)
    {
        if (p.material != MaterialType::Fluid)
            continue;
        EXPECT_EQ(p.F(0, 1), 0.0);
        EXPECT_EQ(p.F(1, 0), 0.0);
        EXPECT_DOUBLE_EQ(p.F(0, 0), p.F(1, 1));
    }
}

TEST(Substep, JellyNeverDevelopsPlasticity)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particles(moving_scene(600, 17));

    for (int step = 0; step < 10; step++)
    {
        solver.substep();
    }

    for (const auto &p : solver.particles)
    {
        if (p.material == MaterialType::Jelly)
            EXPECT_EQ(p.Jp, 1.0);
    }
}

TEST(Divergence, ReportsParticleAndMaterial)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particle(Particle(Vec(0.3, 0.3), MaterialType::Fluid));
    solver.add_particle(Particle(Vec(0.5, 0.5), MaterialType::Jelly));
    solver.add_particle(Particle(Vec(0.7, 0.7), MaterialType::Snow));
    EXPECT_NO_THROW(solver.check_invariants());

    solver.particles[1].v.x() = std::numeric_limits<double>::quiet_NaN();
    try
    {
        solver.check_invariants();
        FAIL() << "expected divergence_error";
    }
    catch (const divergence_error &e)
    {
        EXPECT_EQ(e.particle_index(), 1);
        EXPECT_EQ(e.material(), MaterialType::Jelly);
        EXPECT_NE(std::string(e.what()).find("jelly"), std::string::npos);
    }
}

TEST(Divergence, DegenerateDeformationIsReported)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particle(Particle(Vec(0.5, 0.5), MaterialType::Snow));
    solver.particles[0].F << 1.0, 0.0,
        0.0, -1.0;
    EXPECT_THROW(solver.check_invariants(), divergence_error);
}

TEST(Divergence, SubstepRaisesOnNaNVelocity)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particle(Particle(Vec(0.5, 0.5), MaterialType::Fluid,
                                 Vec(std::numeric_limits<double>::infinity(), 0.0)));
    EXPECT_THROW(solver.substep(), divergence_error);
}

TEST(Divergence, FailingParticleIsBlamedBeforeNeighboursArePolluted)
{
    mpm_solver solver(make_config(Backend::Serial, Accumulation::Atomic));
    solver.add_particle(Particle(Vec(0.5, 0.5), MaterialType::Fluid));
    solver.add_particle(Particle(Vec(0.505, 0.5), MaterialType::Jelly));
    solver.particles[1].F(0, 0) = std::numeric_limits<double>::infinity();

    try
    {
        solver.substep();
        FAIL() << "expected divergence_error";
    }
    catch (const divergence_error &e)
    {
        EXPECT_EQ(e.particle_index(), 1);
        EXPECT_EQ(e.material(), MaterialType::Jelly);
    }
    // the healthy neighbour never saw the bad grid
    EXPECT_TRUE(solver.particles[0].v.allFinite());
    EXPECT_TRUE(solver.particles[0].F.allFinite());
}

TEST(Divergence, LowestFailingIndexIsReportedForEveryMode)
{
    const Accumulation modes[2] = {Accumulation::Atomic, Accumulation::ScatterReduce};
    for (Accumulation mode : modes)
    {
        mpm_solver solver(make_config(Backend::OpenMP, mode));
        solver.add_particles(moving_scene(300, 3));
        solver.particles[250].F(1, 1) = std::numeric_limits<double>::quiet_NaN();
        solver.particles[120].v.y() = std::numeric_limits<double>::infinity();

        solver.clear_grid();
        try
        {
            solver.particle_to_grid();
            FAIL() << "expected divergence_error for " << accumulation_name(mode);
        }
        catch (const divergence_error &e)
        {
            EXPECT_EQ(e.particle_index(), 120) << accumulation_name(mode);
            EXPECT_EQ(e.material(), solver.particles[120].material);
        }
        EXPECT_TRUE(solver.get_grid().total_momentum().allFinite()) << accumulation_name(mode);
    }
}

TEST(Divergence, BadParticleIsContainedWithChecksOff)
{
    SimConfig config = make_config(Backend::Serial, Accumulation::Atomic);
    config.check_invariants = false;
    mpm_solver solver(config);
    solver.add_particle(Particle(Vec(0.5, 0.5), MaterialType::Snow));
    solver.add_particle(Particle(Vec(std::numeric_limits<double>::quiet_NaN(), 0.5), MaterialType::Snow));
    solver.add_particle(Particle(Vec(1e300, -1e300), MaterialType::Fluid));

    for (int step = 0; step < 3; step++)
    {
        EXPECT_NO_THROW(solver.substep());
    }

    const Particle &healthy = solver.particles[0];
    EXPECT_TRUE(healthy.x.allFinite());
    EXPECT_TRUE(healthy.v.allFinite());
    EXPECT_LT(healthy.v.y(), 0.0);
    EXPECT_NEAR(solver.get_grid().total_mass(), config.particle_mass(), 1e-12);
    EXPECT_THROW(solver.check_invariants(), divergence_error);
}
