#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

#include "scene.h"

static int count_material(const ParticleList &particles, MaterialType material)
{
    int count = 0;
    for (const auto &p : particles)
    {
        if (p.material == material)
            count++;
    }
    return count;
}

static bool inside(const Particle &p, const Region &region)
{
    return p.x.x() >= region.x0 && p.x.x() <= region.x0 + region.width &&
           p.x.y() >= region.y0 && p.x.y() <= region.y0 + region.height;
}

TEST(Scene, DefaultSplitCounts)
{
    ParticleList particles = default_scene(10000, Placement::Random, 0);
    ASSERT_EQ(particles.size(), 10000u);
    EXPECT_EQ(count_material(particles, MaterialType::Fluid), 6667);
    EXPECT_EQ(count_material(particles, MaterialType::Jelly), 1667);
    EXPECT_EQ(count_material(particles, MaterialType::Snow), 1666);

    // particle index decides the material
    EXPECT_EQ(particles[6666].material, MaterialType::Fluid);
    EXPECT_EQ(particles[6667].material, MaterialType::Jelly);
    EXPECT_EQ(particles[8333].material, MaterialType::Jelly);
    EXPECT_EQ(particles[8334].material, MaterialType::Snow);
}

TEST(Scene, SmallCounts)
{
    EXPECT_TRUE(default_scene(0, Placement::Lattice, 0).empty());
    ParticleList three = default_scene(3, Placement::Lattice, 0);
    ASSERT_EQ(three.size(), 3u);
    EXPECT_EQ(three[0].material, MaterialType::Fluid);
    EXPECT_EQ(three[1].material, MaterialType::Fluid);
    EXPECT_EQ(three[2].material, MaterialType::Jelly);
}

TEST(Scene, ParticlesStartAtRest)
{
    for (const auto &p : default_scene(300, Placement::Random, 4))
    {
        EXPECT_TRUE(p.v.isZero(0.0));
        EXPECT_TRUE(p.C.isZero(0.0));
        EXPECT_TRUE(p.F.isIdentity(0.0));
        EXPECT_EQ(p.Jp, 1.0);
    }
}

TEST(Scene, LatticeIsDeterministicAndInsideRegions)
{
    ParticleList a = default_scene(3000, Placement::Lattice, 1);
    ParticleList b = default_scene(3000, Placement::Lattice, 99);
    ASSERT_EQ(a.size(), b.size());
    for (size_t k = 0; k < a.size(); k++)
    {
        EXPECT_TRUE(a[k].x == b[k].x) << "particle " << k;
    }

    const Region regions[3] = {
        {0.35, 0.05, 0.30, 0.30, MaterialType::Fluid},
        {0.30, 0.45, 0.15, 0.15, MaterialType::Jelly},
        {0.55, 0.60, 0.15, 0.15, MaterialType::Snow},
    };
    for (const auto &p : a)
    {
        EXPECT_TRUE(inside(p, regions[static_cast<int>(p.material)]));
    }
}

TEST(Scene, LatticeBlockFillsRows)
{
    Region region = {0.2, 0.2, 0.1, 0.1, MaterialType::Jelly};
    ParticleList block = lattice_block(region, 100);
    ASSERT_EQ(block.size(), 100u);
    // 10 x 10 cell centres
    EXPECT_NEAR(block[0].x.x(), 0.205, 1e-12);
    EXPECT_NEAR(block[0].x.y(), 0.205, 1e-12);
    EXPECT_NEAR(block[99].x.x(), 0.295, 1e-12);
    EXPECT_NEAR(block[99].x.y(), 0.295, 1e-12);
}

TEST(Scene, RandomIsReproducibleFromSeed)
{
    ParticleList a = default_scene(500, Placement::Random, 42);
    ParticleList b = default_scene(500, Placement::Random, 42);
    ParticleList c = default_scene(500, Placement::Random, 43);
    int differing = 0;
    for (size_t k = 0; k < a.size(); k++)
    {
        EXPECT_TRUE(a[k].x == b[k].x);
        if (a[k].x != c[k].x)
            differing++;
    }
    EXPECT_GT(differing, 0);
}

TEST(Scene, CsvShapeIsScaledAndCentered)
{
    std::string path = ::testing::TempDir() + "mlsmpm_shape.csv";
    {
        std::ofstream out(path);
        out << "x,y,z\n"
            << "0.1,0.2,0\n"
            << "-0.1,0,0\n"
            << "\n";
    }

    ParticleList shape = load_csv_shape(path, Vec(0.5, 0.5), 0.5, MaterialType::Snow);
    ASSERT_EQ(shape.size(), 2u);
    EXPECT_NEAR(shape[0].x.x(), 0.55, 1e-12);
    EXPECT_NEAR(shape[0].x.y(), 0.6, 1e-12);
    EXPECT_NEAR(shape[1].x.x(), 0.45, 1e-12);
    EXPECT_NEAR(shape[1].x.y(), 0.5, 1e-12);
    EXPECT_EQ(shape[1].material, MaterialType::Snow);

    SimConfig config;
    config.particles = 30;
    config.shape_csv = path;
    config.shape_material = MaterialType::Jelly;
    ParticleList scene = build_scene(config);
    ASSERT_EQ(scene.size(), 32u);
    EXPECT_EQ(scene.back().material, MaterialType::Jelly);
}

TEST(Scene, CsvErrors)
{
    EXPECT_THROW(load_csv_shape("/nonexistent/shape.csv", Vec(0.5, 0.5), 1.0, MaterialType::Snow),
                 std::runtime_error);

    std::string path = ::testing::TempDir() + "mlsmpm_bad_shape.csv";
    {
        std::ofstream out(path);
        out << "x,y\n"
            << "0.1,abc\n";
    }
    EXPECT_THROW(load_csv_shape(path, Vec(0.5, 0.5), 1.0, MaterialType::Snow), std::invalid_argument);
}
