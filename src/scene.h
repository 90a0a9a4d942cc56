#ifndef SCENE_H
#define SCENE_H

#include <random>
#include <string>

#include "particle.h"
#include "sim_config.h"

// Axis-aligned block of one material
struct Region
{
    double x0, y0;
    double width, height;
    MaterialType material;
};

// count particles on a cell-centred lattice covering the region
ParticleList lattice_block(const Region &region, int count);
// count particles uniformly distributed in the region
ParticleList random_block(const Region &region, int count, std::mt19937 &rng);

// Fluid, jelly and snow blocks of the demo scene, particle i is fluid for
// i < 2n/3, jelly for i < 5n/6 and snow otherwise.
ParticleList default_scene(int count, Placement placement, unsigned int seed);

// Particles from a CSV whose first line is a header and whose first two
// columns are x and y. Positions are scaled, then offset by center.
ParticleList load_csv_shape(const std::string &path, const Vec &center, double scale, MaterialType material);

// default_scene plus the optional CSV shape named in the config
ParticleList build_scene(const SimConfig &config);

#endif // SCENE_H
