#ifndef PARTICLE_H
#define PARTICLE_H

#include <Eigen/Dense>
#include <Eigen/StdVector>
#include <vector>

#include "material.h"

using Vec = Eigen::Vector2d;
using Mat = Eigen::Matrix2d;

struct Particle
{
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    // Position and velocity
    Vec x, v;
    // Affine momentum from APIC
    Mat C;
    // Deformation gradient
    Mat F;
    // Plastic volume ratio, only moves away from 1 for snow
    double Jp;
    MaterialType material;

    Particle(Vec x, MaterialType material, Vec v = Vec::Zero()) : x(x),
                                                                  v(v),
                                                                  C(Mat::Zero()),
                                                                  F(Mat::Identity()),
                                                                  Jp(1),
                                                                  material(material) {}
};

using ParticleList = std::vector<Particle, Eigen::aligned_allocator<Particle>>;

#endif // PARTICLE_H
