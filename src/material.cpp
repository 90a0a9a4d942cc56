#include "material.h"

#include <Eigen/SVD>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace Eigen;
using namespace std;

const char *material_name(MaterialType type)
{
    switch (type)
    {
    case MaterialType::Fluid:
        return "fluid";
    case MaterialType::Jelly:
        return "jelly";
    case MaterialType::Snow:
        return "snow";
    }
    return "unknown";
}

MaterialType parse_material(const std::string &name)
{
    if (name == "fluid")
        return MaterialType::Fluid;
    if (name == "jelly")
        return MaterialType::Jelly;
    if (name == "snow")
        return MaterialType::Snow;
    throw std::invalid_argument("unknown material: " + name);
}

unsigned int material_color(MaterialType type)
{
    switch (type)
    {
    case MaterialType::Fluid:
        return 0x36EEFF;
    case MaterialType::Jelly:
        return 0xFCA13F;
    case MaterialType::Snow:
        return 0xEEEEF0;
    }
    return 0xFFFFFF;
}

double material_model::hardening_coefficient(double Jp) const
{
    double h = exp(params.hardening * (1.0 - Jp));
    return std::min(std::max(h, params.hardening_min), params.hardening_max);
}

/**************************************/
/*************** FLUID ****************/
/**************************************/

Lame fluid_model::hardening(double Jp) const
{
    // no shear resistance
    Lame lame;
    lame.mu = 0.0;
    lame.lambda = params.lambda_0() * hardening_coefficient(Jp);
    return lame;
}

Vector2d fluid_model::clamp_singular_values(const Vector2d &sig) const
{
    return sig;
}

Matrix2d fluid_model::reconstruct(const Matrix2d &, const Matrix2d &, const Vector2d &sig, const Matrix2d &) const
{
    // drop all shape memory, keep the volume
    return Matrix2d::Identity() * sqrt(sig.prod());
}

/**************************************/
/*************** JELLY ****************/
/**************************************/

Lame jelly_model::hardening(double) const
{
    Lame lame;
    lame.mu = params.mu_0() * params.jelly_hardening;
    lame.lambda = params.lambda_0() * params.jelly_hardening;
    return lame;
}

Vector2d jelly_model::clamp_singular_values(const Vector2d &sig) const
{
    return sig;
}

Matrix2d jelly_model::reconstruct(const Matrix2d &F, const Matrix2d &, const Vector2d &, const Matrix2d &) const
{
    return F;
}

/**************************************/
/**************** SNOW ****************/
/**************************************/

Lame snow_model::hardening(double Jp) const
{
    double h = hardening_coefficient(Jp);
    Lame lame;
    lame.mu = params.mu_0() * h;
    lame.lambda = params.lambda_0() * h;
    return lame;
}

Vector2d snow_model::clamp_singular_values(const Vector2d &sig) const
{
    Vector2d clamped;
    for (int d = 0; d < 2; d++)
    {
        clamped[d] = std::min(std::max(sig[d], 1.0 - params.critical_compression), 1.0 + params.critical_stretch);
    }
    return clamped;
}

Matrix2d snow_model::reconstruct(const Matrix2d &, const Matrix2d &U, const Vector2d &sig, const Matrix2d &V) const
{
    // elastic part only, the plastic part has been folded into Jp
    return U * sig.asDiagonal() * V.transpose();
}

material_table::material_table(const MaterialParams &params)
{
    models[static_cast<int>(MaterialType::Fluid)].reset(new fluid_model(params));
    models[static_cast<int>(MaterialType::Jelly)].reset(new jelly_model(params));
    models[static_cast<int>(MaterialType::Snow)].reset(new snow_model(params));
}

ConstitutiveState constitutive_update(const material_model &model, const Matrix2d &F, double Jp)
{
    JacobiSVD<Matrix2d> svd(F, ComputeFullU | ComputeFullV);
    Matrix2d U = svd.matrixU();
    Matrix2d V = svd.matrixV();
    Vector2d sig = svd.singularValues();

    Vector2d new_sig = model.clamp_singular_values(sig);

    ConstitutiveState state;
    state.Jp = Jp;
    double J = 1.0;
    for (int d = 0; d < 2; d++)
    {
        state.Jp *= sig[d] / new_sig[d];
        J *= new_sig[d];
    }

    // hardening sees the Jp of this substep, after the clamp above, not the value it entered with
    state.lame = model.hardening(state.Jp);
    state.F = model.reconstruct(F, U, new_sig, V);

    // Polar decomp. for fixed corotated model
    Matrix2d R = U * V.transpose();
    state.stress = 2.0 * state.lame.mu * (state.F - R) * state.F.transpose() +
                   Matrix2d::Identity() * state.lame.lambda * J * (J - 1.0);
    return state;
}
