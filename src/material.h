#ifndef MATERIAL_H
#define MATERIAL_H

#include <Eigen/Dense>
#include <memory>
#include <string>

enum class MaterialType
{
    Fluid = 0,
    Jelly = 1,
    Snow = 2
};

const int material_count = 3;

const char *material_name(MaterialType type);
// throws std::invalid_argument on an unknown name
MaterialType parse_material(const std::string &name);
// 0xRRGGBB
unsigned int material_color(MaterialType type);

struct MaterialParams
{
    double youngs_modulus = 1e3;
    double poisson_ratio = 0.2;

    // h = clamp(exp(hardening * (1 - Jp)), hardening_min, hardening_max)
    double hardening = 10.0;
    double hardening_min = 0.1;
    double hardening_max = 5.0;
    double jelly_hardening = 0.3;

    // Snow yield surface on the singular values of F
    double critical_compression = 2.5e-2;
    double critical_stretch = 4.5e-3;

    // Initial Lamé parameters
    double mu_0() const { return youngs_modulus / (2.0 * (1.0 + poisson_ratio)); }
    double lambda_0() const { return youngs_modulus * poisson_ratio / ((1.0 + poisson_ratio) * (1.0 - 2.0 * poisson_ratio)); }
};

struct Lame
{
    double mu;
    double lambda;
};

// Per-material part of the constitutive update. The solver only talks to
// materials through this interface.
class material_model
{
public:
    explicit material_model(const MaterialParams &params) : params(params) {}
    virtual ~material_model() {}

    virtual MaterialType type() const = 0;

    // Lamé parameters scaled by the hardening coefficient for plastic ratio Jp
    virtual Lame hardening(double Jp) const = 0;
    virtual Eigen::Vector2d clamp_singular_values(const Eigen::Vector2d &sig) const = 0;
    // F is the trial deformation gradient, sig the clamped singular values
    virtual Eigen::Matrix2d reconstruct(const Eigen::Matrix2d &F, const Eigen::Matrix2d &U,
                                        const Eigen::Vector2d &sig, const Eigen::Matrix2d &V) const = 0;

protected:
    double hardening_coefficient(double Jp) const;

    MaterialParams params;
};

class fluid_model : public material_model
{
public:
    using material_model::material_model;

    MaterialType type() const override { return MaterialType::Fluid; }
    Lame hardening(double Jp) const override;
    Eigen::Vector2d clamp_singular_values(const Eigen::Vector2d &sig) const override;
    Eigen::Matrix2d reconstruct(const Eigen::Matrix2d &F, const Eigen::Matrix2d &U,
                                const Eigen::Vector2d &sig, const Eigen::Matrix2d &V) const override;
};

class jelly_model : public material_model
{
public:
    using material_model::material_model;

    MaterialType type() const override { return MaterialType::Jelly; }
    Lame hardening(double Jp) const override;
    Eigen::Vector2d clamp_singular_values(const Eigen::Vector2d &sig) const override;
    Eigen::Matrix2d reconstruct(const Eigen::Matrix2d &F, const Eigen::Matrix2d &U,
                                const Eigen::Vector2d &sig, const Eigen::Matrix2d &V) const override;
};

class snow_model : public material_model
{
public:
    using material_model::material_model;

    MaterialType type() const override { return MaterialType::Snow; }
    Lame hardening(double Jp) const override;
    Eigen::Vector2d clamp_singular_values(const Eigen::Vector2d &sig) const override;
    Eigen::Matrix2d reconstruct(const Eigen::Matrix2d &F, const Eigen::Matrix2d &U,
                                const Eigen::Vector2d &sig, const Eigen::Matrix2d &V) const override;
};

// One model instance per material, indexed by MaterialType
class material_table
{
public:
    explicit material_table(const MaterialParams &params);

    const material_model &operator[](MaterialType type) const { return *models[static_cast<int>(type)]; }

private:
    std::unique_ptr<material_model> models[material_count];
};

struct ConstitutiveState
{
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    Eigen::Matrix2d F;
    double Jp;
    Lame lame;
    // Fixed corotated Kirchhoff stress, not yet scaled by dt / volume
    Eigen::Matrix2d stress;
};

// SVD, plastic projection, hardening and fixed corotated stress for one particle
ConstitutiveState constitutive_update(const material_model &model, const Eigen::Matrix2d &F, double Jp);

#endif // MATERIAL_H
