#pragma once

#include "clt/common.hpp"
#include "clt/laminate.hpp"

namespace clt {

struct CalculatorConfig {
    // Relative pivot threshold below which Q* is treated as singular
    double singular_tolerance = 1e-12;

    // Per-ply stiffness is evaluated in parallel (OpenMP builds only)
    // when the laminate has at least this many plies.
    int parallel_min_plies = 64;
};

struct EngineeringConstants {
    double Ex = 0.0;     // Effective modulus along x
    double Ey = 0.0;     // Effective modulus along y
    double Gxy = 0.0;    // Effective in-plane shear modulus
    double nuxy = 0.0;   // Major Poisson's ratio: -S(1,0) / S(0,0)
    double nuyx = 0.0;   // Minor Poisson's ratio: -S(0,1) / S(1,1)
};

struct PlyStiffness {
    int index = 0;
    double angle = 0.0;       // degrees
    double E1 = 0.0;
    double E2 = 0.0;
    double thickness = 0.0;
    Matrix3d Q = Matrix3d::Zero();   // Global-frame reduced stiffness
};

struct LaminateResult {
    std::vector<PlyStiffness> ply_stiffness;
    Matrix3d A = Matrix3d::Zero();        // Extensional stiffness sum(Q_i * h_i)
    Matrix3d Q_avg = Matrix3d::Zero();    // A / h_tot
    Matrix3d S_avg = Matrix3d::Zero();    // inverse(Q_avg)
    double total_thickness = 0.0;
    EngineeringConstants constants;

    // True when the extension-shear terms A16, A26 vanish relative to
    // max(A11, A22).
    bool is_balanced(double tol = 1e-10) const;
};

class LaminateStiffnessCalculator {
public:
    explicit LaminateStiffnessCalculator(const CalculatorConfig& config = CalculatorConfig());

    // Validate every ply, evaluate global ply stiffnesses, assemble A,
    // average, invert and derive engineering constants. Throws
    // InvalidMaterialProperty, SingularStiffness or ComputationError;
    // no partial result is returned.
    LaminateResult compute(const Laminate& laminate) const;

    const CalculatorConfig& config() const { return config_; }

    // A = sum(Q_i * h_i) in ply order
    static Matrix3d assemble_extensional(const std::vector<PlyStiffness>& plies);

    // inverse(Q_avg), throwing SingularStiffness when rank-deficient
    static Matrix3d average_compliance(const Matrix3d& Q_avg, double tolerance);

    // Ex, Ey, Gxy, nuxy, nuyx from the compliance matrix
    static EngineeringConstants engineering_constants(const Matrix3d& S);

private:
    std::vector<PlyStiffness> ply_stiffnesses(const Laminate& laminate) const;

    CalculatorConfig config_;
};

LaminateResult compute_laminate_stiffness(const Laminate& laminate,
                                          const CalculatorConfig& config = CalculatorConfig());

}  // namespace clt
