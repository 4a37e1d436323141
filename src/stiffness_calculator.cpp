#include "clt/stiffness_calculator.hpp"
#include "clt/errors.hpp"
#include "clt/logging.hpp"

#include <fmt/format.h>
#include <Eigen/LU>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace clt {

bool LaminateResult::is_balanced(double tol) const {
    double max_a = std::max(std::abs(A(0, 0)), std::abs(A(1, 1)));
    if (max_a <= 0.0) return true;
    return std::abs(A(0, 2)) / max_a < tol && std::abs(A(1, 2)) / max_a < tol;
}

LaminateStiffnessCalculator::LaminateStiffnessCalculator(const CalculatorConfig& config)
    : config_(config) {
    if (!(config_.singular_tolerance > 0.0))
        throw std::invalid_argument("singular_tolerance must be positive");
}

std::vector<PlyStiffness> LaminateStiffnessCalculator::ply_stiffnesses(
    const Laminate& laminate) const
{
    int n = laminate.num_plies();
    std::vector<PlyStiffness> out(n);

    // Validation runs serially so that nothing throws inside the parallel region
    for (int i = 0; i < n; i++) {
        const Ply& p = laminate.ply(i);
        try {
            p.validate();
        } catch (const InvalidMaterialProperty& e) {
            logger()->error("Ply {} rejected: {}", i, e.what());
            throw InvalidMaterialProperty(fmt::format("Ply {}: {}", i, e.what()));
        }
        out[i].index = i;
        out[i].angle = p.angle;
        out[i].E1 = p.E1;
        out[i].E2 = p.E2;
        out[i].thickness = p.thickness;
    }

#ifdef _OPENMP
    #pragma omp parallel for schedule(static) if (n >= config_.parallel_min_plies)
#endif
    for (int i = 0; i < n; i++) {
        out[i].Q = laminate.plies()[i].global_stiffness();
    }

    return out;
}

Matrix3d LaminateStiffnessCalculator::assemble_extensional(
    const std::vector<PlyStiffness>& plies)
{
    Matrix3d A = Matrix3d::Zero();
    for (const auto& p : plies) {
        A += p.Q * p.thickness;
    }
    return A;
}

Matrix3d LaminateStiffnessCalculator::average_compliance(const Matrix3d& Q_avg,
                                                         double tolerance)
{
    if (!Q_avg.allFinite())
        throw SingularStiffness("Average stiffness Q* contains non-finite entries");

    Eigen::FullPivLU<Matrix3d> lu(Q_avg);
    lu.setThreshold(tolerance);
    if (!lu.isInvertible()) {
        throw SingularStiffness(fmt::format(
            "Average stiffness Q* is singular (rank {} of 3)", lu.rank()));
    }
    Matrix3d S = lu.inverse();
    if (!S.allFinite())
        throw SingularStiffness("Inverse of average stiffness Q* is not finite");
    return S;
}

EngineeringConstants LaminateStiffnessCalculator::engineering_constants(const Matrix3d& S) {
    for (int i = 0; i < 3; i++) {
        if (S(i, i) == 0.0 || !std::isfinite(S(i, i))) {
            throw ComputationError(fmt::format(
                "Compliance diagonal S({0},{0}) = {1} cannot be inverted", i, S(i, i)));
        }
    }

    EngineeringConstants ec;
    ec.Ex = 1.0 / S(0, 0);
    ec.Ey = 1.0 / S(1, 1);
    ec.Gxy = 1.0 / S(2, 2);
    ec.nuxy = -S(1, 0) / S(0, 0);
    ec.nuyx = -S(0, 1) / S(1, 1);
    return ec;
}

LaminateResult LaminateStiffnessCalculator::compute(const Laminate& laminate) const {
    if (laminate.empty())
        throw SingularStiffness("Laminate has no plies (total thickness is zero)");

    logger()->info("Computing laminate stiffness for {} plies {}",
                   laminate.num_plies(), laminate.stacking_sequence());

    LaminateResult result;
    result.ply_stiffness = ply_stiffnesses(laminate);

    for (const auto& p : result.ply_stiffness) {
        logger()->debug("Ply {} (angle={}, h={}): Q = [{} {} {}; {} {} {}; {} {} {}]",
                        p.index, p.angle, p.thickness,
                        p.Q(0, 0), p.Q(0, 1), p.Q(0, 2),
                        p.Q(1, 0), p.Q(1, 1), p.Q(1, 2),
                        p.Q(2, 0), p.Q(2, 1), p.Q(2, 2));
    }

    result.A = assemble_extensional(result.ply_stiffness);
    result.total_thickness = laminate.total_thickness();
    if (!(result.total_thickness > 0.0))
        throw SingularStiffness("Laminate total thickness must be positive");

    result.Q_avg = result.A / result.total_thickness;
    result.S_avg = average_compliance(result.Q_avg, config_.singular_tolerance);
    result.constants = engineering_constants(result.S_avg);

    logger()->info("Effective constants: Ex={:.6g} Ey={:.6g} Gxy={:.6g} nuxy={:.6g}",
                   result.constants.Ex, result.constants.Ey,
                   result.constants.Gxy, result.constants.nuxy);
    return result;
}

LaminateResult compute_laminate_stiffness(const Laminate& laminate,
                                          const CalculatorConfig& config) {
    return LaminateStiffnessCalculator(config).compute(laminate);
}

}  // namespace clt
