#include <gtest/gtest.h>
#include "clt/laminate.hpp"
#include "clt/stiffness_calculator.hpp"
#include "clt/errors.hpp"
#include "clt/logging.hpp"
#include <cmath>

using namespace clt;

// Rotated stiffness from the explicit angle expansions (Jones, Mechanics of
// Composite Materials, ch. 2) for comparison with T * Ql * T^T.
static Matrix3d qbar_closed_form(const Ply& p) {
    Matrix3d Ql = p.local_stiffness();
    double Q11 = Ql(0, 0), Q12 = Ql(0, 1), Q22 = Ql(1, 1), Q66 = Ql(2, 2);
    double m = std::cos(deg_to_rad(p.angle));
    double n = std::sin(deg_to_rad(p.angle));
    double m2 = m * m, n2 = n * n;

    Matrix3d Q;
    Q(0, 0) = Q11 * m2 * m2 + 2.0 * (Q12 + 2.0 * Q66) * m2 * n2 + Q22 * n2 * n2;
    Q(0, 1) = (Q11 + Q22 - 4.0 * Q66) * m2 * n2 + Q12 * (m2 * m2 + n2 * n2);
    Q(1, 1) = Q11 * n2 * n2 + 2.0 * (Q12 + 2.0 * Q66) * m2 * n2 + Q22 * m2 * m2;
    Q(0, 2) = (Q11 - Q12 - 2.0 * Q66) * m2 * m * n + (Q12 - Q22 + 2.0 * Q66) * m * n * n2;
    Q(1, 2) = (Q11 - Q12 - 2.0 * Q66) * m * n * n2 + (Q12 - Q22 + 2.0 * Q66) * m2 * m * n;
    Q(2, 2) = (Q11 + Q22 - 2.0 * Q12 - 2.0 * Q66) * m2 * n2 + Q66 * (m2 * m2 + n2 * n2);
    Q(1, 0) = Q(0, 1);
    Q(2, 0) = Q(0, 2);
    Q(2, 1) = Q(1, 2);
    return Q;
}

TEST(Validation, MatrixProductMatchesClosedForm) {
    for (double angle = -90.0; angle <= 90.0; angle += 7.5) {
        Ply p(angle, 140.0, 10.0, 0.3, 5.0, 0.125);
        Matrix3d Q = p.global_stiffness();
        Matrix3d Q_ref = qbar_closed_form(p);
        EXPECT_LT((Q - Q_ref).cwiseAbs().maxCoeff(), 1e-10) << "angle=" << angle;
    }
}

TEST(Validation, WorkedExampleEndToEnd) {
    set_log_level(spdlog::level::warn);

    auto lam = Laminate::from_arrays({45.0, -45.0, 0.0},
                                     {40.0, 40.0, 40.0},
                                     {9.8, 9.8, 9.8},
                                     {0.3, 0.3, 0.3},
                                     {2.8, 2.8, 2.8},
                                     {0.4, 0.4, 0.2});
    auto result = compute_laminate_stiffness(lam);

    Matrix3d Q_expected;
    Q_expected << 21.807, 9.748, 0.0,
                   9.748, 15.631, 0.0,
                   0.0, 0.0, 9.542;
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            double ref = Q_expected(i, j);
            if (ref == 0.0) {
                EXPECT_NEAR(result.Q_avg(i, j), 0.0, 1e-12);
            } else {
                EXPECT_LT(std::abs(result.Q_avg(i, j) - ref) / ref, 1e-4)
                    << "Q*(" << i << "," << j << ")";
            }
        }
    }

    const auto& ec = result.constants;
    EXPECT_LT(std::abs(ec.Ex - 15.728) / 15.728, 1e-4);
    EXPECT_LT(std::abs(ec.Ey - 11.274) / 11.274, 1e-4);
    EXPECT_LT(std::abs(ec.Gxy - 9.542) / 9.542, 1e-4);
    EXPECT_LT(std::abs(ec.nuxy - 0.6236) / 0.6236, 1e-4);

    Matrix3d I = result.Q_avg * result.S_avg;
    EXPECT_LT((I - Matrix3d::Identity()).cwiseAbs().maxCoeff(), 1e-9);
}

TEST(Validation, InvalidPoissonProductRejectedBeforeComputation) {
    // E1 = E2 = 10 with nu12 = 0.9: nu12 * nu21 = 0.81, valid
    auto ok = Laminate::from_angles({0.0, 90.0}, {0.1, 0.1}, 10.0, 10.0, 0.9, 2.0);
    EXPECT_NO_THROW(compute_laminate_stiffness(ok));

    // E2 = 10 * E1 with nu12 = 0.9: nu12 * nu21 = 8.1
    EXPECT_THROW(Laminate::from_angles({0.0, 90.0}, {0.1, 0.1}, 1.0, 10.0, 0.9, 2.0),
                 InvalidMaterialProperty);
}

TEST(Validation, InvalidPlyCannotBeStacked) {
    std::vector<Ply> plies = {Ply(0.0, 40.0, 9.8, 0.3, 2.8, 0.1)};
    Laminate lam(plies);
    Ply bad = lam.ply(0);
    bad.thickness = -1.0;
    Laminate copy;
    EXPECT_THROW(copy.add_ply(bad), InvalidMaterialProperty);
    EXPECT_THROW(Laminate(std::vector<Ply>{bad}), InvalidMaterialProperty);
}
