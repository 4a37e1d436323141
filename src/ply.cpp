#include "clt/ply.hpp"
#include "clt/errors.hpp"

#include <fmt/format.h>

namespace clt {

Ply::Ply(double angle, double E1, double E2, double nu12, double G12,
         double thickness)
    : angle(angle), E1(E1), E2(E2), nu12(nu12), G12(G12), thickness(thickness) {
    validate();
}

double Ply::nu21() const {
    return nu12 * E2 / E1;
}

void Ply::validate() const {
    if (!std::isfinite(angle) || !std::isfinite(E1) || !std::isfinite(E2) ||
        !std::isfinite(nu12) || !std::isfinite(G12) || !std::isfinite(thickness))
        throw InvalidMaterialProperty("Ply properties must be finite");
    if (E1 <= 0.0)
        throw InvalidMaterialProperty(fmt::format("Axial modulus E1 must be positive (got {})", E1));
    if (E2 <= 0.0)
        throw InvalidMaterialProperty(fmt::format("Transverse modulus E2 must be positive (got {})", E2));
    if (G12 <= 0.0)
        throw InvalidMaterialProperty(fmt::format("Shear modulus G12 must be positive (got {})", G12));
    if (nu12 < 0.0 || nu12 >= 1.0)
        throw InvalidMaterialProperty(fmt::format("Poisson's ratio nu12 must be in [0, 1) (got {})", nu12));
    if (nu12 * nu21() >= 1.0)
        throw InvalidMaterialProperty(fmt::format(
            "nu12 * nu21 must be below 1 (got {} with nu21 = {})", nu12 * nu21(), nu21()));
    if (thickness <= 0.0)
        throw InvalidMaterialProperty(fmt::format("Ply thickness must be positive (got {})", thickness));
}

Matrix3d Ply::local_stiffness() const {
    double n21 = nu21();
    double denom = 1.0 - nu12 * n21;
    Matrix3d Ql = Matrix3d::Zero();
    Ql(0, 0) = E1 / denom;
    Ql(0, 1) = n21 * E1 / denom;
    Ql(1, 0) = nu12 * E2 / denom;
    Ql(1, 1) = E2 / denom;
    Ql(2, 2) = G12;
    return Ql;
}

Matrix3d Ply::global_stiffness() const {
    Matrix3d T = transformation_matrix(angle);
    return T * local_stiffness() * T.transpose();
}

Matrix3d transformation_matrix(double angle_deg) {
    double theta = deg_to_rad(angle_deg);
    double c = std::cos(theta);
    double s = std::sin(theta);

    Matrix3d T;
    T << c * c,  s * s, -2.0 * s * c,
         s * s,  c * c,  2.0 * s * c,
         s * c, -s * c,  c * c - s * s;
    return T;
}

}  // namespace clt
