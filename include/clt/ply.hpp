#pragma once

#include "clt/common.hpp"

namespace clt {

struct Ply {
    double angle;       // Fiber orientation relative to laminate x-axis (degrees)
    double E1;          // Axial (fiber direction) modulus
    double E2;          // Transverse modulus
    double nu12;        // Major Poisson's ratio
    double G12;         // In-plane shear modulus
    double thickness;   // Ply thickness

    Ply(double angle, double E1, double E2, double nu12, double G12,
        double thickness);

    // Minor Poisson's ratio from reciprocity: nu21 = nu12 * E2 / E1
    double nu21() const;

    // Reduced stiffness in the fiber-aligned (1-2) frame
    Matrix3d local_stiffness() const;

    // Reduced stiffness rotated into the laminate (x-y) frame: T * Ql * T^T
    Matrix3d global_stiffness() const;

    // Throws InvalidMaterialProperty if any property is inadmissible
    void validate() const;
};

// Stiffness rotation matrix for a ply at angle_deg (degrees)
Matrix3d transformation_matrix(double angle_deg);

}  // namespace clt
