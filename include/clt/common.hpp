#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>

namespace clt {

// Plane-stress matrix types (3x3 in Voigt order: xx, yy, xy)
using Matrix3d = Eigen::Matrix3d;
using Vector3d = Eigen::Vector3d;

// Constants
constexpr double PI = 3.14159265358979323846;

inline double deg_to_rad(double deg) { return deg * PI / 180.0; }

}  // namespace clt
