#include "clt/laminate.hpp"
#include "clt/errors.hpp"

#include <fmt/format.h>
#include <numeric>

namespace clt {

Laminate::Laminate(std::vector<Ply> plies) : plies_(std::move(plies)) {
    for (size_t i = 0; i < plies_.size(); i++) {
        try {
            plies_[i].validate();
        } catch (const InvalidMaterialProperty& e) {
            throw InvalidMaterialProperty(fmt::format("Ply {}: {}", i, e.what()));
        }
    }
}

Laminate Laminate::from_arrays(const std::vector<double>& angles,
                               const std::vector<double>& E1,
                               const std::vector<double>& E2,
                               const std::vector<double>& nu12,
                               const std::vector<double>& G12,
                               const std::vector<double>& thicknesses) {
    size_t n = angles.size();
    if (E1.size() != n || E2.size() != n || nu12.size() != n ||
        G12.size() != n || thicknesses.size() != n) {
        throw MismatchedArrayLength(fmt::format(
            "Ply arrays must have equal length (angles={}, E1={}, E2={}, "
            "nu12={}, G12={}, thicknesses={})",
            angles.size(), E1.size(), E2.size(), nu12.size(), G12.size(),
            thicknesses.size()));
    }

    std::vector<Ply> plies;
    plies.reserve(n);
    for (size_t i = 0; i < n; i++) {
        try {
            plies.emplace_back(angles[i], E1[i], E2[i], nu12[i], G12[i], thicknesses[i]);
        } catch (const InvalidMaterialProperty& e) {
            throw InvalidMaterialProperty(fmt::format("Ply {}: {}", i, e.what()));
        }
    }
    return Laminate(std::move(plies));
}

Laminate Laminate::from_angles(const std::vector<double>& angles,
                               const std::vector<double>& thicknesses,
                               double E1, double E2, double nu12, double G12) {
    size_t n = angles.size();
    return from_arrays(angles, std::vector<double>(n, E1), std::vector<double>(n, E2),
                       std::vector<double>(n, nu12), std::vector<double>(n, G12),
                       thicknesses);
}

void Laminate::add_ply(const Ply& ply) {
    ply.validate();
    plies_.push_back(ply);
}

void Laminate::add_symmetric(const std::vector<Ply>& half_stack) {
    for (const auto& p : half_stack) add_ply(p);
    for (auto it = half_stack.rbegin(); it != half_stack.rend(); ++it) add_ply(*it);
}

const Ply& Laminate::ply(int i) const {
    if (i < 0 || i >= num_plies())
        throw std::out_of_range(fmt::format("Ply index {} out of range [0, {})", i, num_plies()));
    return plies_[i];
}

double Laminate::total_thickness() const {
    return std::accumulate(plies_.begin(), plies_.end(), 0.0,
                           [](double h, const Ply& p) { return h + p.thickness; });
}

std::string Laminate::stacking_sequence() const {
    std::string seq = "[";
    for (size_t i = 0; i < plies_.size(); i++) {
        if (i > 0) seq += "/";
        seq += fmt::format("{:g}", plies_[i].angle);
    }
    seq += "]";
    return seq;
}

namespace layup_presets {

Laminate unidirectional(double E1, double E2, double nu12, double G12,
                        double ply_thickness, int num_plies) {
    if (num_plies < 1)
        throw std::invalid_argument("num_plies must be at least 1");
    Laminate lam;
    Ply p0(0.0, E1, E2, nu12, G12, ply_thickness);
    for (int i = 0; i < num_plies; i++) lam.add_ply(p0);
    return lam;
}

Laminate cross_ply(double E1, double E2, double nu12, double G12,
                   double ply_thickness, int repeats) {
    if (repeats < 1)
        throw std::invalid_argument("repeats must be at least 1");
    Ply p0(0.0, E1, E2, nu12, G12, ply_thickness);
    Ply p90(90.0, E1, E2, nu12, G12, ply_thickness);

    std::vector<Ply> half;
    for (int i = 0; i < repeats; i++) {
        half.push_back(p0);
        half.push_back(p90);
    }
    Laminate lam;
    lam.add_symmetric(half);
    return lam;
}

Laminate angle_ply(double E1, double E2, double nu12, double G12,
                   double ply_thickness, double angle, int repeats) {
    if (repeats < 1)
        throw std::invalid_argument("repeats must be at least 1");
    Ply pp(angle, E1, E2, nu12, G12, ply_thickness);
    Ply pm(-angle, E1, E2, nu12, G12, ply_thickness);

    std::vector<Ply> half;
    for (int i = 0; i < repeats; i++) {
        half.push_back(pp);
        half.push_back(pm);
    }
    Laminate lam;
    lam.add_symmetric(half);
    return lam;
}

Laminate quasi_isotropic(double E1, double E2, double nu12, double G12,
                         double ply_thickness) {
    Laminate lam;
    lam.add_symmetric({Ply(0.0, E1, E2, nu12, G12, ply_thickness),
                       Ply(45.0, E1, E2, nu12, G12, ply_thickness),
                       Ply(-45.0, E1, E2, nu12, G12, ply_thickness),
                       Ply(90.0, E1, E2, nu12, G12, ply_thickness)});
    return lam;
}

}  // namespace layup_presets

}  // namespace clt
