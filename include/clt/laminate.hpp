#pragma once

#include "clt/common.hpp"
#include "clt/ply.hpp"

namespace clt {

// Ordered ply stack, bottom (index 0) to top
class Laminate {
public:
    Laminate() = default;
    explicit Laminate(std::vector<Ply> plies);

    // Build from per-ply arrays; all six must have the same length.
    static Laminate from_arrays(const std::vector<double>& angles,
                                const std::vector<double>& E1,
                                const std::vector<double>& E2,
                                const std::vector<double>& nu12,
                                const std::vector<double>& G12,
                                const std::vector<double>& thicknesses);

    // Build a single-material laminate from angle and thickness arrays
    static Laminate from_angles(const std::vector<double>& angles,
                                const std::vector<double>& thicknesses,
                                double E1, double E2, double nu12, double G12);

    void add_ply(const Ply& ply);

    // Append half_stack followed by its mirror image: [t1/.../tn]s
    void add_symmetric(const std::vector<Ply>& half_stack);

    int num_plies() const { return static_cast<int>(plies_.size()); }
    bool empty() const { return plies_.empty(); }
    const Ply& ply(int i) const;
    const std::vector<Ply>& plies() const { return plies_; }

    double total_thickness() const;

    // Angles in stacking order, e.g. "[45/-45/0]"
    std::string stacking_sequence() const;

private:
    std::vector<Ply> plies_;
};

namespace layup_presets {

// [0]n
Laminate unidirectional(double E1, double E2, double nu12, double G12,
                        double ply_thickness, int num_plies);

// [0/90]ns
Laminate cross_ply(double E1, double E2, double nu12, double G12,
                   double ply_thickness, int repeats = 1);

// [+t/-t]ns
Laminate angle_ply(double E1, double E2, double nu12, double G12,
                   double ply_thickness, double angle, int repeats = 1);

// [0/45/-45/90]s
Laminate quasi_isotropic(double E1, double E2, double nu12, double G12,
                         double ply_thickness);

}  // namespace layup_presets

}  // namespace clt
