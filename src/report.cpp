#include "clt/report.hpp"

#include <fmt/format.h>

namespace clt {

std::string format_matrix(const Matrix3d& m, int precision) {
    std::string s;
    for (int i = 0; i < 3; i++) {
        s += "  [";
        for (int j = 0; j < 3; j++) {
            // Fold -0 into 0 so symmetric terms print identically
            double v = (m(i, j) == 0.0) ? 0.0 : m(i, j);
            s += fmt::format("{:>16.{}g}", v, precision);
        }
        s += " ]\n";
    }
    return s;
}

std::string format_result(const LaminateResult& result, int precision) {
    std::string s;
    for (const auto& p : result.ply_stiffness) {
        s += fmt::format("Ply {}: angle = {:g} deg, E1 = {:g}, E2 = {:g}, h = {:g}\n",
                         p.index + 1, p.angle, p.E1, p.E2, p.thickness);
        s += format_matrix(p.Q, precision);
    }
    s += fmt::format("Q* (total thickness {:g}):\n", result.total_thickness);
    s += format_matrix(result.Q_avg, precision);
    s += "S*:\n";
    s += format_matrix(result.S_avg, precision);

    const auto& ec = result.constants;
    s += fmt::format("Ex = {:.{}g}, Ey = {:.{}g}, Gxy = {:.{}g}, nuxy = {:.{}g}\n",
                     ec.Ex, precision, ec.Ey, precision,
                     ec.Gxy, precision, ec.nuxy, precision);
    return s;
}

void print_result(const LaminateResult& result, std::FILE* out) {
    fmt::print(out, "{}", format_result(result));
    std::fflush(out);
}

}  // namespace clt
