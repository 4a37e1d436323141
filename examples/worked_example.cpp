// Angle-ply laminate [45/-45/0] with a glass/epoxy ply (moduli in GPa,
// thicknesses in mm).

#include "clt/laminate.hpp"
#include "clt/stiffness_calculator.hpp"
#include "clt/report.hpp"
#include "clt/errors.hpp"
#include "clt/logging.hpp"

#include <spdlog/cfg/env.h>

int main() {
    spdlog::cfg::load_env_levels();

    try {
        auto laminate = clt::Laminate::from_angles(
            {45.0, -45.0, 0.0}, {0.4, 0.4, 0.2},
            40.0, 9.8, 0.3, 2.8);

        auto result = clt::compute_laminate_stiffness(laminate);
        clt::print_result(result);
    } catch (const std::invalid_argument& e) {
        clt::logger()->error("Invalid laminate input: {}", e.what());
        return 1;
    } catch (const clt::ComputationError& e) {
        clt::logger()->error("Laminate stiffness computation failed: {}", e.what());
        return 2;
    }
    return 0;
}
