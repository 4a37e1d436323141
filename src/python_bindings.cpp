#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "clt/common.hpp"
#include "clt/errors.hpp"
#include "clt/ply.hpp"
#include "clt/laminate.hpp"
#include "clt/stiffness_calculator.hpp"
#include "clt/report.hpp"

namespace py = pybind11;
using namespace clt;

PYBIND11_MODULE(_core, m) {
    m.doc() = "Classical laminate theory: in-plane stiffness of fiber-composite laminates";

    // --- Exceptions ---
    // Translators run in reverse registration order, so derived types follow their bases.
    py::register_exception<InvalidMaterialProperty>(m, "InvalidMaterialProperty", PyExc_ValueError);
    py::register_exception<MismatchedArrayLength>(m, "MismatchedArrayLength", PyExc_ValueError);
    auto computation_error = py::register_exception<ComputationError>(
        m, "ComputationError", PyExc_ArithmeticError);
    py::register_exception<SingularStiffness>(m, "SingularStiffness", computation_error);

    // --- Ply ---
    py::class_<Ply>(m, "Ply")
        .def(py::init<double, double, double, double, double, double>(),
             py::arg("angle"), py::arg("E1"), py::arg("E2"),
             py::arg("nu12"), py::arg("G12"), py::arg("thickness"),
             "Create a ply with fiber angle (degrees), moduli, Poisson's ratio and thickness")
        .def_readonly("angle", &Ply::angle, "Fiber orientation (degrees)")
        .def_readonly("E1", &Ply::E1, "Axial modulus")
        .def_readonly("E2", &Ply::E2, "Transverse modulus")
        .def_readonly("nu12", &Ply::nu12, "Major Poisson's ratio")
        .def_readonly("G12", &Ply::G12, "In-plane shear modulus")
        .def_readonly("thickness", &Ply::thickness, "Ply thickness")
        .def("nu21", &Ply::nu21, "Minor Poisson's ratio nu12*E2/E1")
        .def("local_stiffness", &Ply::local_stiffness,
             "Reduced stiffness in the fiber frame (3x3)")
        .def("global_stiffness", &Ply::global_stiffness,
             "Reduced stiffness in the laminate frame (3x3)")
        .def("validate", &Ply::validate, "Validate ply properties")
        .def("__repr__", [](const Ply& p) {
            return "<Ply angle=" + std::to_string(p.angle) +
                   " E1=" + std::to_string(p.E1) +
                   " E2=" + std::to_string(p.E2) +
                   " h=" + std::to_string(p.thickness) + ">";
        });

    m.def("transformation_matrix", &transformation_matrix, py::arg("angle_deg"),
          "Stiffness rotation matrix T for a ply angle in degrees");

    // --- Laminate ---
    py::class_<Laminate>(m, "Laminate")
        .def(py::init<>())
        .def(py::init<std::vector<Ply>>(), py::arg("plies"))
        .def_static("from_arrays", &Laminate::from_arrays,
                    py::arg("angles"), py::arg("E1"), py::arg("E2"),
                    py::arg("nu12"), py::arg("G12"), py::arg("thicknesses"),
                    "Build a laminate from equal-length per-ply arrays")
        .def_static("from_angles", &Laminate::from_angles,
                    py::arg("angles"), py::arg("thicknesses"),
                    py::arg("E1"), py::arg("E2"), py::arg("nu12"), py::arg("G12"),
                    "Build a single-material laminate")
        .def("add_ply", &Laminate::add_ply, py::arg("ply"))
        .def("add_symmetric", &Laminate::add_symmetric, py::arg("half_stack"),
             "Append plies followed by their mirror image")
        .def("num_plies", &Laminate::num_plies)
        .def("ply", &Laminate::ply, py::arg("index"),
             py::return_value_policy::reference_internal)
        .def_property_readonly("plies", &Laminate::plies)
        .def("total_thickness", &Laminate::total_thickness)
        .def("stacking_sequence", &Laminate::stacking_sequence)
        .def("__len__", &Laminate::num_plies)
        .def("__repr__", [](const Laminate& l) {
            return "<Laminate " + l.stacking_sequence() +
                   " h=" + std::to_string(l.total_thickness()) + ">";
        });

    // --- Layup presets ---
    auto presets = m.def_submodule("layup_presets", "Standard stacking sequences");
    presets.def("unidirectional", &layup_presets::unidirectional,
                py::arg("E1"), py::arg("E2"), py::arg("nu12"), py::arg("G12"),
                py::arg("ply_thickness"), py::arg("num_plies"));
    presets.def("cross_ply", &layup_presets::cross_ply,
                py::arg("E1"), py::arg("E2"), py::arg("nu12"), py::arg("G12"),
                py::arg("ply_thickness"), py::arg("repeats") = 1);
    presets.def("angle_ply", &layup_presets::angle_ply,
                py::arg("E1"), py::arg("E2"), py::arg("nu12"), py::arg("G12"),
                py::arg("ply_thickness"), py::arg("angle"), py::arg("repeats") = 1);
    presets.def("quasi_isotropic", &layup_presets::quasi_isotropic,
                py::arg("E1"), py::arg("E2"), py::arg("nu12"), py::arg("G12"),
                py::arg("ply_thickness"));

    // --- CalculatorConfig ---
    py::class_<CalculatorConfig>(m, "CalculatorConfig")
        .def(py::init<>())
        .def_readwrite("singular_tolerance", &CalculatorConfig::singular_tolerance,
                       "Relative pivot threshold for the Q* invertibility test")
        .def_readwrite("parallel_min_plies", &CalculatorConfig::parallel_min_plies,
                       "Minimum ply count for parallel per-ply evaluation");

    // --- EngineeringConstants ---
    py::class_<EngineeringConstants>(m, "EngineeringConstants")
        .def(py::init<>())
        .def_readonly("Ex", &EngineeringConstants::Ex)
        .def_readonly("Ey", &EngineeringConstants::Ey)
        .def_readonly("Gxy", &EngineeringConstants::Gxy)
        .def_readonly("nuxy", &EngineeringConstants::nuxy)
        .def_readonly("nuyx", &EngineeringConstants::nuyx)
        .def("__repr__", [](const EngineeringConstants& ec) {
            return "<EngineeringConstants Ex=" + std::to_string(ec.Ex) +
                   " Ey=" + std::to_string(ec.Ey) +
                   " Gxy=" + std::to_string(ec.Gxy) +
                   " nuxy=" + std::to_string(ec.nuxy) + ">";
        });

    // --- PlyStiffness ---
    py::class_<PlyStiffness>(m, "PlyStiffness")
        .def(py::init<>())
        .def_readonly("index", &PlyStiffness::index)
        .def_readonly("angle", &PlyStiffness::angle)
        .def_readonly("E1", &PlyStiffness::E1)
        .def_readonly("E2", &PlyStiffness::E2)
        .def_readonly("thickness", &PlyStiffness::thickness)
        .def_readonly("Q", &PlyStiffness::Q, "Global-frame reduced stiffness (3x3)");

    // --- LaminateResult ---
    py::class_<LaminateResult>(m, "LaminateResult")
        .def(py::init<>())
        .def_readonly("ply_stiffness", &LaminateResult::ply_stiffness)
        .def_readonly("A", &LaminateResult::A, "Extensional stiffness sum(Q_i*h_i)")
        .def_readonly("Q_avg", &LaminateResult::Q_avg, "Average stiffness A/h")
        .def_readonly("S_avg", &LaminateResult::S_avg, "Average compliance inverse(Q_avg)")
        .def_readonly("total_thickness", &LaminateResult::total_thickness)
        .def_readonly("constants", &LaminateResult::constants)
        .def("is_balanced", &LaminateResult::is_balanced, py::arg("tol") = 1e-10)
        .def("__str__", [](const LaminateResult& r) { return format_result(r); });

    // --- LaminateStiffnessCalculator ---
    py::class_<LaminateStiffnessCalculator>(m, "LaminateStiffnessCalculator")
        .def(py::init<const CalculatorConfig&>(),
             py::arg("config") = CalculatorConfig())
        .def("compute", &LaminateStiffnessCalculator::compute, py::arg("laminate"),
             "Compute A, Q*, S* and engineering constants",
             py::call_guard<py::gil_scoped_release>())
        .def_static("assemble_extensional", &LaminateStiffnessCalculator::assemble_extensional,
                    py::arg("plies"))
        .def_static("average_compliance", &LaminateStiffnessCalculator::average_compliance,
                    py::arg("Q_avg"), py::arg("tolerance") = 1e-12)
        .def_static("engineering_constants", &LaminateStiffnessCalculator::engineering_constants,
                    py::arg("S"));

    m.def("compute_laminate_stiffness", &compute_laminate_stiffness,
          py::arg("laminate"), py::arg("config") = CalculatorConfig(),
          "Compute laminate stiffness with the given configuration");
    m.def("format_result", &format_result, py::arg("result"), py::arg("precision") = 8,
          "Format a laminate result as text");
}
