#include <pybind11/pybind11.h>
#include <pybind11/stl.h>       // std::vector, std::optional, std::array
#include <pybind11/eigen.h>     // Lattice / Coords <-> NumPy
#include "errors.hpp"
#include "format.hpp"
#include "outcar.hpp"
#include "poscar.hpp"
#include "reader.hpp"
#include "structure.hpp"
#include "trajectory.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_outcarkit, m) {
    m.doc() = "C++17 bindings for outcarkit: VASP OUTCAR/POSCAR parsing and trajectory export";

    // -----------------------------------------------------------------------
    // Exceptions
    // -----------------------------------------------------------------------
    py::register_exception<FormatError>(m, "FormatError", PyExc_ValueError);
    py::register_exception<ParseError>(m, "ParseError", PyExc_ValueError);
    py::register_exception<ConsistencyError>(m, "ConsistencyError", PyExc_ValueError);
    py::register_exception<GeometryError>(m, "GeometryError", PyExc_ValueError);
    py::register_exception<RangeError>(m, "RangeError", PyExc_IndexError);

    // -----------------------------------------------------------------------
    // Records
    // -----------------------------------------------------------------------
    // Eigen members are returned as NumPy copies. Geometry and species are read-only;
    // a changed structure is built through from_cartesian / from_fractional.
    py::class_<Structure>(m, "Structure")
        .def(py::init<>())
        .def_readonly("cell", &Structure::cell, "Unscaled lattice vectors as a (3, 3) array.")
        .def_readonly("scale", &Structure::scale)
        .def_readonly("ion_types", &Structure::ion_types)
        .def_readonly("ions_per_type", &Structure::ions_per_type)
        .def_readonly("car_pos", &Structure::car_pos, "Cartesian positions, (N, 3).")
        .def_readonly("frac_pos", &Structure::frac_pos, "Fractional positions, (N, 3).")
        .def_property("constraints",
            [](const Structure& s) { return s.constraints; },
            [](Structure& s, std::optional<Constraints> c) {
                Structure checked = s;
                checked.constraints = std::move(c);
                check_consistency(checked);
                s.constraints = std::move(checked.constraints);
            },
            "Selective dynamics flags per atom, or None. Must cover every atom.")
        .def_property_readonly("natoms", &Structure::natoms)
        .def("lattice", &Structure::lattice, "scale * cell");

    py::class_<IonicIteration>(m, "IonicIteration")
        .def_readonly("nscf", &IonicIteration::nscf)
        .def_readonly("toten", &IonicIteration::toten)
        .def_readonly("toten_z", &IonicIteration::toten_z)
        .def_readonly("cputime", &IonicIteration::cputime)
        .def_readonly("stress", &IonicIteration::stress)
        .def_readonly("magmom", &IonicIteration::magmom)
        .def_readonly("positions", &IonicIteration::positions)
        .def_readonly("forces", &IonicIteration::forces)
        .def_readonly("cell", &IonicIteration::cell);

    py::class_<Vibration>(m, "Vibration")
        .def_readonly("freq", &Vibration::freq, "Frequency in cm-1.")
        .def_readonly("is_imagine", &Vibration::is_imagine)
        .def_readonly("dxdydz", &Vibration::dxdydz, "Displacements divided by sqrt(mass), (N, 3).");

    py::class_<Outcar>(m, "Outcar")
        .def_readonly("lsorbit", &Outcar::lsorbit)
        .def_readonly("ispin", &Outcar::ispin)
        .def_readonly("ibrion", &Outcar::ibrion)
        .def_readonly("nions", &Outcar::nions)
        .def_readonly("nkpts", &Outcar::nkpts)
        .def_readonly("nbands", &Outcar::nbands)
        .def_readonly("efermi", &Outcar::efermi)
        .def_readonly("cell", &Outcar::cell)
        .def_readonly("ion_types", &Outcar::ion_types)
        .def_readonly("ions_per_type", &Outcar::ions_per_type)
        .def_readonly("ion_masses", &Outcar::ion_masses)
        .def_readonly("ion_iters", &Outcar::ion_iters)
        .def_readonly("vib", &Outcar::vib)
        .def_readonly("constraints", &Outcar::constraints)
        .def("set_constraints", &Outcar::set_constraints, py::arg("constraints"));

    // -----------------------------------------------------------------------
    // OutcarReader
    // -----------------------------------------------------------------------
    py::class_<OutcarReader>(m, "OutcarReader")
        .def(py::init<const std::string&>(),
             py::arg("filename"),
             "Maps the OUTCAR into memory without parsing it.")
        .def("index", &OutcarReader::index,
             py::call_guard<py::gil_scoped_release>(),
             "Parses the mapped OUTCAR.")
        .def("read_frames", &OutcarReader::read_frames,
             py::call_guard<py::gil_scoped_release>(),
             py::arg("indices"),
             "Ionic steps as Structures, by zero-based index.")
        .def("set_constraints", &OutcarReader::set_constraints, py::arg("constraints"))
        .def_property_readonly("outcar", &OutcarReader::outcar, py::return_value_policy::reference_internal)
        .def_property_readonly("n_atoms", &OutcarReader::get_num_atoms)
        .def_property_readonly("n_frames", &OutcarReader::get_num_frames);

    // -----------------------------------------------------------------------
    // Free functions
    // -----------------------------------------------------------------------
    m.def("read_outcar", &read_outcar, py::arg("filename"),
          py::call_guard<py::gil_scoped_release>());

    m.def("from_cartesian", &from_cartesian,
          py::arg("cell"), py::arg("scale"), py::arg("ion_types"), py::arg("ions_per_type"),
          py::arg("car_pos"), py::arg("constraints") = std::nullopt);

    m.def("from_fractional", &from_fractional,
          py::arg("cell"), py::arg("scale"), py::arg("ion_types"), py::arg("ions_per_type"),
          py::arg("frac_pos"), py::arg("constraints") = std::nullopt);

    m.def("read_poscar",
          [](const std::string& filename) { return read_poscar(filename).structure; },
          py::arg("filename"));

    m.def("format_poscar",
          [](const Structure& s, const std::string& comment, bool fraction_coordinates,
             bool preserve_constraints, bool add_symbol_tags) {
              PoscarFormat fmt;
              fmt.fraction_coordinates = fraction_coordinates;
              fmt.preserve_constraints = preserve_constraints;
              fmt.add_symbol_tags = add_symbol_tags;
              return format_poscar(Poscar{comment, s}, fmt);
          },
          py::arg("structure"), py::arg("comment") = "Generated by outcarkit",
          py::arg("fraction_coordinates") = true, py::arg("preserve_constraints") = true,
          py::arg("add_symbol_tags") = true);

    m.def("split", &split, py::arg("structure"), py::arg("indices"),
          "Splits into (selected, remaining); indices are zero-based.");

    m.def("sort_by_axes", &sort_by_axes, py::arg("structure"), py::arg("key"));

    m.def("relax_table",
          [](const Outcar& outcar) { return format_relax_table(outcar); },
          py::arg("outcar"));
}
