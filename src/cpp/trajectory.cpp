#include "trajectory.hpp"
#include "errors.hpp"
#include "structure.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

// ---- helpers ----

static std::string numbered_path(const std::string& dir, const char* pattern, int i) {
    char name[64];
    std::snprintf(name, sizeof(name), pattern, i);
    return (std::filesystem::path(dir) / name).string();
}

static std::ofstream open_output(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename + " for writing");
    }
    return file;
}

static void check_written(const std::ofstream& file, const std::string& filename) {
    if (!file) {
        throw std::runtime_error("Error occurred while writing " + filename);
    }
}

static void check_index(int i, size_t len, const char* what) {
    if (i < 1 || static_cast<size_t>(i) > len) {
        throw RangeError(std::string(what) + " index " + std::to_string(i) + " is out of range 1.."
                         + std::to_string(len));
    }
}

std::vector<int> index_transform(const std::vector<int>& indices, int len) {
    std::vector<int> out;
    for (int i : indices) {
        if (i == 0) {
            out.resize(len);
            for (int k = 0; k < len; ++k) out[k] = k + 1;
            return out;
        }
    }
    out.reserve(indices.size());
    for (int i : indices) {
        int resolved = i < 0 ? len + i + 1 : i;
        if (resolved < 1 || resolved > len) {
            throw RangeError("index " + std::to_string(i) + " is out of range for " + std::to_string(len) + " items");
        }
        out.push_back(resolved);
    }
    return out;
}

// ---- XSF ----

void write_xsf(std::ostream& out, const Structure& s, const Coords& vectors, const std::string& comment) {
    if (vectors.rows() != s.natoms()) {
        throw ConsistencyError("XSF vector field has " + std::to_string(vectors.rows()) + " rows but there are "
                               + std::to_string(s.natoms()) + " atoms");
    }
    const Lattice lattice = s.lattice();
    const std::vector<std::string> symbols = atom_symbols(s);

    std::ostringstream os;
    if (!comment.empty()) {
        os << "# " << comment << '\n';
    }
    os << std::fixed << std::setprecision(10);
    os << "CRYSTAL\n";
    os << "PRIMVEC\n";
    for (int i = 0; i < 3; ++i) {
        os << ' ' << std::setw(16) << lattice(i, 0) << ' ' << std::setw(16) << lattice(i, 1)
           << ' ' << std::setw(16) << lattice(i, 2) << '\n';
    }
    os << "PRIMCOORD\n";
    os << s.natoms() << " 1\n";
    for (int i = 0; i < s.natoms(); ++i) {
        os << std::setw(3) << symbols[i];
        for (int j = 0; j < 3; ++j) os << ' ' << std::setw(16) << s.car_pos(i, j);
        for (int j = 0; j < 3; ++j) os << ' ' << std::setw(16) << vectors(i, j);
        os << '\n';
    }
    out << os.str();
}

// ---- Trajectory ----

Trajectory Trajectory::from_outcar(const Outcar& outcar) {
    Trajectory traj;
    traj.frames.reserve(outcar.ion_iters.size());
    traj.forces.reserve(outcar.ion_iters.size());
    for (const IonicIteration& it : outcar.ion_iters) {
        traj.frames.push_back(from_cartesian(it.cell, 1.0, outcar.ion_types, outcar.ions_per_type,
                                             it.positions, outcar.constraints));
        traj.forces.push_back(it.forces);
    }
    return traj;
}

static void write_xdatcar_header(std::ostream& os, const Structure& s) {
    os << "Generated by outcarkit\n";
    os << "           1\n";
    os << std::fixed << std::setprecision(6);
    const Lattice lattice = s.lattice();
    for (int i = 0; i < 3; ++i) {
        os << ' ' << std::setw(12) << lattice(i, 0) << std::setw(12) << lattice(i, 1)
           << std::setw(12) << lattice(i, 2) << '\n';
    }
    for (const std::string& t : s.ion_types) os << std::setw(5) << t;
    os << '\n';
    for (int n : s.ions_per_type) os << std::setw(5) << n;
    os << '\n';
}

void Trajectory::write_xdatcar(std::ostream& out) const {
    if (frames.empty()) {
        throw ConsistencyError("cannot write an XDATCAR of an empty trajectory");
    }
    std::ostringstream os;
    write_xdatcar_header(os, frames.front());
    for (size_t k = 0; k < frames.size(); ++k) {
        const Structure& s = frames[k];
        os << "Direct configuration=" << std::setw(6) << (k + 1) << '\n';
        os << std::fixed << std::setprecision(8);
        for (int i = 0; i < s.natoms(); ++i) {
            os << ' ' << std::setw(12) << s.frac_pos(i, 0) << std::setw(12) << s.frac_pos(i, 1)
               << std::setw(12) << s.frac_pos(i, 2) << '\n';
        }
    }
    out << os.str();
}

void Trajectory::save_as_xdatcar(const std::string& dir) const {
    std::ostringstream text;
    write_xdatcar(text);

    const std::string filename = (std::filesystem::path(dir) / "XDATCAR").string();
    std::ofstream file = open_output(filename);
    file << text.str();
    check_written(file, filename);
}

void Trajectory::save_as_poscar(int i, const std::string& dir, const PoscarFormat& fmt) const {
    check_index(i, frames.size(), "step");
    const std::string filename = numbered_path(dir, "POSCAR_%05d.vasp", i);
    Poscar poscar{"Generated by outcarkit, ionic step " + std::to_string(i), frames[i - 1]};
    save_poscar(filename, poscar, fmt);
}

void Trajectory::save_as_xsf(int i, const std::string& dir) const {
    check_index(i, frames.size(), "step");
    std::ostringstream text;
    write_xsf(text, frames[i - 1], forces[i - 1]);

    const std::string filename = numbered_path(dir, "step_%05d.xsf", i);
    std::ofstream file = open_output(filename);
    file << text.str();
    check_written(file, filename);
}

// ---- Vibrations ----

Vibrations Vibrations::from_outcar(const Outcar& outcar) {
    if (!outcar.vib) {
        throw FormatError("OUTCAR contains no vibrational modes");
    }
    if (outcar.ion_iters.empty()) {
        throw FormatError("OUTCAR contains no ionic step to take the equilibrium positions from");
    }
    Vibrations vibs;
    vibs.structure = from_cartesian(outcar.cell, 1.0, outcar.ion_types, outcar.ions_per_type,
                                    outcar.ion_iters.front().positions, outcar.constraints);
    vibs.modes = *outcar.vib;
    return vibs;
}

void Vibrations::save_as_xsf(int i, const std::string& dir) const {
    check_index(i, modes.size(), "mode");
    const Vibration& mode = modes[i - 1];
    std::ostringstream comment;
    comment << "mode " << i << ": " << std::fixed << std::setprecision(6) << mode.freq << " cm-1"
            << (mode.is_imagine ? ", imaginary" : "");

    std::ostringstream text;
    write_xsf(text, structure, mode.dxdydz, comment.str());

    const std::string filename = numbered_path(dir, "mode_%04d.xsf", i);
    std::ofstream file = open_output(filename);
    file << text.str();
    check_written(file, filename);
}
