/*
basic.hpp:
    Core data types shared by the POSCAR parser, the OUTCAR extraction
    engine and the trajectory writers.

structs:
    Structure: one crystallographic snapshot (cell, species, positions, constraints)
    IonicIteration: one relaxation/MD step parsed from OUTCAR
    Vibration: one vibrational mode parsed from OUTCAR
*/
#pragma once

#include <vector>
#include <string>
#include <array>
#include <optional>
#include <Eigen/Dense>

using Lattice = Eigen::Matrix3d;      // rows are lattice vectors
using Coords = Eigen::MatrixX3d;      // one row per atom
using Constraints = std::vector<std::array<bool, 3>>;   // true = axis may move (POSCAR 'T')

struct Structure
{
    Lattice cell = Lattice::Zero();     // unscaled lattice, as written in POSCAR
    double scale = 1.0;
    std::vector<std::string> ion_types;
    std::vector<int> ions_per_type;
    Coords car_pos;                     // cartesian, already multiplied by scale
    Coords frac_pos;
    std::optional<Constraints> constraints;

    Lattice lattice() const { return scale * cell; }
    int natoms() const { return static_cast<int>(car_pos.rows()); }
};

struct IonicIteration
{
    int nscf = 0;
    double toten = 0.0;                 // free energy TOTEN
    double toten_z = 0.0;               // energy(sigma->0)
    double cputime = 0.0;               // real time of LOOP+, in seconds
    double stress = 0.0;                // external pressure, in kB
    // absent for ISPIN = 1, one value for collinear spin, three for non-collinear runs
    std::optional<std::vector<double>> magmom;
    Coords positions;
    Coords forces;
    Lattice cell = Lattice::Zero();
};

struct Vibration
{
    double freq = 0.0;                  // in cm-1
    bool is_imagine = false;
    Coords dxdydz;                      // already divided by sqrt(mass)
};
