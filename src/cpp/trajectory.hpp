/*
trajectory.hpp:
    Snapshots assembled from a parsed OUTCAR and their export to XDATCAR,
    POSCAR and XCrySDen XSF files.

structs:
    Trajectory: one Structure per ionic step, with the forces of that step
    Vibrations: equilibrium Structure plus the vibrational modes

functions:
    index_transform: resolve user step/mode selections to 1-based indices
    write_xsf: render a structure with one vector per atom in XSF
*/
#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "basic.hpp"
#include "outcar.hpp"
#include "poscar.hpp"

struct Trajectory {
    std::vector<Structure> frames;
    std::vector<Coords> forces;

    /**
     * @brief One frame per ionic step: the step cell with scale 1, the step
     * positions and, when merged into the OUTCAR, its constraints.
     * @throws GeometryError if a step cell is singular.
     */
    static Trajectory from_outcar(const Outcar& outcar);

    size_t size() const { return frames.size(); }

    /**
     * @brief Renders all frames as an XDATCAR: one header taken from the
     * first frame, then one "Direct configuration=" block per frame.
     * @throws ConsistencyError if the trajectory is empty.
     */
    void write_xdatcar(std::ostream& os) const;

    /* writes dir/XDATCAR; nothing is created for an empty trajectory */
    void save_as_xdatcar(const std::string& dir) const;

    /**
     * @brief Writes step i (1-based) to dir/POSCAR_<i>.vasp.
     * @throws RangeError if i is outside 1..size().
     */
    void save_as_poscar(int i, const std::string& dir, const PoscarFormat& fmt = PoscarFormat()) const;

    /* writes step i (1-based) with its forces to dir/step_<i>.xsf */
    void save_as_xsf(int i, const std::string& dir) const;
};

struct Vibrations {
    Structure structure;
    std::vector<Vibration> modes;

    /**
     * @brief Equilibrium structure from the header cell and the positions of
     * the first ionic step.
     * @throws FormatError if the OUTCAR holds no vibrational modes or no ionic step.
     */
    static Vibrations from_outcar(const Outcar& outcar);

    size_t size() const { return modes.size(); }

    /**
     * @brief Writes mode i (1-based) with its displacements to dir/mode_<i>.xsf.
     * @throws RangeError if i is outside 1..size().
     */
    void save_as_xsf(int i, const std::string& dir) const;
};

/**
 * @brief XSF crystal block of s with vectors as the per-atom field
 * ("<symbol> x y z vx vy vz"). comment, if not empty, is written first as a '#' line.
 */
void write_xsf(std::ostream& os, const Structure& s, const Coords& vectors, const std::string& comment = "");

/**
 * @brief Resolves a selection against len items.
 * A 0 anywhere selects 1..len; a negative i selects len + i + 1.
 * @throws RangeError if a resolved index is outside 1..len.
 */
std::vector<int> index_transform(const std::vector<int>& indices, int len);
