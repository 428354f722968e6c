/*
format.hpp:
    Plain-text summaries of a parsed OUTCAR.

structs:
    RelaxFormat: column switches of the relaxation progress table

functions:
    write_relax_table / format_relax_table: one line per ionic step
    write_vib_list / format_vib_list: one line per vibrational mode
    force_norms: |F| of every atom with frozen components masked
*/
#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "basic.hpp"
#include "outcar.hpp"

/**
 * @brief Columns of the relaxation table, in printing order after the step number.
 * Defaults print TOTEN_z, log10|dE|, max force, nscf, time and magmom.
 */
struct RelaxFormat {
    bool print_energy = false;      // TOTEN, eV
    bool print_energyz = true;      // energy(sigma->0), eV
    bool print_log10de = true;      // log10 of |dE| between consecutive TOTEN_z
    bool print_favg = false;        // average |F|, eV/A
    bool print_fmax = true;         // largest |F|, eV/A
    bool print_fmax_axis = false;   // X, Y or Z: largest component of the atom with largest |F|
    bool print_fmax_index = false;  // that atom, 1-based
    bool print_nscf = true;
    bool print_time_usage = true;   // minutes
    bool print_volume = false;      // A^3
    bool print_magmom = true;       // "NoMag" when absent
};

/* row norms of forces; components whose constraint flag is false count as zero */
std::vector<double> force_norms(const Coords& forces, const std::optional<Constraints>& constraints);

void write_relax_table(std::ostream& os, const Outcar& outcar, const RelaxFormat& fmt = RelaxFormat());
std::string format_relax_table(const Outcar& outcar, const RelaxFormat& fmt = RelaxFormat());

/* "<index> <freq> cm-1" per mode, imaginary ones tagged with "f/i" */
void write_vib_list(std::ostream& os, const std::vector<Vibration>& modes);
std::string format_vib_list(const std::vector<Vibration>& modes);
