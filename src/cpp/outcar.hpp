/*
outcar.hpp:
    Extraction of the structure/trajectory model from a VASP OUTCAR.

    Every field is located by its own marker search over the same immutable
    text, the searches run concurrently, and the per-step fields are then
    checked for equal length and zipped into IonicIteration records.

structs:
    Outcar: global scalars, ionic steps and (optionally) vibrational modes

functions:
    parse_outcar: parse OUTCAR text
    read_outcar: parse an OUTCAR file through a memory map
    parse_*: the individual field extractors, exposed for testing
*/
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "basic.hpp"

struct Outcar {
    bool lsorbit = false;
    int ispin = 0;
    int ibrion = 0;
    int nions = 0;
    int nkpts = 0;
    int nbands = 0;
    double efermi = 0.0;
    Lattice cell = Lattice::Zero();         // lattice printed in the header
    std::vector<std::string> ion_types;
    std::vector<int> ions_per_type;
    std::vector<double> ion_masses;         // one entry per atom
    std::vector<IonicIteration> ion_iters;
    std::optional<std::vector<Vibration>> vib;
    std::optional<Constraints> constraints; // merged from a POSCAR, see set_constraints

    /**
     * @brief Attaches selective dynamics flags read from a POSCAR.
     * @throws ConsistencyError if the flags do not cover exactly nions atoms.
     */
    void set_constraints(Constraints c);
};

/**
 * @brief Parses the whole OUTCAR text.
 * @throws FormatError if a required marker is absent or a block is malformed.
 * @throws ParseError if a token cannot be converted.
 * @throws ConsistencyError if the per-step fields disagree in length or in atom count.
 */
Outcar parse_outcar(std::string_view text);

/* parse_outcar on a memory-mapped file, std::runtime_error if mapping fails */
Outcar read_outcar(const std::string& filename);

// ----------------------------------------------------------------------------
// Global scalars, taken from the first occurrence of their marker
// ----------------------------------------------------------------------------
int parse_ispin(std::string_view text);
bool parse_lsorbit(std::string_view text);
int parse_ibrion(std::string_view text);
int parse_nions(std::string_view text);
std::pair<int, int> parse_nkpts_nbands(std::string_view text);
double parse_efermi(std::string_view text);
Lattice parse_cell(std::string_view text);
/* FormatError on a missing line or a count <= 0 */
std::vector<int> parse_ions_per_type(std::string_view text);

/* species labels from the POTCAR lines; the second half of them repeats the first */
std::vector<std::string> parse_ion_types(std::string_view text);

/* one mass per species, from the "POMASS = ...; ZVAL" lines */
std::vector<double> parse_masses_per_type(std::string_view text);

// ----------------------------------------------------------------------------
// Per-step fields, one entry per ionic step
// ----------------------------------------------------------------------------
std::vector<double> parse_toten(std::string_view text);
std::vector<double> parse_toten_z(std::string_view text);
std::vector<double> parse_cputime(std::string_view text);
std::vector<double> parse_stress(std::string_view text);

/* innermost counter of the last "Iteration N( M)" before each step trailer */
std::vector<int> parse_nscfs(std::string_view text);

/* the "magnetization" values of the last "number of electron" line before each step trailer */
std::vector<std::optional<std::vector<double>>> parse_magmoms(std::string_view text);

/* position and force tables of every " POSITION ... TOTAL-FORCE" block */
std::pair<std::vector<Coords>, std::vector<Coords>> parse_posforce(std::string_view text);

/* positions and forces of one block; text starts at the " POSITION" header */
std::pair<Coords, Coords> parse_posforce_single_iteration(std::string_view text);

/* lattices printed after each ionic step (every "direct lattice vectors" but the first) */
std::vector<Lattice> parse_opt_cells(std::string_view text);

// ----------------------------------------------------------------------------
// Vibrations
// ----------------------------------------------------------------------------

/* std::nullopt when no "Degrees of freedom DOF" line exists */
std::optional<int> parse_dof(std::string_view text);

/**
 * @brief Frequencies and raw displacement tables of the first dof mode headers
 * in document order. Displacements are not yet divided by sqrt(mass).
 * @return std::nullopt when the log has no vibrational analysis.
 */
std::optional<std::vector<Vibration>> parse_vibrations(std::string_view text);

/* one mode; text starts at its header line */
Vibration parse_single_vibmode(std::string_view text);

/**
 * @brief Divides every displacement row by sqrt of the mass of its atom.
 * @throws ConsistencyError if a mode has a different number of rows than masses.
 */
void apply_mass_weights(std::vector<Vibration>& modes, const std::vector<double>& ion_masses);
