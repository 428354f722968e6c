/*
poscar.hpp:
    Reader and writer of the VASP lattice-description file (POSCAR / CONTCAR).

structs:
    Poscar: comment line plus the Structure it describes
    PoscarFormat: writer options

functions:
    parse_poscar: parse POSCAR text
    read_poscar: parse a POSCAR file
    write_poscar: render to a stream
    format_poscar: render to a string
    save_poscar: render to a file
*/
#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include "basic.hpp"

struct Poscar {
    std::string comment;
    Structure structure;
};

/**
 * @brief Options of write_poscar. Defaults write fractional coordinates,
 * keep the selective dynamics flags and tag every line with its atom.
 */
struct PoscarFormat {
    bool fraction_coordinates = true;   // "Direct" when true, "Cartesian" otherwise
    bool preserve_constraints = true;   // write "Selective Dynamics" and T/F flags when present
    bool add_symbol_tags = true;        // append "! <label>-<index in species>  <atom index>"
};

/**
 * @brief Parses POSCAR text.
 * @throws FormatError on a missing or malformed section (invalid scale, incomplete cell,
 *         unrecognized coordinate type, ...).
 * @throws ParseError on a token that is not a number or a T/F flag.
 * @throws ConsistencyError if the number of atom lines differs from the species counts.
 * @throws GeometryError if the cell is singular.
 */
Poscar parse_poscar(std::string_view text);

/* parse_poscar on the content of filename, std::runtime_error if it cannot be read */
Poscar read_poscar(const std::string& filename);

/**
 * @brief Renders a POSCAR. The caller's stream formatting is left untouched.
 * @throws ConsistencyError if the structure breaks an invariant, see check_consistency.
 */
void write_poscar(std::ostream& os, const Poscar& poscar, const PoscarFormat& fmt = PoscarFormat());

std::string format_poscar(const Poscar& poscar, const PoscarFormat& fmt = PoscarFormat());

void save_poscar(const std::string& filename, const Poscar& poscar, const PoscarFormat& fmt = PoscarFormat());
