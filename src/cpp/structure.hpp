/*
structure.hpp:
    Operations on Structure that depend on the species block layout:
    atom i belongs to the species whose cumulative count first exceeds i.

functions:
    species_offsets: first atom index of each species block
    species_of: species index of one atom
    atom_symbols: species label of every atom, in order
    from_cartesian / from_fractional: build a consistent Structure
    split: divide a Structure into selected atoms and their complement
    sort_by_axes: stable intra-species sort by a composite axis key
*/
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "basic.hpp"

/* species_offsets(s)[k] is the index of the first atom of species k, the last entry is natoms */
std::vector<int> species_offsets(const Structure& s);

int species_of(const Structure& s, int atom);

std::vector<std::string> atom_symbols(const Structure& s);

/**
 * @brief Assembles a Structure whose cartesian coordinates are authoritative.
 * Fractional coordinates are derived through scale * cell.
 * @throws GeometryError if the cell is singular.
 * @throws ConsistencyError if the species counts do not add up to the number of rows.
 */
Structure from_cartesian(const Lattice& cell, double scale,
                         std::vector<std::string> ion_types, std::vector<int> ions_per_type,
                         const Coords& car_pos, std::optional<Constraints> constraints = std::nullopt);

/* as from_cartesian, with fractional coordinates authoritative */
Structure from_fractional(const Lattice& cell, double scale,
                          std::vector<std::string> ion_types, std::vector<int> ions_per_type,
                          const Coords& frac_pos, std::optional<Constraints> constraints = std::nullopt);

/* checks sum(ions_per_type) == natoms, no negative count and the sizes of every per-atom field */
void check_consistency(const Structure& s);

/**
 * @brief Splits s into (selected atoms, remaining atoms).
 * Indices are zero-based, deduplicated and sorted before use so both halves
 * keep the species block order. Species left without atoms are dropped.
 * @throws RangeError if an index is out of range.
 * @throws ConsistencyError if s is inconsistent or either half would be empty.
 */
std::pair<Structure, Structure> split(const Structure& s, std::vector<int> indices);

/**
 * @brief Reorders atoms inside each species block.
 * key is a non-empty string over "ABC" (fractional axes) and "XYZ"
 * (cartesian axes), case-insensitive, highest priority first, e.g. "zA".
 * Block boundaries and species order never change; sorting an already
 * sorted structure with the same key is a no-op.
 * @throws FormatError on an unknown axis character.
 * @throws ConsistencyError if s is inconsistent, see check_consistency.
 */
Structure sort_by_axes(const Structure& s, std::string_view key);
