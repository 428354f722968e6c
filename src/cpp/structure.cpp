#include "structure.hpp"
#include "cell.hpp"
#include "errors.hpp"
#include <algorithm>
#include <numeric>
#include <cctype>

std::vector<int> species_offsets(const Structure& s) {
    std::vector<int> offsets(s.ions_per_type.size() + 1, 0);
    std::partial_sum(s.ions_per_type.begin(), s.ions_per_type.end(), offsets.begin() + 1);
    return offsets;
}

int species_of(const Structure& s, int atom) {
    if (atom < 0 || atom >= s.natoms()) {
        throw RangeError("atom index " + std::to_string(atom) + " is out of range (natoms = "
                         + std::to_string(s.natoms()) + ")");
    }
    std::vector<int> offsets = species_offsets(s);
    auto it = std::upper_bound(offsets.begin() + 1, offsets.end(), atom);
    return static_cast<int>(it - offsets.begin()) - 1;
}

std::vector<std::string> atom_symbols(const Structure& s) {
    std::vector<std::string> symbols;
    symbols.reserve(s.natoms());
    for (size_t k = 0; k < s.ion_types.size(); ++k) {
        for (int i = 0; i < s.ions_per_type[k]; ++i) {
            symbols.push_back(s.ion_types[k]);
        }
    }
    return symbols;
}

void check_consistency(const Structure& s) {
    if (s.ion_types.size() != s.ions_per_type.size()) {
        throw ConsistencyError("species labels (" + std::to_string(s.ion_types.size())
                               + ") and species counts (" + std::to_string(s.ions_per_type.size())
                               + ") differ in length");
    }
    for (size_t k = 0; k < s.ions_per_type.size(); ++k) {
        if (s.ions_per_type[k] < 0) {
            throw ConsistencyError("species " + std::to_string(k + 1) + " has a negative count ("
                                   + std::to_string(s.ions_per_type[k]) + ")");
        }
    }
    const int total = std::accumulate(s.ions_per_type.begin(), s.ions_per_type.end(), 0);
    if (total != s.natoms()) {
        throw ConsistencyError("count mismatch: species counts add up to " + std::to_string(total)
                               + " but there are " + std::to_string(s.natoms()) + " atoms");
    }
    if (s.frac_pos.rows() != s.car_pos.rows()) {
        throw ConsistencyError("cartesian and fractional coordinates differ in length");
    }
    if (s.constraints && static_cast<int>(s.constraints->size()) != s.natoms()) {
        throw ConsistencyError("constraints cover " + std::to_string(s.constraints->size())
                               + " atoms but there are " + std::to_string(s.natoms()));
    }
}

Structure from_cartesian(const Lattice& cell, double scale,
                         std::vector<std::string> ion_types, std::vector<int> ions_per_type,
                         const Coords& car_pos, std::optional<Constraints> constraints) {
    Structure s;
    s.cell = cell;
    s.scale = scale;
    s.ion_types = std::move(ion_types);
    s.ions_per_type = std::move(ions_per_type);
    s.car_pos = car_pos;
    s.frac_pos = cart_to_frac(car_pos, s.lattice());
    s.constraints = std::move(constraints);
    check_consistency(s);
    return s;
}

Structure from_fractional(const Lattice& cell, double scale,
                          std::vector<std::string> ion_types, std::vector<int> ions_per_type,
                          const Coords& frac_pos, std::optional<Constraints> constraints) {
    Structure s;
    s.cell = cell;
    s.scale = scale;
    s.ion_types = std::move(ion_types);
    s.ions_per_type = std::move(ions_per_type);
    s.frac_pos = frac_pos;
    s.car_pos = frac_to_cart(frac_pos, s.lattice());
    s.constraints = std::move(constraints);
    check_consistency(s);
    return s;
}

// ----------------------------------------------------------------------------
// Split
// ----------------------------------------------------------------------------

/* copy the listed atoms, recounting species and dropping the empty ones */
static Structure take_atoms(const Structure& s, const std::vector<int>& atoms) {
    const std::vector<int> offsets = species_offsets(s);
    std::vector<int> counts(s.ions_per_type.size(), 0);

    Structure out;
    out.cell = s.cell;
    out.scale = s.scale;
    out.car_pos.resize(atoms.size(), 3);
    out.frac_pos.resize(atoms.size(), 3);
    if (s.constraints) {
        out.constraints = Constraints();
        out.constraints->reserve(atoms.size());
    }

    for (size_t i = 0; i < atoms.size(); ++i) {
        const int atom = atoms[i];
        auto it = std::upper_bound(offsets.begin() + 1, offsets.end(), atom);
        counts[it - offsets.begin() - 1] += 1;
        out.car_pos.row(i) = s.car_pos.row(atom);
        out.frac_pos.row(i) = s.frac_pos.row(atom);
        if (s.constraints) {
            out.constraints->push_back((*s.constraints)[atom]);
        }
    }

    for (size_t k = 0; k < counts.size(); ++k) {
        if (counts[k] > 0) {
            out.ion_types.push_back(s.ion_types[k]);
            out.ions_per_type.push_back(counts[k]);
        }
    }
    return out;
}

std::pair<Structure, Structure> split(const Structure& s, std::vector<int> indices) {
    check_consistency(s);
    const int natoms = s.natoms();
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    for (int i : indices) {
        if (i < 0 || i >= natoms) {
            throw RangeError("atom index " + std::to_string(i + 1) + " is out of range (natoms = "
                             + std::to_string(natoms) + ")");
        }
    }
    if (indices.empty()) {
        throw ConsistencyError("no atoms selected, the first half of the split would be empty");
    }
    if (static_cast<int>(indices.size()) == natoms) {
        throw ConsistencyError("all atoms selected, the second half of the split would be empty");
    }

    std::vector<int> complement;
    complement.reserve(natoms - indices.size());
    for (int i = 0, j = 0; i < natoms; ++i) {
        if (j < static_cast<int>(indices.size()) && indices[j] == i) {
            ++j;
        } else {
            complement.push_back(i);
        }
    }

    return {take_atoms(s, indices), take_atoms(s, complement)};
}

// ----------------------------------------------------------------------------
// Sort
// ----------------------------------------------------------------------------

struct AxisKey {
    bool fractional;
    int axis;
};

static std::vector<AxisKey> parse_axis_key(std::string_view key) {
    if (key.empty()) {
        throw FormatError("empty sort key, expected characters from 'ABC' or 'XYZ'");
    }
    std::vector<AxisKey> axes;
    for (char c : key) {
        switch (std::toupper(static_cast<unsigned char>(c))) {
            case 'A': axes.push_back({true, 0}); break;
            case 'B': axes.push_back({true, 1}); break;
            case 'C': axes.push_back({true, 2}); break;
            case 'X': axes.push_back({false, 0}); break;
            case 'Y': axes.push_back({false, 1}); break;
            case 'Z': axes.push_back({false, 2}); break;
            default:
                throw FormatError(std::string("unrecognized sort axis '") + c + "', expected one of ABCXYZ");
        }
    }
    return axes;
}

Structure sort_by_axes(const Structure& s, std::string_view key) {
    check_consistency(s);
    const std::vector<AxisKey> axes = parse_axis_key(key);
    const std::vector<int> offsets = species_offsets(s);

    std::vector<int> order(s.natoms());
    std::iota(order.begin(), order.end(), 0);

    auto less = [&s, &axes](int i, int j) {
        for (const AxisKey& k : axes) {
            const Coords& pos = k.fractional ? s.frac_pos : s.car_pos;
            const double a = pos(i, k.axis);
            const double b = pos(j, k.axis);
            if (a < b) return true;
            if (b < a) return false;
        }
        return false;
    };

    for (size_t k = 0; k + 1 < offsets.size(); ++k) {
        std::stable_sort(order.begin() + offsets[k], order.begin() + offsets[k + 1], less);
    }

    Structure sorted = s;
    for (int i = 0; i < s.natoms(); ++i) {
        sorted.car_pos.row(i) = s.car_pos.row(order[i]);
        sorted.frac_pos.row(i) = s.frac_pos.row(order[i]);
        if (s.constraints) {
            (*sorted.constraints)[i] = (*s.constraints)[order[i]];
        }
    }
    return sorted;
}
