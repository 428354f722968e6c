#include "poscar.hpp"
#include "errors.hpp"
#include "scan.hpp"
#include "structure.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

// ----------------------------------------------------------------------------
// Parsing
// ----------------------------------------------------------------------------

static std::string_view require_line(std::string_view& rest, const char* section) {
    std::string_view line;
    if (!next_line(rest, line)) {
        throw FormatError(std::string("POSCAR: file ends before the ") + section);
    }
    return line;
}

static char first_char(std::string_view line) {
    for (char c : line) {
        if (c != ' ' && c != '\t') {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return '\0';
}

static bool parse_flag(std::string_view token, int atom) {
    switch (first_char(token)) {
        case 't': return true;
        case 'f': return false;
        default:
            throw ParseError("POSCAR: invalid selective dynamics flag '" + std::string(token)
                             + "' for atom " + std::to_string(atom));
    }
}

static bool looks_numeric(std::string_view token) {
    char c = token.empty() ? '\0' : token.front();
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.';
}

Poscar parse_poscar(std::string_view text) {
    Poscar poscar;
    std::string_view rest = text;

    // 1. comment
    poscar.comment = std::string(require_line(rest, "comment line"));

    // 2. scale factor
    std::vector<std::string_view> tokens = split_ws(require_line(rest, "scale factor"));
    if (tokens.empty()) {
        throw FormatError("POSCAR: invalid scale, the scale line is empty");
    }
    const double scale = to_double(tokens[0], "scale");
    if (!(scale > 0.0)) {
        throw FormatError("POSCAR: invalid scale " + std::string(tokens[0]) + ", it must be positive");
    }

    // 3. lattice vectors
    Lattice cell;
    for (int i = 0; i < 3; ++i) {
        tokens = split_ws(require_line(rest, "lattice vectors"));
        if (tokens.size() < 3) {
            throw FormatError("POSCAR: incomplete cell, lattice vector " + std::to_string(i + 1)
                              + " has " + std::to_string(tokens.size()) + " values");
        }
        for (int j = 0; j < 3; ++j) {
            cell(i, j) = to_double(tokens[j], "lattice vector " + std::to_string(i + 1));
        }
    }

    // 4. species labels and counts
    tokens = split_ws(require_line(rest, "species labels"));
    if (tokens.empty() || looks_numeric(tokens[0])) {
        throw FormatError("POSCAR: species labels are missing on line 6");
    }
    std::vector<std::string> ion_types(tokens.begin(), tokens.end());

    tokens = split_ws(require_line(rest, "species counts"));
    std::vector<int> ions_per_type;
    for (std::string_view token : tokens) {
        int count = to_int(token, "species count");
        if (count <= 0) {
            throw FormatError("POSCAR: species count " + std::string(token) + " must be positive");
        }
        ions_per_type.push_back(count);
    }
    if (ions_per_type.size() != ion_types.size()) {
        throw FormatError("POSCAR: " + std::to_string(ion_types.size()) + " species labels but "
                          + std::to_string(ions_per_type.size()) + " species counts");
    }

    // 5. optional selective dynamics, then the coordinate system
    std::string_view line = require_line(rest, "coordinate type");
    const bool selective = first_char(line) == 's';
    if (selective) {
        line = require_line(rest, "coordinate type");
    }
    bool fractional = false;
    switch (first_char(line)) {
        case 'd': fractional = true; break;
        case 'c':
        case 'k': fractional = false; break;
        default:
            throw FormatError("POSCAR: unrecognized coordinate type '" + std::string(line) + "'");
    }

    // 6. one line per atom until a blank line or the end of input
    std::vector<std::array<double, 3>> rows;
    Constraints constraints;
    while (next_line(rest, line) && !is_blank(line)) {
        const int atom = static_cast<int>(rows.size()) + 1;
        tokens = split_ws(line);
        if (tokens.size() < 3) {
            throw FormatError("POSCAR: atom " + std::to_string(atom) + " has fewer than 3 coordinates");
        }
        const std::string field = "coordinates of atom " + std::to_string(atom);
        rows.push_back({to_double(tokens[0], field), to_double(tokens[1], field), to_double(tokens[2], field)});

        if (selective) {
            if (tokens.size() < 6) {
                throw FormatError("POSCAR: atom " + std::to_string(atom) + " lacks selective dynamics flags");
            }
            constraints.push_back({parse_flag(tokens[3], atom), parse_flag(tokens[4], atom), parse_flag(tokens[5], atom)});
        }
    }

    int expected = 0;
    for (int n : ions_per_type) expected += n;
    if (static_cast<int>(rows.size()) != expected) {
        throw ConsistencyError("POSCAR: count mismatch, species counts add up to " + std::to_string(expected)
                               + " but " + std::to_string(rows.size()) + " atom lines were found");
    }

    Coords coords(rows.size(), 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        coords.row(i) << rows[i][0], rows[i][1], rows[i][2];
    }

    std::optional<Constraints> constr;
    if (selective) {
        constr = std::move(constraints);
    }

    if (fractional) {
        poscar.structure = from_fractional(cell, scale, std::move(ion_types), std::move(ions_per_type),
                                           coords, std::move(constr));
    } else {
        poscar.structure = from_cartesian(cell, scale, std::move(ion_types), std::move(ions_per_type),
                                          coords * scale, std::move(constr));
    }
    return poscar;
}

Poscar read_poscar(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_poscar(buffer.str());
}

// ----------------------------------------------------------------------------
// Formatting
// ----------------------------------------------------------------------------

std::string format_poscar(const Poscar& poscar, const PoscarFormat& fmt) {
    const Structure& s = poscar.structure;
    check_consistency(s);
    std::ostringstream os;
    const bool write_constraints = fmt.preserve_constraints && s.constraints.has_value();

    os << poscar.comment << '\n';
    os << std::fixed << std::setprecision(8) << "  " << s.scale << '\n';

    os << std::setprecision(9);
    for (int i = 0; i < 3; ++i) {
        os << "  " << std::setw(15) << s.cell(i, 0)
           << "  " << std::setw(15) << s.cell(i, 1)
           << "  " << std::setw(15) << s.cell(i, 2) << '\n';
    }

    for (const std::string& t : s.ion_types) {
        os << ' ' << std::setw(6) << t;
    }
    os << '\n';
    for (int n : s.ions_per_type) {
        os << ' ' << std::setw(6) << n;
    }
    os << '\n';

    if (write_constraints) {
        os << "Selective Dynamics\n";
    }
    os << (fmt.fraction_coordinates ? "Direct" : "Cartesian") << '\n';

    const Coords pos = fmt.fraction_coordinates ? s.frac_pos : Coords(s.car_pos / s.scale);
    const std::vector<int> offsets = species_offsets(s);

    os << std::setprecision(10);
    size_t species = 0;
    for (int i = 0; i < pos.rows(); ++i) {
        while (species + 1 < offsets.size() && i >= offsets[species + 1]) {
            ++species;
        }
        os << "  " << std::setw(16) << pos(i, 0)
           << "  " << std::setw(16) << pos(i, 1)
           << "  " << std::setw(16) << pos(i, 2);

        if (write_constraints) {
            const std::array<bool, 3>& c = (*s.constraints)[i];
            os << "  " << (c[0] ? 'T' : 'F') << ' ' << (c[1] ? 'T' : 'F') << ' ' << (c[2] ? 'T' : 'F');
        }
        if (fmt.add_symbol_tags) {
            os << "  ! " << s.ion_types[species] << '-'
               << std::setw(3) << std::setfill('0') << (i - offsets[species] + 1)
               << std::setfill(' ') << "  " << (i + 1);
        }
        os << '\n';
    }
    return os.str();
}

void write_poscar(std::ostream& os, const Poscar& poscar, const PoscarFormat& fmt) {
    os << format_poscar(poscar, fmt);
}

void save_poscar(const std::string& filename, const Poscar& poscar, const PoscarFormat& fmt) {
    const std::string text = format_poscar(poscar, fmt);
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file " + filename + " for writing");
    }
    file << text;
    if (!file) {
        throw std::runtime_error("Error occurred while writing " + filename);
    }
}
