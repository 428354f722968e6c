#include "outcar.hpp"
#include "errors.hpp"
#include "mapped_file.hpp"
#include "scan.hpp"
#include <cmath>
#include <exception>
#include <functional>
#include <numeric>

#ifdef _OPENMP
#include <omp.h>
#endif

// ----------------------------------------------------------------------------
// Markers
// ----------------------------------------------------------------------------

static const char* const STEP_TRAILER  = "free  energy";            // closes every ionic step
static const char* const TOTEN_KEY     = "free  energy   TOTEN  =";
static const char* const TOTEN_Z_KEY   = "energy  without entropy=";
static const char* const SIGMA0_KEY    = "energy(sigma->0) =";
static const char* const LOOP_KEY      = "LOOP+:";
static const char* const PRESSURE_KEY  = "external pressure =";
static const char* const ITERATION_KEY = "Iteration";
static const char* const ELECTRON_KEY  = "number of electron";
static const char* const MAG_KEY       = "magnetization";
static const char* const POSITION_KEY  = " POSITION";
static const char* const TABLE_END_KEY = " ----";
static const char* const LATTICE_KEY   = "direct lattice vectors";
static const char* const POTCAR_KEY    = " POTCAR:";
static const char* const POMASS_KEY    = "POMASS =";
static const char* const ZVAL_KEY      = "; ZVAL";
static const char* const DOF_KEY       = "Degrees of freedom DOF   =";
static const char* const MODE_KEY      = "2PiTHz";
static const char* const CM1_KEY       = "cm-1";
static const char* const IMAGINARY_KEY = "f/i=";

// ----------------------------------------------------------------------------
// Global scalars
// ----------------------------------------------------------------------------

int parse_ispin(std::string_view text) {
    return to_int(value_after(text, "ISPIN  =", "ISPIN"), "ISPIN");
}

bool parse_lsorbit(std::string_view text) {
    std::string_view token = value_after(text, "LSORBIT =", "LSORBIT");
    return token.front() == 'T' || token.front() == 't';
}

int parse_ibrion(std::string_view text) {
    return to_int(value_after(text, "IBRION =", "IBRION"), "IBRION");
}

int parse_nions(std::string_view text) {
    return to_int(value_after(text, "NIONS =", "NIONS"), "NIONS");
}

std::pair<int, int> parse_nkpts_nbands(std::string_view text) {
    return {to_int(value_after(text, "NKPTS =", "NKPTS"), "NKPTS"),
            to_int(value_after(text, "NBANDS=", "NBANDS"), "NBANDS")};
}

double parse_efermi(std::string_view text) {
    return to_double(value_after(text, " E-fermi :", "E-fermi"), "E-fermi");
}

/* first three numbers of the three lines following the "direct lattice vectors" line */
static Lattice read_lattice_rows(std::string_view text, const std::string& field) {
    std::string_view rest = text;
    std::string_view line;
    next_line(rest, line);  // header

    Lattice cell;
    for (int i = 0; i < 3; ++i) {
        if (!next_line(rest, line)) {
            throw FormatError("truncated lattice block for " + field);
        }
        std::vector<std::string_view> tokens = split_ws(line);
        if (tokens.size() < 3) {
            throw FormatError("lattice row " + std::to_string(i + 1) + " of " + field + " has "
                              + std::to_string(tokens.size()) + " values");
        }
        for (int j = 0; j < 3; ++j) {
            cell(i, j) = to_double(tokens[j], field);
        }
    }
    return cell;
}

Lattice parse_cell(std::string_view text) {
    size_t pos = text.find(LATTICE_KEY);
    if (pos == std::string_view::npos) {
        throw FormatError("field not found: cell (marker 'direct lattice vectors')");
    }
    return read_lattice_rows(text.substr(pos), "cell");
}

std::vector<int> parse_ions_per_type(std::string_view text) {
    const char* key = "ions per type =";
    size_t pos = text.find(key);
    if (pos == std::string_view::npos) {
        throw FormatError("field not found: ions per type");
    }
    std::string_view rest = text.substr(pos + std::string_view(key).size());
    std::string_view line;
    next_line(rest, line);

    std::vector<int> counts;
    for (std::string_view token : split_ws(line)) {
        const int n = to_int(token, "ions per type");
        if (n <= 0) {
            throw FormatError("ions per type must be positive, got " + std::string(token));
        }
        counts.push_back(n);
    }
    if (counts.empty()) {
        throw FormatError("no counts after 'ions per type ='");
    }
    return counts;
}

std::vector<std::string> parse_ion_types(std::string_view text) {
    std::vector<std::string> types;
    for (size_t pos : find_line_starts(text, POTCAR_KEY)) {
        std::vector<std::string_view> tokens = split_ws(line_at(text, pos));
        if (tokens.size() < 3) {
            throw FormatError("malformed POTCAR line: '" + std::string(line_at(text, pos)) + "'");
        }
        // "Fe_pv" -> "Fe"
        std::string_view label = tokens[2];
        label = label.substr(0, label.find('_'));
        types.emplace_back(label);
    }
    if (types.empty()) {
        throw FormatError("field not found: ion types (no ' POTCAR:' lines)");
    }
    types.resize((types.size() + 1) / 2);
    return types;
}

std::vector<double> parse_masses_per_type(std::string_view text) {
    std::vector<double> masses;
    for (size_t pos : find_all(text, POMASS_KEY)) {
        std::string_view line = line_at(text, pos);
        if (line.find(ZVAL_KEY) == std::string_view::npos) {
            continue;
        }
        std::string_view token = value_after(line, POMASS_KEY, "POMASS");
        if (!token.empty() && token.back() == ';') {
            token.remove_suffix(1);
        }
        masses.push_back(to_double(token, "POMASS"));
    }
    if (masses.empty()) {
        throw FormatError("field not found: POMASS");
    }
    return masses;
}

// ----------------------------------------------------------------------------
// Per-step fields
// ----------------------------------------------------------------------------

/* value_after applied to the line of every occurrence of key */
static std::vector<double> parse_each(std::string_view text, std::string_view key,
                                      std::string_view value_key, const std::string& field) {
    std::vector<double> values;
    std::vector<size_t> offsets = find_all(text, key);
    values.reserve(offsets.size());
    for (size_t i = 0; i < offsets.size(); ++i) {
        std::string_view line = line_at(text, offsets[i]);
        std::string_view from_key = line.substr(line.find(key));
        std::string indexed = field + " of ionic step " + std::to_string(i + 1);
        values.push_back(to_double(value_after(from_key, value_key, indexed), indexed));
    }
    return values;
}

std::vector<double> parse_toten(std::string_view text) {
    return parse_each(text, TOTEN_KEY, TOTEN_KEY, "TOTEN");
}

std::vector<double> parse_toten_z(std::string_view text) {
    return parse_each(text, TOTEN_Z_KEY, SIGMA0_KEY, "energy(sigma->0)");
}

std::vector<double> parse_cputime(std::string_view text) {
    return parse_each(text, LOOP_KEY, "real time", "LOOP+ real time");
}

std::vector<double> parse_stress(std::string_view text) {
    return parse_each(text, PRESSURE_KEY, PRESSURE_KEY, "external pressure");
}

/* "Iteration    1(  23)" -> 23 */
static int parse_nscf(std::string_view slice, size_t step) {
    const std::string field = "nscf of ionic step " + std::to_string(step);
    size_t pos = slice.rfind(ITERATION_KEY);
    if (pos == std::string_view::npos) {
        throw FormatError("field not found: " + field + " (no 'Iteration' line before the step trailer)");
    }
    std::string_view line = line_at(slice, pos);
    size_t open = line.find('(');
    size_t close = line.find(')', open == std::string_view::npos ? 0 : open);
    if (open == std::string_view::npos || close == std::string_view::npos) {
        throw FormatError("malformed iteration line for " + field + ": '" + std::string(line) + "'");
    }
    std::vector<std::string_view> tokens = split_ws(line.substr(open + 1, close - open - 1));
    if (tokens.size() != 1) {
        throw FormatError("malformed iteration line for " + field + ": '" + std::string(line) + "'");
    }
    return to_int(tokens[0], field);
}

std::vector<int> parse_nscfs(std::string_view text) {
    std::vector<std::string_view> slices = preceding_slices(text, STEP_TRAILER);
    std::vector<int> nscfs;
    nscfs.reserve(slices.size());
    for (size_t i = 0; i < slices.size(); ++i) {
        nscfs.push_back(parse_nscf(slices[i], i + 1));
    }
    return nscfs;
}

std::vector<std::optional<std::vector<double>>> parse_magmoms(std::string_view text) {
    std::vector<std::optional<std::vector<double>>> magmoms;
    std::vector<std::string_view> slices = preceding_slices(text, STEP_TRAILER);
    for (size_t i = 0; i < slices.size(); ++i) {
        size_t pos = slices[i].rfind(ELECTRON_KEY);
        if (pos == std::string_view::npos) {
            magmoms.emplace_back(std::nullopt);
            continue;
        }
        std::string_view line = line_at(slices[i], pos);
        size_t mag = line.find(MAG_KEY);
        if (mag == std::string_view::npos) {
            magmoms.emplace_back(std::nullopt);
            continue;
        }
        std::vector<double> values = to_doubles(line.substr(mag + std::string_view(MAG_KEY).size()),
                                                "magnetization of ionic step " + std::to_string(i + 1));
        if (values.empty()) {
            magmoms.emplace_back(std::nullopt);
        } else {
            magmoms.emplace_back(std::move(values));
        }
    }
    return magmoms;
}

std::pair<Coords, Coords> parse_posforce_single_iteration(std::string_view text) {
    std::string_view rest = text;
    std::string_view line;
    next_line(rest, line);  // " POSITION    TOTAL-FORCE (eV/Angst)"
    next_line(rest, line);  // " -----------"

    std::vector<std::array<double, 6>> rows;
    bool closed = false;
    while (next_line(rest, line)) {
        if (line.substr(0, 5) == TABLE_END_KEY) {
            closed = true;
            break;
        }
        std::vector<std::string_view> tokens = split_ws(line);
        if (tokens.size() < 6) {
            throw FormatError("POSITION/TOTAL-FORCE row " + std::to_string(rows.size() + 1) + " has "
                              + std::to_string(tokens.size()) + " columns, expected 6");
        }
        std::array<double, 6> row;
        for (int j = 0; j < 6; ++j) {
            row[j] = to_double(tokens[j], "POSITION/TOTAL-FORCE row " + std::to_string(rows.size() + 1));
        }
        rows.push_back(row);
    }
    if (!closed) {
        throw FormatError("POSITION/TOTAL-FORCE table is not terminated by a dashed rule");
    }

    Coords positions(rows.size(), 3);
    Coords forces(rows.size(), 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        positions.row(i) << rows[i][0], rows[i][1], rows[i][2];
        forces.row(i) << rows[i][3], rows[i][4], rows[i][5];
    }
    return {positions, forces};
}

std::pair<std::vector<Coords>, std::vector<Coords>> parse_posforce(std::string_view text) {
    std::vector<Coords> positions;
    std::vector<Coords> forces;
    for (std::string_view block : following_slices(text, POSITION_KEY, true)) {
        auto [p, f] = parse_posforce_single_iteration(block);
        positions.push_back(std::move(p));
        forces.push_back(std::move(f));
    }
    return {positions, forces};
}

std::vector<Lattice> parse_opt_cells(std::string_view text) {
    std::vector<std::string_view> blocks = following_slices(text, LATTICE_KEY);
    std::vector<Lattice> cells;
    for (size_t i = 1; i < blocks.size(); ++i) {
        cells.push_back(read_lattice_rows(blocks[i], "cell of ionic step " + std::to_string(i)));
    }
    return cells;
}

// ----------------------------------------------------------------------------
// Vibrations
// ----------------------------------------------------------------------------

std::optional<int> parse_dof(std::string_view text) {
    if (text.find(DOF_KEY) == std::string_view::npos) {
        return std::nullopt;
    }
    return to_int(value_after(text, DOF_KEY, "DOF"), "DOF");
}

Vibration parse_single_vibmode(std::string_view text) {
    std::string_view rest = text;
    std::string_view header;
    next_line(rest, header);

    Vibration mode;
    std::vector<std::string_view> tokens = split_ws(header);
    size_t k = 0;
    while (k < tokens.size() && tokens[k] != CM1_KEY) ++k;
    if (k == 0 || k == tokens.size()) {
        throw FormatError("no frequency in cm-1 on mode header '" + std::string(header) + "'");
    }
    mode.freq = to_double(tokens[k - 1], "vibration frequency");
    mode.is_imagine = header.find(IMAGINARY_KEY) != std::string_view::npos;

    // column header "X  Y  Z  dx  dy  dz", then one row per atom until a blank line
    std::string_view line;
    bool found = false;
    while (next_line(rest, line)) {
        if (line.find("dx") != std::string_view::npos) {
            found = true;
            break;
        }
    }
    if (!found) {
        throw FormatError("no 'dx dy dz' table after mode header '" + std::string(header) + "'");
    }

    std::vector<std::array<double, 3>> rows;
    while (next_line(rest, line) && !is_blank(line)) {
        tokens = split_ws(line);
        if (tokens.size() < 6) {
            throw FormatError("displacement row " + std::to_string(rows.size() + 1) + " has "
                              + std::to_string(tokens.size()) + " columns, expected 6");
        }
        const std::string field = "displacement row " + std::to_string(rows.size() + 1);
        rows.push_back({to_double(tokens[3], field), to_double(tokens[4], field), to_double(tokens[5], field)});
    }

    mode.dxdydz.resize(rows.size(), 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        mode.dxdydz.row(i) << rows[i][0], rows[i][1], rows[i][2];
    }
    return mode;
}

std::optional<std::vector<Vibration>> parse_vibrations(std::string_view text) {
    std::optional<int> dof = parse_dof(text);
    if (!dof || *dof <= 0) {
        return std::nullopt;
    }

    // mode headers in document order: the mass-weighted block comes first
    std::vector<size_t> headers;
    for (size_t pos : find_all(text, MODE_KEY)) {
        std::string_view line = line_at(text, pos);
        if (line.find(CM1_KEY) == std::string_view::npos) {
            continue;
        }
        size_t newline = text.rfind('\n', pos);
        headers.push_back(newline == std::string_view::npos ? 0 : newline + 1);
        if (static_cast<int>(headers.size()) == *dof) {
            break;
        }
    }
    if (static_cast<int>(headers.size()) < *dof) {
        throw FormatError("DOF = " + std::to_string(*dof) + " but only " + std::to_string(headers.size())
                          + " vibration modes were found");
    }

    std::vector<Vibration> modes;
    modes.reserve(headers.size());
    for (size_t pos : headers) {
        modes.push_back(parse_single_vibmode(text.substr(pos)));
    }
    return modes;
}

void apply_mass_weights(std::vector<Vibration>& modes, const std::vector<double>& ion_masses) {
    for (size_t m = 0; m < modes.size(); ++m) {
        Coords& d = modes[m].dxdydz;
        if (d.rows() != static_cast<Eigen::Index>(ion_masses.size())) {
            throw ConsistencyError("vibration mode " + std::to_string(m + 1) + " has " + std::to_string(d.rows())
                                   + " displacement rows but there are " + std::to_string(ion_masses.size()) + " ions");
        }
        for (Eigen::Index i = 0; i < d.rows(); ++i) {
            d.row(i) /= std::sqrt(ion_masses[i]);
        }
    }
}

// ----------------------------------------------------------------------------
// Assembly
// ----------------------------------------------------------------------------

void Outcar::set_constraints(Constraints c) {
    if (static_cast<int>(c.size()) != nions) {
        throw ConsistencyError("constraints cover " + std::to_string(c.size()) + " atoms but OUTCAR has "
                               + std::to_string(nions) + " ions");
    }
    constraints = std::move(c);
}

template <typename T>
static void check_steps(const std::vector<T>& v, size_t nsteps, const char* field) {
    if (v.size() != nsteps) {
        throw ConsistencyError("inconsistent step count: " + std::string(field) + " has " + std::to_string(v.size())
                               + " entries, expected " + std::to_string(nsteps));
    }
}

Outcar parse_outcar(std::string_view text) {
    Outcar outcar;

    std::pair<int, int> nkpts_nbands;
    std::vector<double> masses_per_type;
    std::vector<int> nscfs;
    std::vector<double> toten, toten_z, cputime, stress;
    std::vector<std::optional<std::vector<double>>> magmoms;
    std::pair<std::vector<Coords>, std::vector<Coords>> posforce;
    std::vector<Lattice> cells;
    std::optional<std::vector<Vibration>> vib;

    // Each task reads the shared text and writes only its own output.
    const std::vector<std::function<void()>> tasks = {
        [&] { outcar.lsorbit = parse_lsorbit(text); },
        [&] { outcar.ispin = parse_ispin(text); },
        [&] { outcar.ibrion = parse_ibrion(text); },
        [&] { outcar.nions = parse_nions(text); },
        [&] { nkpts_nbands = parse_nkpts_nbands(text); },
        [&] { outcar.efermi = parse_efermi(text); },
        [&] { outcar.cell = parse_cell(text); },
        [&] { outcar.ion_types = parse_ion_types(text); },
        [&] { outcar.ions_per_type = parse_ions_per_type(text); },
        [&] { masses_per_type = parse_masses_per_type(text); },
        [&] { nscfs = parse_nscfs(text); },
        [&] { toten = parse_toten(text); },
        [&] { toten_z = parse_toten_z(text); },
        [&] { cputime = parse_cputime(text); },
        [&] { stress = parse_stress(text); },
        [&] { magmoms = parse_magmoms(text); },
        [&] { posforce = parse_posforce(text); },
        [&] { cells = parse_opt_cells(text); },
        [&] { vib = parse_vibrations(text); },
    };

    // An exception must not leave the parallel region; keep it and rethrow after the join.
    std::vector<std::exception_ptr> errors(tasks.size());
    int n_tasks = static_cast<int>(tasks.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < n_tasks; ++i) {
        try {
            tasks[static_cast<size_t>(i)]();
        } catch (...) {
            errors[static_cast<size_t>(i)] = std::current_exception();
        }
    }
    for (const std::exception_ptr& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }

    outcar.nkpts = nkpts_nbands.first;
    outcar.nbands = nkpts_nbands.second;

    // species
    const size_t ntypes = outcar.ion_types.size();
    if (outcar.ions_per_type.size() != ntypes) {
        throw ConsistencyError("OUTCAR lists " + std::to_string(ntypes) + " POTCARs but "
                               + std::to_string(outcar.ions_per_type.size()) + " ion counts");
    }
    if (masses_per_type.size() < ntypes) {
        throw ConsistencyError("OUTCAR lists " + std::to_string(ntypes) + " POTCARs but only "
                               + std::to_string(masses_per_type.size()) + " POMASS values");
    }
    const int total = std::accumulate(outcar.ions_per_type.begin(), outcar.ions_per_type.end(), 0);
    if (total != outcar.nions) {
        throw ConsistencyError("ions per type add up to " + std::to_string(total) + " but NIONS = "
                               + std::to_string(outcar.nions));
    }
    outcar.ion_masses.reserve(outcar.nions);
    for (size_t k = 0; k < ntypes; ++k) {
        outcar.ion_masses.insert(outcar.ion_masses.end(), outcar.ions_per_type[k], masses_per_type[k]);
    }

    // every per-step field has the length of the energy field
    const size_t nsteps = toten.size();
    check_steps(nscfs, nsteps, "nscf");
    check_steps(toten_z, nsteps, "energy(sigma->0)");
    check_steps(cputime, nsteps, "LOOP+ time");
    check_steps(stress, nsteps, "external pressure");
    check_steps(magmoms, nsteps, "magnetization");
    check_steps(posforce.first, nsteps, "positions");
    check_steps(posforce.second, nsteps, "forces");
    check_steps(cells, nsteps, "cell");

    outcar.ion_iters.reserve(nsteps);
    for (size_t i = 0; i < nsteps; ++i) {
        if (posforce.first[i].rows() != outcar.nions) {
            throw ConsistencyError("ionic step " + std::to_string(i + 1) + " has " + std::to_string(posforce.first[i].rows())
                                   + " position rows but NIONS = " + std::to_string(outcar.nions));
        }
        IonicIteration it;
        it.nscf = nscfs[i];
        it.toten = toten[i];
        it.toten_z = toten_z[i];
        it.cputime = cputime[i];
        it.stress = stress[i];
        it.magmom = std::move(magmoms[i]);
        it.positions = std::move(posforce.first[i]);
        it.forces = std::move(posforce.second[i]);
        it.cell = cells[i];
        outcar.ion_iters.push_back(std::move(it));
    }

    if (vib) {
        apply_mass_weights(*vib, outcar.ion_masses);
        outcar.vib = std::move(vib);
    }

    return outcar;
}

Outcar read_outcar(const std::string& filename) {
    MappedFile file(filename);
    return parse_outcar(file.view());
}
