#include "format.hpp"
#include "cell.hpp"
#include "errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

std::vector<double> force_norms(const Coords& forces, const std::optional<Constraints>& constraints) {
    if (constraints && static_cast<Eigen::Index>(constraints->size()) != forces.rows()) {
        throw ConsistencyError("constraints cover " + std::to_string(constraints->size()) + " atoms but forces have "
                               + std::to_string(forces.rows()) + " rows");
    }
    std::vector<double> norms(forces.rows());
    for (Eigen::Index i = 0; i < forces.rows(); ++i) {
        Eigen::RowVector3d f = forces.row(i);
        if (constraints) {
            for (int j = 0; j < 3; ++j) {
                if (!(*constraints)[i][j]) f(j) = 0.0;
            }
        }
        norms[i] = f.norm();
    }
    return norms;
}

// ---- relaxation table ----

std::string format_relax_table(const Outcar& outcar, const RelaxFormat& fmt) {
    const std::vector<IonicIteration>& steps = outcar.ion_iters;
    static const char AXES[] = {'X', 'Y', 'Z'};

    std::ostringstream os;
    os << std::fixed;
    for (size_t k = 0; k < steps.size(); ++k) {
        const IonicIteration& it = steps[k];
        os << std::setw(7) << (k + 1);

        os << std::setprecision(5);
        if (fmt.print_energy) os << ' ' << std::setw(11) << it.toten;
        if (fmt.print_energyz) os << ' ' << std::setw(11) << it.toten_z;
        if (fmt.print_log10de) {
            const double de = k == 0 ? it.toten_z : it.toten_z - steps[k - 1].toten_z;
            os << ' ' << std::setw(4) << std::setprecision(1) << std::log10(std::abs(de));
        }

        const std::vector<double> norms = force_norms(it.forces, outcar.constraints);
        size_t imax = 0;
        double fsum = 0.0;
        for (size_t i = 0; i < norms.size(); ++i) {
            fsum += norms[i];
            if (norms[i] > norms[imax]) imax = i;
        }
        const double fmax = norms.empty() ? 0.0 : norms[imax];

        os << std::setprecision(3);
        if (fmt.print_favg) os << ' ' << std::setw(6) << (norms.empty() ? 0.0 : fsum / norms.size());
        if (fmt.print_fmax) os << ' ' << std::setw(6) << fmax;
        if (fmt.print_fmax_axis) {
            int axis = 0;
            if (!norms.empty()) {
                for (int j = 1; j < 3; ++j) {
                    const bool free_j = !outcar.constraints || (*outcar.constraints)[imax][j];
                    const bool free_axis = !outcar.constraints || (*outcar.constraints)[imax][axis];
                    const double fj = free_j ? std::abs(it.forces(imax, j)) : 0.0;
                    const double fa = free_axis ? std::abs(it.forces(imax, axis)) : 0.0;
                    if (fj > fa) axis = j;
                }
            }
            os << ' ' << AXES[axis];
        }
        if (fmt.print_fmax_index) os << ' ' << std::setw(3) << (imax + 1);
        if (fmt.print_nscf) os << ' ' << std::setw(3) << it.nscf;
        if (fmt.print_time_usage) os << ' ' << std::setw(6) << std::setprecision(2) << it.cputime / 60.0;
        if (fmt.print_volume) os << ' ' << std::setw(9) << std::setprecision(3) << volume(it.cell);
        if (fmt.print_magmom) {
            if (it.magmom) {
                os << std::setprecision(3);
                for (double m : *it.magmom) os << ' ' << std::setw(7) << m;
            } else {
                os << "   NoMag";
            }
        }
        os << '\n';
    }
    return os.str();
}

void write_relax_table(std::ostream& os, const Outcar& outcar, const RelaxFormat& fmt) {
    os << format_relax_table(outcar, fmt);
}

// ---- vibration modes ----

std::string format_vib_list(const std::vector<Vibration>& modes) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(6);
    for (size_t i = 0; i < modes.size(); ++i) {
        os << std::setw(5) << (i + 1) << ' ' << std::setw(14) << modes[i].freq << " cm-1";
        if (modes[i].is_imagine) os << "  f/i";
        os << '\n';
    }
    return os.str();
}

void write_vib_list(std::ostream& os, const std::vector<Vibration>& modes) {
    os << format_vib_list(modes);
}
