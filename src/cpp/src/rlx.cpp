/*
rlx.cpp:
    This program reads a VASP OUTCAR and prints the progress of a relaxation or MD run,
    one line per ionic step: energy, change of energy, forces, SCF steps, time and magnetic moment.
    Frozen force components are masked when selective dynamics flags are found.

Usage:
    ./rlx OUTCAR [POSCAR] [switches]
    OPTIONS:
        OUTCAR: the VASP log file
        POSCAR: file with selective dynamics flags. If omitted, CONTCAR and then POSCAR
                beside the OUTCAR are tried.
        switches: -e  print TOTEN
                  -a  print the average force
                  -x  print the axis of the largest force component
                  -i  print the index of the atom with the largest force
                  -v  print the cell volume
                  --no-totenz, --no-lgde, --no-fmax, --no-nscf, --no-time, --no-magmom
                      hide the corresponding default column

Columns, in order: step, TOTEN, TOTEN_z, log10|dE|, favg, fmax, fmax axis, fmax index,
nscf, time (min), volume, magmom.
*/

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "common.hpp"
#include "../format.hpp"
#include "../outcar.hpp"

static void apply_switch(RelaxFormat& fmt, const std::string& arg) {
    if (arg == "-e") fmt.print_energy = true;
    else if (arg == "-a") fmt.print_favg = true;
    else if (arg == "-x") fmt.print_fmax_axis = true;
    else if (arg == "-i") fmt.print_fmax_index = true;
    else if (arg == "-v") fmt.print_volume = true;
    else if (arg == "--no-totenz") fmt.print_energyz = false;
    else if (arg == "--no-lgde") fmt.print_log10de = false;
    else if (arg == "--no-fmax") fmt.print_fmax = false;
    else if (arg == "--no-nscf") fmt.print_nscf = false;
    else if (arg == "--no-time") fmt.print_time_usage = false;
    else if (arg == "--no-magmom") fmt.print_magmom = false;
    else throw std::invalid_argument("unknown switch " + arg);
}

/* Main function */
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " OUTCAR [POSCAR] [switches]" << std::endl;
        return 1;
    }

    try {
        std::string outcar_file = argv[1];
        std::vector<std::string> candidates;
        RelaxFormat fmt;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (!arg.empty() && arg[0] == '-') {
                apply_switch(fmt, arg);
            } else {
                candidates.push_back(arg);
            }
        }
        if (candidates.empty()) {
            candidates = constraint_candidates(outcar_file);
        }

        std::cout << "Reading file: " << outcar_file << std::endl;
        Outcar outcar = read_outcar(outcar_file);
        std::cout << "Number of atoms: " << outcar.nions << std::endl;
        std::cout << "Number of ionic steps: " << outcar.ion_iters.size() << std::endl;
        merge_constraints(outcar, candidates);

        write_relax_table(std::cout, outcar, fmt);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
