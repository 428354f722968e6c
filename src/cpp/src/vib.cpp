/*
vib.cpp:
    This program reads a VASP OUTCAR of a finite-difference phonon run (IBRION = 5-8),
    lists the vibrational modes at Gamma and writes every selected mode to
    save_dir/mode_<mode>.xsf, with the mass-scaled displacements as the vector field.

Usage:
    ./vib OUTCAR save_dir [indices...]
    OPTIONS:
        OUTCAR: the VASP log file
        save_dir: output directory, created if missing
        indices: modes to export, starting from 1. 0 selects all modes, a negative index
                 counts from the end.
*/

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "common.hpp"
#include "../format.hpp"
#include "../outcar.hpp"
#include "../trajectory.hpp"

/* Main function */
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " OUTCAR save_dir [indices...]" << std::endl;
        return 1;
    }

    try {
        std::string outcar_file = argv[1];
        std::string save_dir = argv[2];
        std::vector<int> selection = parse_indices(argc, argv, 3);

        std::cout << "Reading file: " << outcar_file << std::endl;
        Outcar outcar = read_outcar(outcar_file);
        Vibrations vibs = Vibrations::from_outcar(outcar);
        std::cout << "Number of atoms: " << outcar.nions << std::endl;
        std::cout << "Number of modes: " << vibs.size() << std::endl;

        write_vib_list(std::cout, vibs.modes);

        if (selection.empty()) {
            return 0;
        }
        std::vector<int> modes = index_transform(selection, static_cast<int>(vibs.size()));
        std::filesystem::create_directories(save_dir);

        run_parallel(modes, [&vibs, &save_dir](int i) { vibs.save_as_xsf(i, save_dir); });
        std::cout << "Modes written: " << modes.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
