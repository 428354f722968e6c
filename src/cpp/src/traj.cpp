/*
traj.cpp:
    This program reads a VASP OUTCAR and exports its ionic steps.
    The whole trajectory is written to save_dir/XDATCAR, and every selected step is written
    to save_dir/POSCAR_<step>.vasp and to save_dir/step_<step>.xsf (positions and forces).
    Selective dynamics flags are taken from the -p file, or from CONTCAR or POSCAR beside
    the OUTCAR, when present, and kept in the POSCAR files.

Usage:
    ./traj OUTCAR save_dir [switches] [indices...]
    OPTIONS:
        OUTCAR: the VASP log file
        save_dir: output directory, created if missing
        indices: steps to export, starting from 1. 0 selects all steps, a negative index
                 counts from the end, i.e. "-1 1 2" selects the last and the first two steps.
        switches: -p FILE  read selective dynamics flags from FILE
                  -d  write XDATCAR
                  -s  write the selected steps as POSCAR
                  -x  write the selected steps as XSF with forces
                      without -d, -s and -x all three are written
                  --cartesian                 POSCAR in cartesian coordinates
                  --no-preserve-constraints   drop the selective dynamics flags
                  --no-add-symbol-tags        no "! <symbol>" tag after each atom
*/

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "common.hpp"
#include "traj_options.hpp"
#include "../outcar.hpp"
#include "../poscar.hpp"
#include "../trajectory.hpp"

/* Main function */
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " OUTCAR save_dir [switches] [indices...]" << std::endl;
        return 1;
    }

    try {
        const TrajOptions opt = parse_traj_options(std::vector<std::string>(argv + 1, argv + argc));

        // read input file
        std::cout << "Reading file: " << opt.outcar << std::endl;
        Outcar outcar = read_outcar(opt.outcar);
        std::cout << "Number of atoms: " << outcar.nions << std::endl;
        std::cout << "Number of frames: " << outcar.ion_iters.size() << std::endl;
        if (opt.fmt.preserve_constraints) {
            merge_constraints(outcar, opt.poscar ? std::vector<std::string>{*opt.poscar}
                                                 : constraint_candidates(opt.outcar));
        }

        Trajectory traj = Trajectory::from_outcar(outcar);
        std::filesystem::create_directories(opt.save_dir);

        if (opt.save_as_xdatcar) {
            std::cout << "Writing file: " << (std::filesystem::path(opt.save_dir) / "XDATCAR").string() << std::endl;
            traj.save_as_xdatcar(opt.save_dir);
        }

        if (!opt.save_as_poscar && !opt.save_as_xsf) {
            return 0;
        }
        if (opt.indices.empty()) {
            std::cerr << "Warning: no steps are selected" << std::endl;
            return 0;
        }
        std::vector<int> steps = index_transform(opt.indices, static_cast<int>(traj.size()));

        run_parallel(steps, [&traj, &opt](int i) {
            if (opt.save_as_poscar) traj.save_as_poscar(i, opt.save_dir, opt.fmt);
            if (opt.save_as_xsf) traj.save_as_xsf(i, opt.save_dir);
        });
        std::cout << "Steps written: " << steps.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
