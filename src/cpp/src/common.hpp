/*
common.hpp:
    Helpers shared by the command line drivers.

functions:
    parse_indices: integer arguments argv[first..argc)
    merge_constraints: attach the selective dynamics flags of the first readable candidate file
    run_parallel: apply a job to every selected index in parallel
*/
#pragma once

#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include "../errors.hpp"
#include "../loader.hpp"
#include "../outcar.hpp"
#include "../poscar.hpp"
#include "../scan.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

inline std::vector<int> parse_indices(int argc, char** argv, int first) {
    std::vector<int> indices;
    for (int i = first; i < argc; ++i) {
        indices.push_back(to_int(argv[i], "index argument " + std::to_string(i - first + 1)));
    }
    return indices;
}

/* candidates default to CONTCAR then POSCAR beside the OUTCAR */
inline std::vector<std::string> constraint_candidates(const std::string& outcar_file) {
    std::filesystem::path dir = std::filesystem::path(outcar_file).parent_path();
    return {(dir / "CONTCAR").string(), (dir / "POSCAR").string()};
}

/**
 * @brief Reads the selective dynamics flags from the first candidate that
 * parses, has them and matches the atom count, and merges them into outcar.
 * A failure is only a warning.
 */
inline void merge_constraints(Outcar& outcar, const std::vector<std::string>& candidates) {
    std::vector<Loader<Constraints>> loaders;
    const int nions = outcar.nions;
    for (const std::string& path : candidates) {
        loaders.push_back([path, nions]() {
            Poscar poscar = read_poscar(path);
            if (!poscar.structure.constraints) {
                throw FormatError(path + " has no selective dynamics flags");
            }
            if (poscar.structure.natoms() != nions) {
                throw ConsistencyError(path + " has " + std::to_string(poscar.structure.natoms())
                                       + " atoms but OUTCAR has " + std::to_string(nions));
            }
            return *poscar.structure.constraints;
        });
    }

    Loaded<Constraints> loaded = first_success(loaders);
    if (!loaded.ok()) {
        std::cerr << "Warning: no constraints merged: " << loaded.error << std::endl;
        return;
    }
    outcar.set_constraints(std::move(*loaded.value));
    std::cout << "Constraints merged for " << outcar.nions << " atoms" << std::endl;
}

/* job(i) for every i; the first exception, in index order, is rethrown after all jobs ran */
inline void run_parallel(const std::vector<int>& indices, const std::function<void(int)>& job) {
    std::vector<std::exception_ptr> errors(indices.size());
    int n = static_cast<int>(indices.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (int k = 0; k < n; ++k) {
        try {
            job(indices[k]);
        } catch (...) {
            errors[k] = std::current_exception();
        }
    }
    for (const std::exception_ptr& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}
