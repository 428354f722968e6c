/*
pos.cpp:
    This program reads a POSCAR (or CONTCAR) and writes transformed copies of it.
    Selective dynamics flags are kept and every atom line is tagged with its symbol.

Usage:
    ./pos POSCAR split out_a out_b indices...
    ./pos POSCAR convert out_file direct|cartesian
    ./pos POSCAR sort out_file key
    OPTIONS:
        split: writes the selected atoms to out_a and the remaining atoms to out_b.
               indices start from 1, a negative index counts from the end.
        convert: rewrites the structure in fractional (direct) or cartesian coordinates.
        sort: reorders the atoms inside each species block. key is made of the fractional
              axes "ABC" and the cartesian axes "XYZ", highest priority first, i.e. "zA".
*/

#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "common.hpp"
#include "../poscar.hpp"
#include "../structure.hpp"
#include "../trajectory.hpp"

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " POSCAR split out_a out_b indices..." << std::endl;
    std::cerr << "       " << prog << " POSCAR convert out_file direct|cartesian" << std::endl;
    std::cerr << "       " << prog << " POSCAR sort out_file key" << std::endl;
}

static void write_file(const std::string& filename, const Poscar& poscar, const PoscarFormat& fmt) {
    std::cout << "Writing file: " << filename << std::endl;
    save_poscar(filename, poscar, fmt);
}

/* Main function */
int main(int argc, char** argv) {
    if (argc < 5) {
        usage(argv[0]);
        return 1;
    }

    try {
        std::string poscar_file = argv[1];
        std::string command = argv[2];

        std::cout << "Reading file: " << poscar_file << std::endl;
        Poscar poscar = read_poscar(poscar_file);
        const Structure& s = poscar.structure;
        std::cout << "Number of atoms: " << s.natoms() << std::endl;

        PoscarFormat fmt;
        if (command == "split") {
            if (argc < 6) {
                usage(argv[0]);
                return 1;
            }
            std::vector<int> selected = index_transform(parse_indices(argc, argv, 5), s.natoms());
            for (int& i : selected) --i;

            auto [a, b] = split(s, selected);
            write_file(argv[3], Poscar{"Generated by outcarkit, POSCAR with selected atoms", a}, fmt);
            write_file(argv[4], Poscar{"Generated by outcarkit, POSCAR complement", b}, fmt);
        } else if (command == "convert") {
            std::string target = argv[4];
            for (char& c : target) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (target == "direct" || target == "fractional") {
                fmt.fraction_coordinates = true;
            } else if (target == "cartesian") {
                fmt.fraction_coordinates = false;
            } else {
                throw std::invalid_argument("unknown coordinate system " + std::string(argv[4])
                                            + ", expected direct or cartesian");
            }
            write_file(argv[3], poscar, fmt);
        } else if (command == "sort") {
            Poscar sorted{poscar.comment, sort_by_axes(s, argv[4])};
            write_file(argv[3], sorted, fmt);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
