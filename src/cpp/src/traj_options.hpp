/*
traj_options.hpp:
    Command line of the traj program.

structs:
    TrajOptions: input files, export selectors and POSCAR writer options

functions:
    parse_traj_options: arguments after the program name -> TrajOptions
*/
#pragma once

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../poscar.hpp"
#include "../scan.hpp"

struct TrajOptions {
    std::string outcar;
    std::string save_dir;
    std::optional<std::string> poscar;  // -p, otherwise CONTCAR then POSCAR beside the OUTCAR
    bool save_as_poscar = false;        // -s
    bool save_as_xsf = false;           // -x
    bool save_as_xdatcar = false;       // -d
    PoscarFormat fmt;
    std::vector<int> indices;
};

/* "12", "-1": a step index rather than a switch */
inline bool is_index_arg(const std::string& arg) {
    size_t start = (!arg.empty() && arg[0] == '-') ? 1 : 0;
    if (start == arg.size()) return false;
    for (size_t i = start; i < arg.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(arg[i]))) return false;
    }
    return true;
}

/**
 * @brief Parses "OUTCAR save_dir [switches] [indices...]".
 * Without any of -s, -x and -d every export is enabled.
 * @throws std::invalid_argument on an unknown switch, a missing -p value or
 *         a missing positional argument.
 */
inline TrajOptions parse_traj_options(const std::vector<std::string>& args) {
    TrajOptions opt;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] != '-' || is_index_arg(arg)) {
            if (positional.size() < 2) {
                positional.push_back(arg);
            } else {
                opt.indices.push_back(to_int(arg, "step index"));
            }
        } else if (arg == "-p" || arg == "--poscar") {
            if (i + 1 == args.size()) {
                throw std::invalid_argument(arg + " needs a file name");
            }
            opt.poscar = args[++i];
        } else if (arg == "-s") opt.save_as_poscar = true;
        else if (arg == "-x") opt.save_as_xsf = true;
        else if (arg == "-d") opt.save_as_xdatcar = true;
        else if (arg == "--cartesian") opt.fmt.fraction_coordinates = false;
        else if (arg == "--no-preserve-constraints") opt.fmt.preserve_constraints = false;
        else if (arg == "--no-add-symbol-tags") opt.fmt.add_symbol_tags = false;
        else throw std::invalid_argument("unknown switch " + arg);
    }
    if (positional.size() < 2) {
        throw std::invalid_argument("expected OUTCAR and save_dir");
    }
    opt.outcar = positional[0];
    opt.save_dir = positional[1];

    if (!opt.save_as_poscar && !opt.save_as_xsf && !opt.save_as_xdatcar) {
        opt.save_as_poscar = opt.save_as_xsf = opt.save_as_xdatcar = true;
    }
    return opt;
}
