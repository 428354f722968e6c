/*
cell.hpp:
    Closed-form 3x3 lattice algebra and fractional <-> cartesian conversion.
    Positions are row vectors, so cart = frac * lattice and frac = cart * lattice^-1.
*/
#pragma once

#include <optional>
#include "basic.hpp"

// |det| below this value marks a degenerate lattice
constexpr double SINGULAR_CELL_THRESHOLD = 1e-5;

double determinant(const Lattice& cell);

/* volume of the parallelepiped spanned by the rows */
double volume(const Lattice& cell);

/**
 * @brief Cofactor inverse of a 3x3 lattice.
 * @return std::nullopt when |det| < SINGULAR_CELL_THRESHOLD.
 */
std::optional<Lattice> inverse(const Lattice& cell);

Lattice transpose(const Lattice& cell);

/* row-wise product points * matrix, returns a new matrix */
Coords batch_transform(const Coords& points, const Lattice& matrix);

/**
 * @brief Cartesian to fractional coordinates.
 * @throws GeometryError if the lattice is singular.
 */
Coords cart_to_frac(const Coords& cart, const Lattice& lattice);

/* @throws GeometryError if the lattice is singular */
Coords frac_to_cart(const Coords& frac, const Lattice& lattice);
