#include "cell.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

double determinant(const Lattice& c) {
    // |00 01 02|
    // |10 11 12|
    // |20 21 22|
    return c(0, 0) * (c(1, 1) * c(2, 2) - c(2, 1) * c(1, 2))
         - c(0, 1) * (c(1, 0) * c(2, 2) - c(1, 2) * c(2, 0))
         + c(0, 2) * (c(1, 0) * c(2, 1) - c(1, 1) * c(2, 0));
}

double volume(const Lattice& cell) {
    return std::abs(determinant(cell));
}

std::optional<Lattice> inverse(const Lattice& c) {
    const double det = determinant(c);
    if (!(std::abs(det) >= SINGULAR_CELL_THRESHOLD)) {
        return std::nullopt;
    }

    Lattice adj;
    adj(0, 0) =   c(1, 1) * c(2, 2) - c(1, 2) * c(2, 1);
    adj(0, 1) = -(c(0, 1) * c(2, 2) - c(0, 2) * c(2, 1));
    adj(0, 2) =   c(0, 1) * c(1, 2) - c(0, 2) * c(1, 1);
    adj(1, 0) = -(c(1, 0) * c(2, 2) - c(1, 2) * c(2, 0));
    adj(1, 1) =   c(0, 0) * c(2, 2) - c(0, 2) * c(2, 0);
    adj(1, 2) = -(c(0, 0) * c(1, 2) - c(0, 2) * c(1, 0));
    adj(2, 0) =   c(1, 0) * c(2, 1) - c(1, 1) * c(2, 0);
    adj(2, 1) = -(c(0, 0) * c(2, 1) - c(0, 1) * c(2, 0));
    adj(2, 2) =   c(0, 0) * c(1, 1) - c(0, 1) * c(1, 0);

    return Lattice(adj / det);
}

Lattice transpose(const Lattice& cell) {
    return cell.transpose();
}

Coords batch_transform(const Coords& points, const Lattice& matrix) {
    return points * matrix;
}

static Lattice checked_inverse(const Lattice& lattice, const char* direction) {
    std::optional<Lattice> inv = inverse(lattice);
    if (!inv) {
        std::ostringstream oss;
        oss << "singular cell (det = " << determinant(lattice)
            << "), cannot convert " << direction;
        throw GeometryError(oss.str());
    }
    return *inv;
}

Coords cart_to_frac(const Coords& cart, const Lattice& lattice) {
    return batch_transform(cart, checked_inverse(lattice, "cartesian coordinates to fractional"));
}

Coords frac_to_cart(const Coords& frac, const Lattice& lattice) {
    // a singular lattice maps distinct fractional positions onto a plane
    checked_inverse(lattice, "fractional coordinates to cartesian");
    return batch_transform(frac, lattice);
}
