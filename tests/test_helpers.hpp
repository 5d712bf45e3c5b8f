#pragma once

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "xtalview/core/AtomSet.hpp"

namespace test_utils {

// AtomSet from (species, position) pairs with a cubic cell of edge `cell_edge`.
inline xtalview::AtomSet make_atom_set(const std::vector<std::pair<std::string, xtalview::Vec3>>& atoms,
                                       double cell_edge = 4.0) {
    xtalview::AtomSet s;
    s.cell = {{{cell_edge, 0.0, 0.0}, {0.0, cell_edge, 0.0}, {0.0, 0.0, cell_edge}}};
    for (const auto& [species, pos] : atoms) {
        s.atoms.push_back(xtalview::Atom{species, pos});
    }
    return s;
}

inline bool near(const xtalview::Vec3& a, const xtalview::Vec3& b, double tol = 1e-9) {
    return std::abs(a[0] - b[0]) <= tol && std::abs(a[1] - b[1]) <= tol && std::abs(a[2] - b[2]) <= tol;
}

} // namespace test_utils
