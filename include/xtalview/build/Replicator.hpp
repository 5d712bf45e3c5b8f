#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/core/UnitCell.hpp"

namespace xtalview::build {

struct RepeatCounts {
  int nx = 1, ny = 1, nz = 1;

  std::size_t product() const {
    return static_cast<std::size_t>(nx) * static_cast<std::size_t>(ny) * static_cast<std::size_t>(nz);
  }
};

// Upper bound on a single repeat count accepted from configuration or derived
// from physical wire dimensions.
inline constexpr int kMaxRepeatCount = 100000;

inline void validate_repeat_counts(const RepeatCounts& n) {
  if (n.nx < 1 || n.ny < 1 || n.nz < 1) {
    throw InvalidParameterError("Replicator: repeat counts must be >= 1 (got " +
                                std::to_string(n.nx) + "," + std::to_string(n.ny) + "," +
                                std::to_string(n.nz) + ")");
  }
}

// Tile a unit cell nx*ny*nz times along its lattice vectors.
//
// Ordering: replica (i,j,k) with k fastest, then unit-cell atom index. Atom
// positions accumulate the per-replica offset i*a + j*b + k*c directly; the
// scaled `cell` of the result is only used for drawing cell edges.
inline AtomSet replicate(const UnitCell& uc, const RepeatCounts& n) {
  validate_repeat_counts(n);

  const auto& v = uc.vectors();
  AtomSet out;
  out.cell = {scale(v[0], static_cast<double>(n.nx)),
              scale(v[1], static_cast<double>(n.ny)),
              scale(v[2], static_cast<double>(n.nz))};
  out.atoms.reserve(uc.size() * n.product());

  for (int i = 0; i < n.nx; ++i) {
    for (int j = 0; j < n.ny; ++j) {
      for (int k = 0; k < n.nz; ++k) {
        const Vec3 offset = add(add(scale(v[0], static_cast<double>(i)),
                                    scale(v[1], static_cast<double>(j))),
                                scale(v[2], static_cast<double>(k)));
        for (const auto& at : uc.atoms()) {
          out.atoms.push_back(Atom{at.species, add(at.position, offset)});
        }
      }
    }
  }
  return out;
}

} // namespace xtalview::build
