#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <utility>

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/core/Vec3.hpp"

namespace xtalview::view {

using Segment = std::pair<Vec3, Vec3>;

// Equal-aspect viewing volume around an atom cloud plus the 12 edges of its
// cell. The cube [center - half_extent, center + half_extent]^3 encloses every
// atom and is tight along the axis with the largest span, so two structures
// framed this way are drawn at the same scale on all three axes.
struct ViewFrame {
  Vec3 center{0.0, 0.0, 0.0};
  double half_extent = 0.0;
  std::array<Segment, 12> cell_edges{};

  // Per-axis (lo, hi) limits to apply on the renderer's axes.
  std::array<std::pair<double,double>, 3> axis_limits() const {
    return {{{center[0] - half_extent, center[0] + half_extent},
             {center[1] - half_extent, center[1] + half_extent},
             {center[2] - half_extent, center[2] + half_extent}}};
  }
};

// Edges of the parallelepiped spanned by (a, b, c) from the origin: three
// from the origin, six across the faces, three into the far corner.
inline std::array<Segment, 12> parallelepiped_edges(const CellVectors& cell) {
  const Vec3 o{0.0, 0.0, 0.0};
  const Vec3& a = cell[0];
  const Vec3& b = cell[1];
  const Vec3& c = cell[2];
  const Vec3 ab = add(a, b);
  const Vec3 ac = add(a, c);
  const Vec3 ba = add(b, a);
  const Vec3 bc = add(b, c);
  const Vec3 ca = add(c, a);
  const Vec3 cb = add(c, b);
  return {{
      {o, a},
      {o, b},
      {o, c},
      {a, ab},
      {a, ac},
      {b, ba},
      {b, bc},
      {c, ca},
      {c, cb},
      {ab, add(ab, c)},
      {ac, add(ac, b)},
      {bc, add(bc, a)},
  }};
}

inline ViewFrame compute_view_frame(const AtomSet& atoms) {
  if (atoms.empty()) throw EmptyStructureError("compute_view_frame: atom set is empty; nothing to frame");

  Vec3 lo = atoms.atoms.front().position;
  Vec3 hi = lo;
  for (const auto& at : atoms.atoms) {
    for (std::size_t d = 0; d < 3; ++d) {
      lo[d] = std::min(lo[d], at.position[d]);
      hi[d] = std::max(hi[d], at.position[d]);
    }
  }

  ViewFrame f;
  const double span = std::max({hi[0] - lo[0], hi[1] - lo[1], hi[2] - lo[2]});
  f.half_extent = span / 2.0;
  for (std::size_t d = 0; d < 3; ++d) f.center[d] = (hi[d] + lo[d]) * 0.5;
  f.cell_edges = parallelepiped_edges(atoms.cell);
  return f;
}

} // namespace xtalview::view
