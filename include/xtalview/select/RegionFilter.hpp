#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/core/Vec3.hpp"

namespace xtalview::select {

// Keep atoms whose position satisfies `keep`. The result is a stable
// subsequence of `in` and carries the same cell.
template <class Pred>
inline AtomSet filter_atoms(const AtomSet& in, Pred&& keep) {
  AtomSet out;
  out.cell = in.cell;
  out.atoms.reserve(in.size());
  for (const auto& at : in.atoms) {
    if (keep(at.position)) out.atoms.push_back(at);
  }
  return out;
}

// Map an axis letter onto the cell vector index it follows (x->a, y->b, z->c).
inline std::size_t axis_index(char axis) {
  switch (axis) {
    case 'x': case 'a': return 0;
    case 'y': case 'b': return 1;
    case 'z': case 'c': return 2;
  }
  throw InvalidParameterError(std::string("RegionFilter: axis must be x, y or z (got '") + axis + "')");
}

// Infinite or axially bounded cylinder.
//
// contains() is inclusive on both the radius and the axial bounds and uses a
// plain floating comparison, so radius 0 keeps only atoms exactly on the axis.
// Axial coordinates are measured along `direction` from `center`.
struct CylinderRegion {
  Vec3 center{0.0, 0.0, 0.0};
  Vec3 direction{0.0, 0.0, 1.0}; // unit length
  double radius = 0.0;
  double lo = -std::numeric_limits<double>::infinity();
  double hi = std::numeric_limits<double>::infinity();

  double axial_coordinate(const Vec3& p) const {
    return dot(sub(p, center), direction);
  }

  double radial_distance(const Vec3& p) const {
    const Vec3 d = sub(p, center);
    const Vec3 perp = sub(d, scale(direction, dot(d, direction)));
    return norm(perp);
  }

  bool contains(const Vec3& p) const {
    if (radial_distance(p) > radius) return false;
    const double t = axial_coordinate(p);
    return t >= lo && t <= hi;
  }

  void validate() const {
    if (!std::isfinite(radius) || radius < 0.0) {
      throw InvalidParameterError("CylinderRegion: radius must be >= 0 (got " + std::to_string(radius) + ")");
    }
    if (!is_finite(center)) throw InvalidParameterError("CylinderRegion: center has non-finite component");
    const double n = norm(direction);
    if (!std::isfinite(n) || std::abs(n - 1.0) > 1e-9) {
      throw InvalidParameterError("CylinderRegion: direction must be a unit vector");
    }
    if (std::isnan(lo) || std::isnan(hi) || lo > hi) {
      throw InvalidParameterError("CylinderRegion: axial bounds require lo <= hi");
    }
  }
};

// Cylinder along the cell vector selected by `axis`, centred on the midpoint
// of the other two cell vectors.
inline CylinderRegion make_centered_cylinder(const AtomSet& atoms, char axis, double radius) {
  const std::size_t k = axis_index(axis);
  const std::size_t u = (k + 1) % 3;
  const std::size_t v = (k + 2) % 3;

  const Vec3& along = atoms.cell[k];
  const double len = norm(along);
  if (!std::isfinite(len) || len == 0.0) {
    throw DegenerateGeometryError("make_centered_cylinder: cell vector along the axis has zero length");
  }

  CylinderRegion r;
  r.center = scale(add(atoms.cell[u], atoms.cell[v]), 0.5);
  r.direction = {along[0] / len, along[1] / len, along[2] / len};
  r.radius = radius;
  r.validate();
  return r;
}

inline AtomSet carve_cylinder(const AtomSet& in, const CylinderRegion& region) {
  region.validate();
  return filter_atoms(in, [&](const Vec3& p) { return region.contains(p); });
}

} // namespace xtalview::select
