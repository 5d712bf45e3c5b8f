#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "xtalview/core/Errors.hpp"
#include "xtalview/core/Vec3.hpp"

namespace xtalview {

struct Atom {
  std::string species;
  Vec3 position{0.0, 0.0, 0.0}; // Cartesian, Angstrom
};

inline bool operator==(const Atom& lhs, const Atom& rhs) {
  return lhs.species == rhs.species && lhs.position == rhs.position;
}

// Rows are the lattice vectors a, b, c.
using CellVectors = std::array<Vec3,3>;

// Conventional cell parameters: lengths in Angstrom, angles in degrees.
// alpha = angle(b,c), beta = angle(a,c), gamma = angle(a,b).
struct CellParameters {
  double a = 0.0, b = 0.0, c = 0.0;
  double alpha = 0.0, beta = 0.0, gamma = 0.0;
};

// Fractional site used when a cell is described relative to its vectors.
struct FractionalSite {
  std::string species;
  Vec3 frac{0.0, 0.0, 0.0};
};

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;

// Volume below this fraction of |a||b||c| is treated as zero.
inline constexpr double kDegenerateVolumeTol = 1e-10;

inline double signed_cell_volume(const CellVectors& v) {
  return dot(v[0], cross(v[1], v[2]));
}

inline double cell_volume(const CellVectors& v) {
  return std::abs(signed_cell_volume(v));
}

inline CellParameters cell_parameters(const CellVectors& v) {
  auto angle_deg = [](const Vec3& p, const Vec3& q) {
    const double c = dot(p, q) / (norm(p) * norm(q));
    return std::acos(std::max(-1.0, std::min(1.0, c))) * kRadToDeg;
  };
  CellParameters p;
  p.a = norm(v[0]);
  p.b = norm(v[1]);
  p.c = norm(v[2]);
  p.alpha = angle_deg(v[1], v[2]);
  p.beta = angle_deg(v[0], v[2]);
  p.gamma = angle_deg(v[0], v[1]);
  return p;
}

// Throws InvalidParameterError on non-finite components and
// DegenerateGeometryError when the vectors do not span a volume.
inline void validate_cell_vectors(const CellVectors& v, const std::string& who) {
  for (const auto& row : v) {
    if (!is_finite(row)) throw InvalidParameterError(who + ": cell vector has non-finite component");
  }
  const double la = norm(v[0]);
  const double lb = norm(v[1]);
  const double lc = norm(v[2]);
  if (la == 0.0 || lb == 0.0 || lc == 0.0) {
    throw DegenerateGeometryError(who + ": cell vector of zero length");
  }
  if (cell_volume(v) <= kDegenerateVolumeTol * la * lb * lc) {
    throw DegenerateGeometryError(who + ": cell vectors are coplanar (zero volume)");
  }
}

// An immutable periodic cell: three lattice vectors plus the atoms it holds.
class UnitCell {
public:
  UnitCell(CellVectors vectors, std::vector<Atom> atoms)
      : vectors_(vectors), atoms_(std::move(atoms)) {
    validate_cell_vectors(vectors_, "UnitCell");
    if (atoms_.empty()) throw InvalidParameterError("UnitCell: cell must contain at least one atom");
    for (const auto& at : atoms_) {
      if (at.species.empty()) throw InvalidParameterError("UnitCell: atom with empty species tag");
      if (!is_finite(at.position)) {
        throw InvalidParameterError("UnitCell: atom '" + at.species + "' has non-finite position");
      }
    }
  }

  static UnitCell from_fractional(const CellVectors& vectors, const std::vector<FractionalSite>& sites) {
    std::vector<Atom> atoms;
    atoms.reserve(sites.size());
    for (const auto& s : sites) {
      atoms.push_back(Atom{s.species, frac_to_cart_(vectors, s.frac)});
    }
    return UnitCell(vectors, std::move(atoms));
  }

  const CellVectors& vectors() const { return vectors_; }
  const Vec3& a() const { return vectors_[0]; }
  const Vec3& b() const { return vectors_[1]; }
  const Vec3& c() const { return vectors_[2]; }

  const std::vector<Atom>& atoms() const { return atoms_; }
  std::size_t size() const { return atoms_.size(); }

  double volume() const { return cell_volume(vectors_); }
  CellParameters parameters() const { return cell_parameters(vectors_); }

  Vec3 to_cartesian(const Vec3& frac) const { return frac_to_cart_(vectors_, frac); }

  // Inverse of to_cartesian via the reciprocal (cross-product) basis.
  Vec3 to_fractional(const Vec3& r) const {
    const double vol = signed_cell_volume(vectors_);
    return {dot(r, cross(vectors_[1], vectors_[2])) / vol,
            dot(r, cross(vectors_[2], vectors_[0])) / vol,
            dot(r, cross(vectors_[0], vectors_[1])) / vol};
  }

private:
  CellVectors vectors_;
  std::vector<Atom> atoms_;

  static Vec3 frac_to_cart_(const CellVectors& v, const Vec3& f) {
    return add(add(scale(v[0], f[0]), scale(v[1], f[1])), scale(v[2], f[2]));
  }
};

} // namespace xtalview
