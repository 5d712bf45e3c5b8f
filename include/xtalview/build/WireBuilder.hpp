#pragma once

#include <cmath>
#include <string>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/select/RegionFilter.hpp"

namespace xtalview::build {

// A cylindrical B2 wire carved out of a bulk block.
struct WireParams {
  B2Params lattice;
  double length = 20.0;   // Angstrom, along the wire axis
  double diameter = 10.0; // Angstrom
  char axis = 'z';
};

struct Wire {
  RepeatCounts repeats;
  select::CylinderRegion region;
  AtomSet atoms; // carved, cell = bulk block cell
};

// Block size is floor(extent / a) unit cells per axis: diameter across the
// two axes perpendicular to the wire, length along it.
inline RepeatCounts wire_repeat_counts(const WireParams& p) {
  detail::require_positive_length(p.lattice.a, "a", "build_wire");
  if (!std::isfinite(p.length) || p.length <= 0.0) {
    throw InvalidParameterError("build_wire: length must be > 0 (got " + std::to_string(p.length) + ")");
  }
  if (!std::isfinite(p.diameter) || p.diameter <= 0.0) {
    throw InvalidParameterError("build_wire: diameter must be > 0 (got " + std::to_string(p.diameter) + ")");
  }
  // Cell counts stay in double until they are known to fit the repeat range.
  const double across_d = std::floor(p.diameter / p.lattice.a);
  const double along_d = std::floor(p.length / p.lattice.a);
  if (across_d < 1.0 || along_d < 1.0) {
    throw InvalidParameterError("build_wire: length and diameter must each be at least one lattice parameter");
  }
  const double max_cells = static_cast<double>(kMaxRepeatCount);
  if (across_d > max_cells || along_d > max_cells) {
    throw InvalidParameterError("build_wire: length and diameter must each span at most " +
                                std::to_string(kMaxRepeatCount) + " unit cells (got " +
                                std::to_string(across_d) + " across, " + std::to_string(along_d) +
                                " along)");
  }
  const int across = static_cast<int>(across_d);
  const int along = static_cast<int>(along_d);

  RepeatCounts n{across, across, across};
  switch (select::axis_index(p.axis)) {
    case 0: n.nx = along; break;
    case 1: n.ny = along; break;
    default: n.nz = along; break;
  }
  return n;
}

inline Wire build_wire(const WireParams& p) {
  const UnitCell uc = make_b2_cell(p.lattice);
  Wire w;
  w.repeats = wire_repeat_counts(p);
  const AtomSet bulk = replicate(uc, w.repeats);
  w.region = select::make_centered_cylinder(bulk, p.axis, p.diameter / 2.0);
  w.atoms = select::carve_cylinder(bulk, w.region);
  return w;
}

} // namespace xtalview::build
