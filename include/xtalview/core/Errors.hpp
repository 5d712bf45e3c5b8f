#pragma once

#include <stdexcept>
#include <string>

namespace xtalview {

// Error taxonomy for the lattice core. Every error is raised at the point of
// validation and propagated to the caller untouched.
struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Non-positive lengths, angles out of range, repeat counts < 1,
// non-positive bond threshold, negative carve radius, bad config values.
struct InvalidParameterError : Error {
  using Error::Error;
};

// An AtomSet with zero atoms reached a stage that needs a structure.
struct EmptyStructureError : Error {
  using Error::Error;
};

// Cell vectors are coplanar/collinear (zero volume).
struct DegenerateGeometryError : Error {
  using Error::Error;
};

} // namespace xtalview
