#pragma once

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "xtalview/core/Errors.hpp"
#include "xtalview/core/UnitCell.hpp"

namespace xtalview::build {

// Physical parameters for the CsCl-type (B2) cubic cell.
struct B2Params {
  double a = 3.015;            // Angstrom
  std::string species_a = "Ti"; // corner site
  std::string species_b = "Ni"; // body centre
};

// Physical parameters for the monoclinic B19' cell. The unique angle beta
// lies between the a and c axes.
struct B19pParams {
  double a = 2.89;
  double b = 4.12;
  double c = 4.62;
  double beta_deg = 96.8;
  std::string species_a = "Ti";
  std::string species_b = "Ni";
};

namespace detail {

inline void require_positive_length(double v, const char* name, const std::string& who) {
  if (!std::isfinite(v) || v <= 0.0) {
    throw InvalidParameterError(who + ": lattice length " + name + " must be > 0 (got " + std::to_string(v) + ")");
  }
}

inline void require_species(const std::string& s, const std::string& who) {
  if (s.empty()) throw InvalidParameterError(who + ": species tag must not be empty");
}

} // namespace detail

// B2 austenite: orthogonal vectors of length a, species A at (0,0,0) and
// species B at (1/2,1/2,1/2).
inline UnitCell make_b2_cell(const B2Params& p) {
  const std::string who = "make_b2_cell";
  detail::require_positive_length(p.a, "a", who);
  detail::require_species(p.species_a, who);
  detail::require_species(p.species_b, who);

  const CellVectors v{{{p.a, 0.0, 0.0},
                       {0.0, p.a, 0.0},
                       {0.0, 0.0, p.a}}};
  return UnitCell::from_fractional(v, {FractionalSite{p.species_a, {0.0, 0.0, 0.0}},
                                       FractionalSite{p.species_b, {0.5, 0.5, 0.5}}});
}

// B19' martensite: vectors (a,0,0), (0,b,0), (c cos beta, 0, c sin beta).
//
// The four sites are an approximate layout for two formula units, not the
// space-group positions. They are placed in Cartesian coordinates:
//   A (0,0,0), B (a/2,b/2,c/2), A (a/2,0,c/2), B (0,b/2,0)
inline UnitCell make_b19p_cell(const B19pParams& p) {
  const std::string who = "make_b19p_cell";
  detail::require_positive_length(p.a, "a", who);
  detail::require_positive_length(p.b, "b", who);
  detail::require_positive_length(p.c, "c", who);
  if (!std::isfinite(p.beta_deg) || p.beta_deg <= 0.0 || p.beta_deg >= 180.0) {
    throw InvalidParameterError(who + ": beta must lie in (0, 180) degrees (got " + std::to_string(p.beta_deg) + ")");
  }
  detail::require_species(p.species_a, who);
  detail::require_species(p.species_b, who);

  const double beta = p.beta_deg * kDegToRad;
  const CellVectors v{{{p.a, 0.0, 0.0},
                       {0.0, p.b, 0.0},
                       {p.c * std::cos(beta), 0.0, p.c * std::sin(beta)}}};

  std::vector<Atom> atoms{
      Atom{p.species_a, {0.0, 0.0, 0.0}},
      Atom{p.species_b, {p.a / 2, p.b / 2, p.c / 2}},
      Atom{p.species_a, {p.a / 2, 0.0, p.c / 2}},
      Atom{p.species_b, {0.0, p.b / 2, 0.0}},
  };
  return UnitCell(v, std::move(atoms));
}

} // namespace xtalview::build
