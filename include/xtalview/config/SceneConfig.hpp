#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/build/WireBuilder.hpp"
#include "xtalview/config/IniConfig.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/render/RenderGroups.hpp"

namespace xtalview {

enum class RunMode {
  Compare,
  Wire,
};

inline std::string run_mode_name(RunMode m) {
  switch (m) {
    case RunMode::Compare: return "compare";
    case RunMode::Wire: return "wire";
  }
  return "compare";
}

inline RunMode parse_run_mode(const std::string& s) {
  if (s == "compare") return RunMode::Compare;
  if (s == "wire") return RunMode::Wire;
  throw InvalidParameterError("RunConfig: unknown run mode '" + s + "' (expected compare or wire)");
}

// Settings every structure in a run is drawn with. Loaded once and passed by
// const reference to each build call, so both phases of a comparison always
// share them.
struct SharedParams {
  double bond_distance = 3.2; // Angstrom; visual parameter, not physics
  std::optional<std::size_t> expected_atoms;
  render::RenderSettings render;
  render::SpeciesStyleTable styles = render::SpeciesStyleTable::nitinol();
};

// Immutable description of one run.
//
// Sections:
//   [run]          mode
//   [comparison]   bond_distance, expected_atoms
//   [b2]           a, species_a, species_b, repeat
//   [b19p]         a, b, c, beta, species_a, species_b, repeat
//   [wire]         a, length, diameter, axis
//   [render]       atom_size, atom_alpha, bond_width, bond_alpha, elev, azim
//   [species.<X>]  color, edge_color
struct RunConfig {
  RunMode mode = RunMode::Compare;
  SharedParams shared;

  build::B2Params b2;
  build::RepeatCounts b2_repeat{2, 2, 4};

  build::B19pParams b19p;
  build::RepeatCounts b19p_repeat{2, 2, 2};

  build::WireParams wire{build::B2Params{}, 30.0, 15.0, 'z'};
};

namespace detail {

inline build::RepeatCounts read_repeat(const IniConfig& cfg, const std::string& section,
                                       const build::RepeatCounts& def) {
  if (!cfg.has_key(section, "repeat")) return def;
  const auto v = cfg.get_int64_list(section, "repeat", 3);
  for (const auto x : v) {
    if (x < 1 || x > build::kMaxRepeatCount) {
      throw InvalidParameterError("RunConfig: " + section + ".repeat entries must be in [1, " +
                                  std::to_string(build::kMaxRepeatCount) + "]");
    }
  }
  build::RepeatCounts n{static_cast<int>(v[0]), static_cast<int>(v[1]), static_cast<int>(v[2])};
  build::validate_repeat_counts(n);
  return n;
}

inline char read_axis(const IniConfig& cfg, const std::string& section, char def) {
  const std::string s = cfg.get_string(section, "axis", std::string(1, def));
  if (s.size() != 1) throw InvalidParameterError("RunConfig: " + section + ".axis must be x, y or z");
  (void)select::axis_index(s[0]);
  return s[0];
}

} // namespace detail

inline RunConfig load_run_config(const IniConfig& cfg) {
  RunConfig rc;
  rc.mode = parse_run_mode(cfg.get_string("run", "mode", run_mode_name(rc.mode)));

  auto& sh = rc.shared;
  sh.bond_distance = cfg.get_double("comparison", "bond_distance", sh.bond_distance);
  if (!(sh.bond_distance > 0.0)) throw InvalidParameterError("RunConfig: comparison.bond_distance must be > 0");
  if (cfg.has_key("comparison", "expected_atoms")) {
    const std::int64_t n = cfg.get_int64("comparison", "expected_atoms");
    if (n < 1) throw InvalidParameterError("RunConfig: comparison.expected_atoms must be >= 1");
    sh.expected_atoms = static_cast<std::size_t>(n);
  }

  auto& r = sh.render;
  r.atom_size = cfg.get_double("render", "atom_size", r.atom_size);
  r.atom_alpha = cfg.get_double("render", "atom_alpha", r.atom_alpha);
  r.bond_width = cfg.get_double("render", "bond_width", r.bond_width);
  r.bond_alpha = cfg.get_double("render", "bond_alpha", r.bond_alpha);
  r.elev = cfg.get_double("render", "elev", r.elev);
  r.azim = cfg.get_double("render", "azim", r.azim);
  r.validate();

  const std::string prefix = "species.";
  for (const auto& sec : cfg.section_names(prefix)) {
    render::SpeciesStyle st;
    st.color = cfg.get_string(sec, "color", st.color);
    st.edge_color = cfg.get_string(sec, "edge_color", st.edge_color);
    sh.styles.set(sec.substr(prefix.size()), st);
  }

  rc.b2.a = cfg.get_double("b2", "a", rc.b2.a);
  rc.b2.species_a = cfg.get_string("b2", "species_a", rc.b2.species_a);
  rc.b2.species_b = cfg.get_string("b2", "species_b", rc.b2.species_b);
  rc.b2_repeat = detail::read_repeat(cfg, "b2", rc.b2_repeat);

  rc.b19p.a = cfg.get_double("b19p", "a", rc.b19p.a);
  rc.b19p.b = cfg.get_double("b19p", "b", rc.b19p.b);
  rc.b19p.c = cfg.get_double("b19p", "c", rc.b19p.c);
  rc.b19p.beta_deg = cfg.get_double("b19p", "beta", rc.b19p.beta_deg);
  rc.b19p.species_a = cfg.get_string("b19p", "species_a", rc.b19p.species_a);
  rc.b19p.species_b = cfg.get_string("b19p", "species_b", rc.b19p.species_b);
  rc.b19p_repeat = detail::read_repeat(cfg, "b19p", rc.b19p_repeat);

  rc.wire.lattice.a = cfg.get_double("wire", "a", rc.wire.lattice.a);
  rc.wire.lattice.species_a = cfg.get_string("wire", "species_a", rc.wire.lattice.species_a);
  rc.wire.lattice.species_b = cfg.get_string("wire", "species_b", rc.wire.lattice.species_b);
  rc.wire.length = cfg.get_double("wire", "length", rc.wire.length);
  rc.wire.diameter = cfg.get_double("wire", "diameter", rc.wire.diameter);
  rc.wire.axis = detail::read_axis(cfg, "wire", rc.wire.axis);

  return rc;
}

} // namespace xtalview
