#pragma once

#include <string>
#include <utility>

#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/build/WireBuilder.hpp"
#include "xtalview/config/SceneConfig.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/render/Scene.hpp"

namespace xtalview::app {

struct PhaseComparison {
  UnitCell b2_cell;
  UnitCell b19p_cell;
  render::Scene austenite;
  render::Scene martensite;
};

struct WireScene {
  build::Wire wire;
  render::Scene scene;
};

inline void check_expected_atoms(const SharedParams& sh, const AtomSet& atoms, const std::string& what) {
  if (sh.expected_atoms && atoms.size() != *sh.expected_atoms) {
    throw InvalidParameterError(what + ": produced " + std::to_string(atoms.size()) +
                                " atoms but comparison.expected_atoms = " +
                                std::to_string(*sh.expected_atoms));
  }
}

// Both phases are built from the same RunConfig, so they share bond distance
// and render settings.
inline PhaseComparison build_phase_comparison(const RunConfig& rc) {
  UnitCell b2 = build::make_b2_cell(rc.b2);
  UnitCell b19p = build::make_b19p_cell(rc.b19p);

  AtomSet b2_atoms = build::replicate(b2, rc.b2_repeat);
  AtomSet b19p_atoms = build::replicate(b19p, rc.b19p_repeat);
  check_expected_atoms(rc.shared, b2_atoms, "B2 austenite");
  check_expected_atoms(rc.shared, b19p_atoms, "B19' martensite");

  auto austenite = render::build_scene("B2 Austenite (High Temperature)", std::move(b2_atoms),
                                       rc.shared.bond_distance, rc.shared.styles);
  auto martensite = render::build_scene("B19' Martensite (Low Temperature)", std::move(b19p_atoms),
                                        rc.shared.bond_distance, rc.shared.styles);
  return PhaseComparison{std::move(b2), std::move(b19p), std::move(austenite), std::move(martensite)};
}

inline WireScene build_wire_scene(const RunConfig& rc) {
  WireScene ws;
  ws.wire = build::build_wire(rc.wire);
  ws.scene = render::build_scene("B2 NiTi wire", ws.wire.atoms, rc.shared.bond_distance, rc.shared.styles);
  return ws;
}

} // namespace xtalview::app
