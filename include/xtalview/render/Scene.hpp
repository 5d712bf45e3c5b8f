#pragma once

#include <string>
#include <utility>
#include <vector>

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/graph/BondGraph.hpp"
#include "xtalview/render/RenderGroups.hpp"
#include "xtalview/view/ViewFrame.hpp"

namespace xtalview::render {

// Everything a renderer needs to draw one structure. Built once, read-only.
struct Scene {
  std::string title;
  AtomSet atoms;
  graph::BondGraph bonds;
  view::ViewFrame frame;
  std::vector<RenderGroup> groups;
};

inline Scene build_scene(std::string title, AtomSet atoms, double bond_distance,
                         const SpeciesStyleTable& styles) {
  Scene s;
  s.title = std::move(title);
  s.bonds = graph::build_bond_graph(atoms, bond_distance);
  s.frame = view::compute_view_frame(atoms);
  s.groups = build_render_groups(atoms, styles);
  s.atoms = std::move(atoms);
  return s;
}

} // namespace xtalview::render
