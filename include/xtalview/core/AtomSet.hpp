#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "xtalview/core/UnitCell.hpp"

namespace xtalview {

// A flat, finite set of atoms in absolute Cartesian coordinates plus the
// overall cell (unit cell vectors scaled by the repeat counts).
//
// Produced by the Replicator, optionally reduced by a region filter. Filtering
// never mutates an AtomSet; it returns a new one with the same `cell`.
struct AtomSet {
  std::vector<Atom> atoms;
  CellVectors cell{};

  std::size_t size() const { return atoms.size(); }
  bool empty() const { return atoms.empty(); }

  const Vec3& position(std::size_t i) const {
    if (i >= atoms.size()) throw std::out_of_range("AtomSet: index out of range");
    return atoms[i].position;
  }

  std::size_t count_species(const std::string& species) const {
    return static_cast<std::size_t>(std::count_if(atoms.begin(), atoms.end(),
        [&](const Atom& a) { return a.species == species; }));
  }

  // (species, count) in order of first appearance.
  std::vector<std::pair<std::string, std::size_t>> species_counts() const {
    std::vector<std::pair<std::string, std::size_t>> out;
    for (const auto& a : atoms) {
      auto it = std::find_if(out.begin(), out.end(),
                             [&](const auto& kv) { return kv.first == a.species; });
      if (it == out.end()) {
        out.emplace_back(a.species, 1);
      } else {
        ++it->second;
      }
    }
    return out;
  }
};

} // namespace xtalview
