#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"

namespace xtalview::render {

// Drawing parameters shared by every structure in a scene.
struct RenderSettings {
  double atom_size = 300.0;
  double atom_alpha = 0.9;
  double bond_width = 1.5;
  double bond_alpha = 0.4;
  double elev = 20.0; // initial view elevation, degrees
  double azim = 45.0; // initial view azimuth, degrees

  void validate() const {
    if (!(atom_size > 0.0)) throw InvalidParameterError("RenderSettings: atom_size must be > 0");
    if (!(bond_width > 0.0)) throw InvalidParameterError("RenderSettings: bond_width must be > 0");
    if (!(atom_alpha >= 0.0 && atom_alpha <= 1.0)) {
      throw InvalidParameterError("RenderSettings: atom_alpha must be in [0,1]");
    }
    if (!(bond_alpha >= 0.0 && bond_alpha <= 1.0)) {
      throw InvalidParameterError("RenderSettings: bond_alpha must be in [0,1]");
    }
  }
};

struct SpeciesStyle {
  std::string color = "gray";
  std::string edge_color = "black";
};

// species -> style lookup. Unknown species fall back to the default style.
class SpeciesStyleTable {
public:
  SpeciesStyleTable() = default;

  // Ti/Ni colours used for the NiTi phase pictures.
  static SpeciesStyleTable nitinol() {
    SpeciesStyleTable t;
    t.set("Ti", SpeciesStyle{"silver", "black"});
    t.set("Ni", SpeciesStyle{"gold", "black"});
    return t;
  }

  void set(const std::string& species, SpeciesStyle style) {
    if (species.empty()) throw InvalidParameterError("SpeciesStyleTable: species tag must not be empty");
    styles_[species] = std::move(style);
  }

  bool has(const std::string& species) const { return styles_.find(species) != styles_.end(); }

  const SpeciesStyle& resolve(const std::string& species) const {
    auto it = styles_.find(species);
    return (it == styles_.end()) ? fallback_ : it->second;
  }

  void set_fallback(SpeciesStyle style) { fallback_ = std::move(style); }

private:
  std::unordered_map<std::string, SpeciesStyle> styles_;
  SpeciesStyle fallback_;
};

struct RenderGroup {
  std::string species;
  SpeciesStyle style;
  std::vector<std::size_t> idx; // indices into AtomSet::atoms, ascending
};

// One group per species in order of first appearance; styles are resolved
// once here rather than at draw time.
inline std::vector<RenderGroup> build_render_groups(const AtomSet& atoms, const SpeciesStyleTable& styles) {
  std::vector<RenderGroup> groups;
  std::unordered_map<std::string, std::size_t> slot;
  for (std::size_t i = 0; i < atoms.size(); ++i) {
    const std::string& sp = atoms.atoms[i].species;
    auto it = slot.find(sp);
    if (it == slot.end()) {
      it = slot.emplace(sp, groups.size()).first;
      groups.push_back(RenderGroup{sp, styles.resolve(sp), {}});
    }
    groups[it->second].idx.push_back(i);
  }
  return groups;
}

} // namespace xtalview::render
