#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#if defined(XTALVIEW_HAS_OPENMP) && XTALVIEW_HAS_OPENMP
  #include <omp.h>
#endif

#include "xtalview/core/AtomSet.hpp"
#include "xtalview/core/Errors.hpp"
#include "xtalview/graph/EdgeList.hpp"

namespace xtalview::graph {

// Proximity graph over an AtomSet, used for drawing bonds only. No bond order
// or chemistry is inferred.
//
// Edges are stored once as (i, j) with i < j, sorted lexicographically, so the
// edge list is identical whichever builder produced it.
struct BondGraph {
  double threshold = 0.0;
  EdgeList edge_list;

  std::size_t node_count() const { return edge_list.n_nodes; }
  std::size_t edge_count() const { return edge_list.edges.size(); }
  const std::vector<Edge>& edges() const { return edge_list.edges; }

  // Order-insensitive membership test.
  bool has_edge(NodeId i, NodeId j) const {
    if (i == j) return false;
    const Edge key = (i < j) ? Edge{i, j} : Edge{j, i};
    return std::binary_search(edge_list.edges.begin(), edge_list.edges.end(), key);
  }

  // Coordination number per atom.
  std::vector<std::size_t> degree() const {
    std::vector<std::size_t> deg(node_count(), 0);
    for (const auto& e : edge_list.edges) {
      ++deg[e.first];
      ++deg[e.second];
    }
    return deg;
  }

  Adjacency adjacency() const {
    Adjacency adj(node_count());
    for (const auto& e : edge_list.edges) {
      adj[e.first].push_back(e.second);
      adj[e.second].push_back(e.first);
    }
    for (auto& nbrs : adj) std::sort(nbrs.begin(), nbrs.end());
    return adj;
  }
};

namespace detail {

inline void validate_bond_inputs(const AtomSet& atoms, double threshold, const std::string& who) {
  if (!std::isfinite(threshold) || threshold <= 0.0) {
    throw InvalidParameterError(who + ": bond threshold must be > 0 (got " + std::to_string(threshold) + ")");
  }
  if (atoms.empty()) throw EmptyStructureError(who + ": atom set is empty");
}

// Strict: atoms exactly at the threshold distance are not bonded.
inline bool bonded(const Vec3& p, const Vec3& q, double threshold) {
  return std::sqrt(distance_sq(p, q)) < threshold;
}

// Concatenate per-atom neighbour rows (each holding j > i, ascending).
inline EdgeList edges_from_rows(std::size_t n, const std::vector<std::vector<NodeId>>& rows) {
  EdgeList el;
  el.n_nodes = n;
  std::size_t total = 0;
  for (const auto& r : rows) total += r.size();
  el.edges.reserve(total);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    for (const NodeId j : rows[i]) el.edges.emplace_back(i, j);
  }
  return el;
}

// Runs fn(i) for every atom index; rows are independent so the loop may be
// spread over OpenMP threads without changing the result.
template <class F>
inline void for_each_row(std::size_t n, F&& fn) {
#if defined(XTALVIEW_HAS_OPENMP) && XTALVIEW_HAS_OPENMP
  #pragma omp parallel for schedule(dynamic, 16)
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    fn(static_cast<std::size_t>(ii));
  }
#else
  for (std::size_t i = 0; i < n; ++i) fn(i);
#endif
}

} // namespace detail

// Reference O(N^2) builder: every pair i < j is tested once.
inline BondGraph build_bond_graph_naive(const AtomSet& atoms, double threshold) {
  detail::validate_bond_inputs(atoms, threshold, "build_bond_graph_naive");

  const std::size_t n = atoms.size();
  std::vector<std::vector<NodeId>> rows(n);
  detail::for_each_row(n, [&](std::size_t i) {
    const Vec3& pi = atoms.atoms[i].position;
    auto& row = rows[i];
    for (std::size_t j = i + 1; j < n; ++j) {
      if (detail::bonded(pi, atoms.atoms[j].position, threshold)) row.push_back(j);
    }
  });

  BondGraph g;
  g.threshold = threshold;
  g.edge_list = detail::edges_from_rows(n, rows);
  return g;
}

// Spatial-bin builder. Bins are at least `threshold` wide, so every bonded
// partner of an atom sits in the same or an adjacent bin. Membership and edge
// order match build_bond_graph_naive.
inline BondGraph build_bond_graph_binned(const AtomSet& atoms, double threshold) {
  detail::validate_bond_inputs(atoms, threshold, "build_bond_graph_binned");

  const std::size_t n = atoms.size();
  Vec3 lo = atoms.atoms[0].position;
  Vec3 hi = lo;
  for (const auto& at : atoms.atoms) {
    for (int d = 0; d < 3; ++d) {
      lo[d] = std::min(lo[d], at.position[d]);
      hi[d] = std::max(hi[d], at.position[d]);
    }
  }
  if (!is_finite(lo) || !is_finite(hi)) {
    throw InvalidParameterError("build_bond_graph_binned: atom positions must be finite");
  }

  // Slightly wider than the threshold so rounding in the bin index never puts
  // a bonded pair two bins apart. Grown further if the grid would be far
  // larger than the atom count.
  const std::size_t max_bins = 8 * n + 64;
  double width = threshold * (1.0 + 1e-6);
  std::array<double,3> nbd{1.0, 1.0, 1.0};
  for (;;) {
    for (int d = 0; d < 3; ++d) nbd[d] = std::floor((hi[d] - lo[d]) / width) + 1.0;
    const double total = nbd[0] * nbd[1] * nbd[2];
    if (total <= static_cast<double>(max_bins)) break;
    width *= std::cbrt(total / static_cast<double>(max_bins)) * 1.01;
  }
  const std::array<std::size_t,3> nb{static_cast<std::size_t>(nbd[0]),
                                     static_cast<std::size_t>(nbd[1]),
                                     static_cast<std::size_t>(nbd[2])};

  auto bin_coord = [&](const Vec3& p) {
    std::array<std::size_t,3> b{};
    for (int d = 0; d < 3; ++d) {
      const auto c = static_cast<std::size_t>(std::floor((p[d] - lo[d]) / width));
      b[d] = std::min(c, nb[d] - 1);
    }
    return b;
  };
  auto flat = [&](std::size_t bx, std::size_t by, std::size_t bz) {
    return bx + nb[0] * (by + nb[1] * bz);
  };

  std::vector<std::vector<NodeId>> bins(nb[0] * nb[1] * nb[2]);
  std::vector<std::array<std::size_t,3>> coord(n);
  for (std::size_t i = 0; i < n; ++i) {
    coord[i] = bin_coord(atoms.atoms[i].position);
    bins[flat(coord[i][0], coord[i][1], coord[i][2])].push_back(i);
  }

  std::vector<std::vector<NodeId>> rows(n);
  detail::for_each_row(n, [&](std::size_t i) {
    const Vec3& pi = atoms.atoms[i].position;
    const auto& c = coord[i];
    auto& row = rows[i];
    for (std::size_t bz = (c[2] > 0 ? c[2] - 1 : 0); bz <= std::min(c[2] + 1, nb[2] - 1); ++bz) {
      for (std::size_t by = (c[1] > 0 ? c[1] - 1 : 0); by <= std::min(c[1] + 1, nb[1] - 1); ++by) {
        for (std::size_t bx = (c[0] > 0 ? c[0] - 1 : 0); bx <= std::min(c[0] + 1, nb[0] - 1); ++bx) {
          for (const NodeId j : bins[flat(bx, by, bz)]) {
            if (j <= i) continue;
            if (detail::bonded(pi, atoms.atoms[j].position, threshold)) row.push_back(j);
          }
        }
      }
    }
    std::sort(row.begin(), row.end());
  });

  BondGraph g;
  g.threshold = threshold;
  g.edge_list = detail::edges_from_rows(n, rows);
  return g;
}

// Atom count above which the binned builder is used.
inline constexpr std::size_t kBinnedBondGraphMinAtoms = 512;

inline BondGraph build_bond_graph(const AtomSet& atoms, double threshold) {
  if (atoms.size() >= kBinnedBondGraphMinAtoms) return build_bond_graph_binned(atoms, threshold);
  return build_bond_graph_naive(atoms, threshold);
}

} // namespace xtalview::graph
