#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace xtalview::graph {

using NodeId = std::size_t;
using Edge = std::pair<NodeId, NodeId>; // undirected, stored with first < second

// Adjacency list; symmetric for an undirected graph.
using Adjacency = std::vector<std::vector<NodeId>>;

struct EdgeList {
  std::size_t n_nodes = 0;
  std::vector<Edge> edges;

  std::size_t node_count() const { return n_nodes; }
  std::size_t edge_count() const { return edges.size(); }
};

} // namespace xtalview::graph
