#pragma once
#ifndef TESIM_ROUTING_HPP
#define TESIM_ROUTING_HPP

#include <vector>

#include "models.hpp"

namespace tesim {

// Hop-count routing of every demand as a single unsplit flow over the open links.
class RoutingEngine {
public:
  using Adjacency = std::vector<std::vector<int>>;  // node -> neighbours, ascending

  // Restricted graph: all nodes, only links with state[i] != 0.
  static Adjacency build_adjacency(const Topology& topo, const LinkState& state);

  // BFS predecessor tree rooted at 'src'; parent[src] == src, -1 if unreachable.
  // Neighbours are expanded in ascending id and a node keeps the first parent that
  // reaches it, so equal-length paths always resolve the same way.
  static std::vector<int> bfs_tree(const Adjacency& adj, int src);

  // Node sequence src..dst, empty if dst is unreachable.
  static std::vector<int> shortest_path(const Adjacency& adj, int src, int dst);

  // Per-link usage rebuilt from zero. Unreachable demands are dropped.
  // Throws std::invalid_argument if state or demand do not match the topology.
  static UsageVector route(const Topology& topo, const LinkState& state,
                           const DemandMatrix& demand);

  static bool is_connected(const Topology& topo, const LinkState& state);
  static bool is_connected(const Topology& topo);
};

} // namespace tesim

#endif // TESIM_ROUTING_HPP
