#pragma once
#ifndef TESIM_TOPOLOGY_HPP
#define TESIM_TOPOLOGY_HPP

#include <random>
#include <string>

#include "models.hpp"

namespace tesim {

class TopologyGenerator {
public:
  // Random topology with every link at 'capacity'.
  // 1) a shuffled node permutation is chained into a spanning path (always added);
  // 2) remaining pairs are tried in shuffled order, accepted only while both
  //    endpoints are below 'max_interfaces'.
  static Topology generate(int num_nodes, int max_interfaces, double capacity,
                           std::mt19937& rng);

  // True if every node's degree is <= max_interfaces.
  static bool respects_interface_cap(const Topology& topo, int max_interfaces);
};

// Throws ConfigError unless num_nodes > 0 and every link has in-range,
// distinct, canonical (u < v) endpoints, a non-negative capacity and a
// matching entry in topo.index.
void validate_topology(const Topology& topo);

// ---- JSON topology files ----
// {"num_nodes": 3, "links": [{"u": 0, "v": 1, "cap": 10}, ...]}
// Throws ConfigError on self-loops, duplicates, out-of-range ids or negative capacity.
Topology parse_topology_json(const std::string& text);
Topology load_topology_json(const std::string& path);
std::string topology_to_json(const Topology& topo);

} // namespace tesim

#endif // TESIM_TOPOLOGY_HPP
