#pragma once
#ifndef TESIM_TOPO_VIEWER_HPP
#define TESIM_TOPO_VIEWER_HPP

#include <iosfwd>
#include <string>

#include "models.hpp"

namespace tesim {

// Read-only views of a topology and its current link state / usage.
class TopoViewer {
public:
  // One line per link: index, endpoints, open flag, usage / capacity.
  // Empty 'state' or 'usage' (before the first reset) prints the bare topology.
  static void render_text(std::ostream& os, const Topology& topo,
                          const LinkState& state, const UsageVector& usage,
                          int step, int max_steps);

  // Graphviz DOT. Closed links dashed, overloaded links red,
  // labels "usage/capacity".
  static std::string export_dot(const Topology& topo,
                                const LinkState& state, const UsageVector& usage);
};

} // namespace tesim

#endif // TESIM_TOPO_VIEWER_HPP
