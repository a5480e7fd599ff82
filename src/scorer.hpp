#pragma once
#ifndef TESIM_SCORER_HPP
#define TESIM_SCORER_HPP

#include <vector>

#include "models.hpp"

namespace tesim {

class OverloadScorer {
public:
  // A link is overloaded when usage > capacity (strict).
  static bool overloaded(const Link& link, double usage) { return usage > link.capacity; }

  static int count_overloaded(const Topology& topo, const UsageVector& usage);

  // Indices of overloaded links, ascending.
  static std::vector<int> overloaded_links(const Topology& topo, const UsageVector& usage);

  // usage / capacity, 0 when capacity is 0.
  static double usage_ratio(const Link& link, double usage) {
    return (link.capacity > 0.0) ? usage / link.capacity : 0.0;
  }
};

} // namespace tesim

#endif // TESIM_SCORER_HPP
