#include "scorer.hpp"

#include <algorithm>

namespace tesim {

int OverloadScorer::count_overloaded(const Topology& topo, const UsageVector& usage) {
  int n = 0;
  const int m = std::min(topo.num_links(), static_cast<int>(usage.size()));
  for (int i = 0; i < m; ++i)
    if (overloaded(topo.links[i], usage[i])) ++n;
  return n;
}

std::vector<int> OverloadScorer::overloaded_links(const Topology& topo, const UsageVector& usage) {
  std::vector<int> out;
  const int m = std::min(topo.num_links(), static_cast<int>(usage.size()));
  for (int i = 0; i < m; ++i)
    if (overloaded(topo.links[i], usage[i])) out.push_back(i);
  return out;
}

} // namespace tesim
