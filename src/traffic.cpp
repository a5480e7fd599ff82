#include "traffic.hpp"

#include <algorithm>

namespace tesim {

DemandMatrix TrafficDemandGenerator::generate(int num_nodes, std::mt19937& rng) {
  const int n = std::max(0, num_nodes);
  std::uniform_int_distribution<int> dist(0, kMaxDemand - 1);
  DemandMatrix demand(n, std::vector<int>(n, 0));
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      demand[i][j] = dist(rng);
  for (int i = 0; i < n; ++i) demand[i][i] = 0;
  return demand;
}

int64_t TrafficDemandGenerator::total(const DemandMatrix& demand) {
  int64_t s = 0;
  for (const auto& row : demand)
    for (int d : row) s += d;
  return s;
}

} // namespace tesim
