#pragma once
#ifndef TESIM_TRAFFIC_HPP
#define TESIM_TRAFFIC_HPP

#include <cstdint>
#include <random>

#include "models.hpp"

namespace tesim {

class TrafficDemandGenerator {
public:
  static constexpr int kMaxDemand = 50;  // exclusive upper bound

  // num_nodes x num_nodes matrix, entries uniform in [0, kMaxDemand), zero diagonal.
  // Draws from 'rng' in row-major order, so consecutive calls continue the stream.
  static DemandMatrix generate(int num_nodes, std::mt19937& rng);

  static int64_t total(const DemandMatrix& demand);
};

} // namespace tesim

#endif // TESIM_TRAFFIC_HPP
