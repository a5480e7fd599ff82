#include "topology.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tesim {

Topology TopologyGenerator::generate(int num_nodes, int max_interfaces, double capacity,
                                     std::mt19937& rng) {
  Topology topo;
  topo.num_nodes = std::max(0, num_nodes);

  // Step 1: chain a random permutation so the graph is connected
  std::vector<int> order(topo.num_nodes);
  std::iota(order.begin(), order.end(), 0);
  std::shuffle(order.begin(), order.end(), rng);
  for (size_t i = 1; i < order.size(); ++i) topo.add_link(order[i-1], order[i], capacity);

  // Step 2: extra links in random order, bounded by the interface cap
  std::vector<std::pair<int,int>> candidates;
  for (int i = 0; i < topo.num_nodes; ++i)
    for (int j = i + 1; j < topo.num_nodes; ++j)
      if (!topo.has_link(i, j)) candidates.push_back({i, j});
  std::shuffle(candidates.begin(), candidates.end(), rng);

  auto deg = topo.degrees();
  for (const auto& c : candidates) {
    if (deg[c.first] < max_interfaces && deg[c.second] < max_interfaces) {
      topo.add_link(c.first, c.second, capacity);
      deg[c.first]++; deg[c.second]++;
    }
  }
  return topo;
}

bool TopologyGenerator::respects_interface_cap(const Topology& topo, int max_interfaces) {
  for (int d : topo.degrees()) if (d > max_interfaces) return false;
  return true;
}

void validate_topology(const Topology& topo) {
  if (topo.num_nodes <= 0) throw ConfigError("topology num_nodes must be positive");
  if (topo.index.size() != topo.links.size())
    throw ConfigError("topology index out of sync with link list");

  for (int i = 0; i < topo.num_links(); ++i) {
    const Link& l = topo.links[i];
    const std::string name = std::to_string(l.id.u) + "-" + std::to_string(l.id.v);
    if (l.id.u < 0 || l.id.v < 0 || l.id.u >= topo.num_nodes || l.id.v >= topo.num_nodes)
      throw ConfigError("link endpoint out of range: " + name);
    if (l.id.u == l.id.v) throw ConfigError("self-loop on node " + std::to_string(l.id.u));
    if (l.id.u > l.id.v) throw ConfigError("link " + name + " is not in canonical u<v form");
    if (!(l.capacity >= 0.0)) throw ConfigError("negative capacity on link " + name);

    auto it = topo.index.find(l.id);
    if (it == topo.index.end() || it->second != i)
      throw ConfigError("duplicate or unindexed link " + name);
  }
}

Topology parse_topology_json(const std::string& text) {
  using json = nlohmann::json;
  Topology topo;
  try {
    auto j = json::parse(text);
    topo.num_nodes = j.at("num_nodes").get<int>();
    if (topo.num_nodes <= 0) throw ConfigError("topology num_nodes must be positive");

    for (const auto& e : j.at("links")) {
      const int u = e.at("u").get<int>();
      const int v = e.at("v").get<int>();
      const double cap = e.at("cap").get<double>();
      if (topo.has_link(u, v))
        throw ConfigError("duplicate link " + std::to_string(u) + "-" + std::to_string(v));
      topo.add_link(u, v, cap);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("bad topology json: ") + e.what());
  }
  validate_topology(topo);
  return topo;
}

Topology load_topology_json(const std::string& path) {
  return parse_topology_json(read_all(path));
}

std::string topology_to_json(const Topology& topo) {
  using json = nlohmann::json;
  json j;
  j["num_nodes"] = topo.num_nodes;
  j["links"] = json::array();
  for (const auto& l : topo.links)
    j["links"].push_back({{"u", l.id.u}, {"v", l.id.v}, {"cap", l.capacity}});
  return j.dump(2);
}

} // namespace tesim
