#include "routing.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <string>

namespace tesim {

RoutingEngine::Adjacency RoutingEngine::build_adjacency(const Topology& topo,
                                                        const LinkState& state) {
  Adjacency adj(std::max(0, topo.num_nodes));
  for (int i = 0; i < topo.num_links(); ++i) {
    if (state[i] == 0) continue;
    const auto& e = topo.links[i].id;
    adj[e.u].push_back(e.v);
    adj[e.v].push_back(e.u);
  }
  for (auto& nb : adj) std::sort(nb.begin(), nb.end());
  return adj;
}

std::vector<int> RoutingEngine::bfs_tree(const Adjacency& adj, int src) {
  std::vector<int> parent(adj.size(), -1);
  if (src < 0 || src >= static_cast<int>(adj.size())) return parent;
  std::queue<int> q;
  parent[src] = src;
  q.push(src);
  while (!q.empty()) {
    const int cur = q.front(); q.pop();
    for (int nb : adj[cur]) {
      if (parent[nb] != -1) continue;
      parent[nb] = cur;
      q.push(nb);
    }
  }
  return parent;
}

static std::vector<int> walk_back_(const std::vector<int>& parent, int src, int dst) {
  std::vector<int> seq;
  if (dst < 0 || dst >= static_cast<int>(parent.size()) || parent[dst] == -1) return seq;
  for (int n = dst; n != src; n = parent[n]) seq.push_back(n);
  seq.push_back(src);
  std::reverse(seq.begin(), seq.end());
  return seq;
}

std::vector<int> RoutingEngine::shortest_path(const Adjacency& adj, int src, int dst) {
  return walk_back_(bfs_tree(adj, src), src, dst);
}

UsageVector RoutingEngine::route(const Topology& topo, const LinkState& state,
                                 const DemandMatrix& demand) {
  if (static_cast<int>(state.size()) != topo.num_links())
    throw std::invalid_argument("link state has " + std::to_string(state.size())
                                + " entries, topology has " + std::to_string(topo.num_links()) + " links");
  if (static_cast<int>(demand.size()) != topo.num_nodes)
    throw std::invalid_argument("demand matrix does not match node count");
  for (const auto& row : demand)
    if (static_cast<int>(row.size()) != topo.num_nodes)
      throw std::invalid_argument("demand matrix is not square");

  UsageVector usage(topo.num_links(), 0.0);
  const auto adj = build_adjacency(topo, state);

  // One BFS tree per source serves every destination of that source
  for (int s = 0; s < topo.num_nodes; ++s) {
    bool any = false;
    for (int d = 0; d < topo.num_nodes; ++d) if (d != s && demand[s][d] > 0) { any = true; break; }
    if (!any) continue;

    const auto parent = bfs_tree(adj, s);
    for (int d = 0; d < topo.num_nodes; ++d) {
      const int dem = demand[s][d];
      if (d == s || dem <= 0 || parent[d] == -1) continue;
      for (int n = d; n != s; n = parent[n]) {
        const int idx = topo.link_index(parent[n], n);
        if (idx >= 0) usage[idx] += dem;
      }
    }
  }
  return usage;
}

bool RoutingEngine::is_connected(const Topology& topo, const LinkState& state) {
  if (topo.num_nodes <= 1) return true;
  const auto parent = bfs_tree(build_adjacency(topo, state), 0);
  return std::none_of(parent.begin(), parent.end(), [](int p){ return p == -1; });
}

bool RoutingEngine::is_connected(const Topology& topo) {
  return is_connected(topo, LinkState(topo.num_links(), 1));
}

} // namespace tesim
