// src/models.hpp
#pragma once
#ifndef TESIM_MODELS_HPP
#define TESIM_MODELS_HPP

#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <algorithm>

namespace tesim {

// Undirected link key, canonical form u < v
struct LinkId {
  int u{-1}, v{-1};
  bool operator<(const LinkId& o) const { return std::tie(u,v) < std::tie(o.u,o.v); }
  bool operator==(const LinkId& o) const { return u==o.u && v==o.v; }
};

inline LinkId mk_edge(int a, int b) { if (a>b) std::swap(a,b); return LinkId{a,b}; }

struct Link {
  LinkId id;
  double capacity{0.0};
};

// Node set [0, num_nodes) plus the ordered link list.
// Link indices are assigned in insertion order and never change.
struct Topology {
  int num_nodes{0};
  std::vector<Link> links;
  std::map<LinkId, int> index;   // canonical (u,v) -> position in links

  int num_links() const { return static_cast<int>(links.size()); }

  bool has_link(int a, int b) const { return index.count(mk_edge(a,b)) > 0; }

  int link_index(int a, int b) const {
    auto it = index.find(mk_edge(a,b)); return it==index.end()? -1 : it->second;
  }

  // Appends (a,b) unless it is already present; returns its index.
  int add_link(int a, int b, double capacity) {
    const LinkId id = mk_edge(a,b);
    auto it = index.find(id);
    if (it != index.end()) return it->second;
    const int idx = num_links();
    links.push_back(Link{id, capacity});
    index[id] = idx;
    return idx;
  }

  std::vector<int> degrees() const {
    std::vector<int> deg(num_nodes > 0 ? num_nodes : 0, 0);
    for (const auto& l : links) { deg[l.id.u]++; deg[l.id.v]++; }
    return deg;
  }
};

using DemandMatrix = std::vector<std::vector<int>>;  // demand[i][j] = traffic i -> j
using LinkState    = std::vector<int>;               // 1 = open, 0 = closed
using UsageVector  = std::vector<double>;
using Observation  = std::vector<float>;             // [2i] usage ratio, [2i+1] open flag
using Action       = std::vector<int>;               // same layout as LinkState

struct StepInfo {
  int overloaded_links{0};
};

struct StepResult {
  Observation observation;
  double      reward{0.0};
  bool        done{false};
  StepInfo    info;
};

} // namespace tesim

#endif // TESIM_MODELS_HPP
