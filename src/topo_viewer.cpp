#include "topo_viewer.hpp"
#include "scorer.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace tesim {

void TopoViewer::render_text(std::ostream& os, const Topology& topo,
                             const LinkState& state, const UsageVector& usage,
                             int step, int max_steps) {
  const bool live = static_cast<int>(state.size()) == topo.num_links()
                 && static_cast<int>(usage.size()) == topo.num_links();
  const auto flags = os.flags();
  const auto prec  = os.precision();
  os << "[env] step " << step << "/" << max_steps
     << "  nodes=" << topo.num_nodes << " links=" << topo.num_links()
     << (live ? "" : "  (not reset)") << "\n";

  int overloaded = 0;
  for (int i = 0; i < topo.num_links(); ++i) {
    const auto& l = topo.links[i];
    const int open = live ? state[i] : 1;
    const double u = live ? usage[i] : 0.0;
    const bool over = OverloadScorer::overloaded(l, u);
    if (over) ++overloaded;
    os << "  link " << std::setw(2) << i << "  " << l.id.u << "-" << l.id.v
       << " | open=" << open
       << " | usage=" << std::fixed << std::setprecision(2) << u
       << " / " << l.capacity
       << (over ? "  OVERLOAD" : "") << "\n";
  }
  os.flags(flags);
  os.precision(prec);
  os << "  overloaded=" << overloaded << "\n";
}

std::string TopoViewer::export_dot(const Topology& topo,
                                   const LinkState& state, const UsageVector& usage) {
  const bool live = static_cast<int>(state.size()) == topo.num_links()
                 && static_cast<int>(usage.size()) == topo.num_links();
  std::ostringstream os;
  os << "graph tesim {\n";
  os << "  graph [overlap=false, splines=true];\n";
  os << "  node  [shape=circle, fontsize=10];\n";
  for (int n = 0; n < topo.num_nodes; ++n) os << "  " << n << ";\n";

  for (int i = 0; i < topo.num_links(); ++i) {
    const auto& l = topo.links[i];
    const double u = live ? usage[i] : 0.0;
    os << "  " << l.id.u << " -- " << l.id.v
       << " [label=\"" << u << "/" << l.capacity << "\"";
    if (live && state[i] == 0) os << ", style=dashed";
    if (OverloadScorer::overloaded(l, u)) os << ", color=red";
    os << "];\n";
  }
  os << "}\n";
  return os.str();
}

} // namespace tesim
