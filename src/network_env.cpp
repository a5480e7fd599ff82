#include "network_env.hpp"
#include "errors.hpp"
#include "routing.hpp"
#include "scorer.hpp"
#include "topo_viewer.hpp"
#include "topology.hpp"
#include "traffic.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tesim {

EnvConfig NetworkEnv::checked_(const EnvConfig& cfg) {
  validate(cfg);
  return cfg;
}

std::mt19937 NetworkEnv::make_rng_(const EnvConfig& cfg) {
  if (cfg.seed) return std::mt19937(*cfg.seed);
  std::random_device rd;
  return std::mt19937(rd());
}

Topology NetworkEnv::build_topology_(const EnvConfig& cfg, std::mt19937& rng) {
  if (!cfg.topology_file.empty()) return load_topology_json(cfg.topology_file);
  return TopologyGenerator::generate(cfg.num_nodes, cfg.max_interfaces, cfg.max_capacity, rng);
}

NetworkEnv::NetworkEnv(const EnvConfig& cfg)
  : cfg_(checked_(cfg)),
    rng_(make_rng_(cfg_)),
    topo_(build_topology_(cfg_, rng_))
{
  cfg_.num_nodes = topo_.num_nodes;
  // generated topologies keep their spanning path even above the cap
  if (!cfg_.topology_file.empty()) check_topology_();
  if (cfg_.verbose) {
    std::cerr << "[env] topology: " << topo_.num_nodes << " nodes, "
              << topo_.num_links() << " links"
              << (cfg_.topology_file.empty() ? "" : " (from " + cfg_.topology_file + ")") << "\n";
  }
}

NetworkEnv::NetworkEnv(const EnvConfig& cfg, Topology topo)
  : cfg_(checked_(cfg)),
    rng_(make_rng_(cfg_)),
    topo_(std::move(topo))
{
  validate_topology(topo_);
  cfg_.num_nodes = topo_.num_nodes;
  check_topology_();
  if (cfg_.verbose) {
    std::cerr << "[env] topology: " << topo_.num_nodes << " nodes, "
              << topo_.num_links() << " links (supplied)\n";
  }
}

void NetworkEnv::check_topology_() const {
  if (!TopologyGenerator::respects_interface_cap(topo_, cfg_.max_interfaces))
    throw ConfigError("topology exceeds max_interfaces=" + std::to_string(cfg_.max_interfaces));
}

Observation NetworkEnv::reset() {
  step_ = 0;
  demand_ = TrafficDemandGenerator::generate(topo_.num_nodes, rng_);
  link_open_.assign(topo_.num_links(), 1);
  usage_ = RoutingEngine::route(topo_, link_open_, demand_);
  ready_ = true;
  return observation_();
}

void NetworkEnv::check_action_(const Action& action) const {
  if (static_cast<int>(action.size()) != topo_.num_links()) {
    throw InvalidActionError("action has " + std::to_string(action.size())
                             + " flags, expected " + std::to_string(topo_.num_links()));
  }
  for (size_t i = 0; i < action.size(); ++i) {
    if (action[i] != 0 && action[i] != 1)
      throw InvalidActionError("action flag " + std::to_string(i) + " is "
                               + std::to_string(action[i]) + ", expected 0 or 1");
  }
}

StepResult NetworkEnv::step(const Action& action) {
  check_action_(action);
  if (!ready_) throw std::logic_error("step() called before reset()");

  link_open_ = action;
  usage_ = RoutingEngine::route(topo_, link_open_, demand_);
  const int overloaded = OverloadScorer::count_overloaded(topo_, usage_);

  ++step_;

  StepResult r;
  r.observation = observation_();
  r.reward = -static_cast<double>(overloaded);
  r.done = (step_ >= cfg_.max_steps);
  r.info.overloaded_links = overloaded;
  return r;
}

Observation NetworkEnv::observation_() const {
  Observation obs;
  obs.reserve(2 * topo_.num_links());
  for (int i = 0; i < topo_.num_links(); ++i) {
    obs.push_back(static_cast<float>(OverloadScorer::usage_ratio(topo_.links[i], usage_[i])));
    obs.push_back(link_open_[i] ? 1.0f : 0.0f);
  }
  return obs;
}

void NetworkEnv::render(std::ostream& os) const {
  TopoViewer::render_text(os, topo_, link_open_, usage_, step_, cfg_.max_steps);
}

} // namespace tesim
