#pragma once
#ifndef TESIM_NETWORK_ENV_HPP
#define TESIM_NETWORK_ENV_HPP

#include <iosfwd>
#include <random>

#include "config.hpp"
#include "models.hpp"

namespace tesim {

// Controller-facing contract: a reset/step loop over fixed-size vectors.
class Environment {
public:
  virtual ~Environment() = default;

  virtual Observation reset() = 0;
  virtual StepResult  step(const Action& action) = 0;

  virtual int action_size() const = 0;
  virtual int observation_size() const = 0;
};

//
//  NetworkEnv
//  -----------------------------------------------
//  Fixed topology for the lifetime of the object; every reset() draws a new
//  demand matrix and opens all links, every step() replaces the link state,
//  reroutes all demands and scores overloaded links (reward = -count).
//  done latches once the step counter reaches max_steps; further steps still run.
//
class NetworkEnv : public Environment {
public:
  // Generates (or loads, if cfg.topology_file is set) the topology.
  // Throws ConfigError on invalid configuration or a loaded topology above max_interfaces.
  explicit NetworkEnv(const EnvConfig& cfg = EnvConfig());

  // Uses a caller-supplied topology; cfg.num_nodes is taken from it.
  // Throws ConfigError on a malformed topology (see validate_topology) or if any
  // node exceeds cfg.max_interfaces.
  NetworkEnv(const EnvConfig& cfg, Topology topo);

  Observation reset() override;

  // Throws InvalidActionError (no state change) if the action does not have one
  // 0/1 flag per link, std::logic_error if reset() was never called.
  StepResult step(const Action& action) override;

  int action_size() const override { return topo_.num_links(); }
  int observation_size() const override { return 2 * topo_.num_links(); }

  // Human-readable per-link dump: open flag, usage, capacity.
  void render(std::ostream& os) const;
  void close() {}

  // ---- read-only state ----
  const EnvConfig&    config()       const { return cfg_; }
  const Topology&     topology()     const { return topo_; }
  const DemandMatrix& demand()       const { return demand_; }
  const LinkState&    link_state()   const { return link_open_; }
  const UsageVector&  usage()        const { return usage_; }
  int                 current_step() const { return step_; }
  int                 num_links()    const { return topo_.num_links(); }
  bool                ready()        const { return ready_; }
  bool                done()         const { return ready_ && step_ >= cfg_.max_steps; }

private:
  static EnvConfig checked_(const EnvConfig& cfg);
  static std::mt19937 make_rng_(const EnvConfig& cfg);
  static Topology build_topology_(const EnvConfig& cfg, std::mt19937& rng);

  void check_topology_() const;
  void check_action_(const Action& action) const;
  Observation observation_() const;

private:
  EnvConfig    cfg_;
  std::mt19937 rng_;       // shared by topology and demand generation
  Topology     topo_;

  DemandMatrix demand_;
  LinkState    link_open_;
  UsageVector  usage_;
  int          step_{0};
  bool         ready_{false};
};

} // namespace tesim

#endif // TESIM_NETWORK_ENV_HPP
