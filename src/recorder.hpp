#pragma once
#ifndef TESIM_RECORDER_HPP
#define TESIM_RECORDER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "models.hpp"

namespace tesim {

class NetworkEnv;

// Per-step time series of an environment run, exportable to CSV.
class EpisodeRecorder {
public:
  // Per-link snapshot
  struct LinkSample {
    int    open{1};
    double usage{0.0};
    double capacity{0.0};
    double ratio{0.0};   // usage / capacity, 0 if capacity == 0
  };

  // One datapoint: the state right after reset() (step 0) or after a step()
  struct Sample {
    int    episode{0};
    int    step{0};
    double reward{0.0};
    int    overloaded{0};
    bool   done{false};
    std::vector<LinkSample> links;
  };

  explicit EpisodeRecorder(const Topology* topo) : topo_(topo) {}

  // Starts a new episode and records the post-reset state.
  void record_reset(const NetworkEnv& env);
  void record_step(const NetworkEnv& env, const StepResult& res);

  const std::vector<Sample>& samples() const { return series_; }
  std::vector<Sample> episode(int ep) const;
  int episodes() const { return episode_; }

  // Mean reward per step() over all recorded steps (0 if none).
  double mean_reward() const;
  int max_overloaded() const;

  // Columns: episode,step,link,u,v,open,usage,capacity,ratio,reward,overloaded
  // If max_steps_per_episode > 0, only the first K steps of each episode are written.
  bool export_csv(const std::string& path, size_t max_steps_per_episode = 0) const;

  void clear() { series_.clear(); episode_ = 0; }

private:
  Sample snapshot_(const NetworkEnv& env) const;

private:
  const Topology* topo_;
  int episode_{0};
  std::vector<Sample> series_;
};

} // namespace tesim

#endif // TESIM_RECORDER_HPP
