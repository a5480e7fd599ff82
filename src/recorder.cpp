#include "recorder.hpp"
#include "network_env.hpp"
#include "scorer.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <utility>

namespace tesim {

EpisodeRecorder::Sample EpisodeRecorder::snapshot_(const NetworkEnv& env) const {
  Sample s;
  s.episode = episode_;
  s.step = env.current_step();
  const auto& state = env.link_state();
  const auto& usage = env.usage();
  s.links.reserve(topo_->num_links());
  for (int i = 0; i < topo_->num_links(); ++i) {
    const auto& l = topo_->links[i];
    LinkSample ls;
    ls.open     = (i < static_cast<int>(state.size())) ? state[i] : 1;
    ls.usage    = (i < static_cast<int>(usage.size())) ? usage[i] : 0.0;
    ls.capacity = l.capacity;
    ls.ratio    = OverloadScorer::usage_ratio(l, ls.usage);
    s.links.push_back(ls);
  }
  return s;
}

void EpisodeRecorder::record_reset(const NetworkEnv& env) {
  ++episode_;
  Sample s = snapshot_(env);
  s.overloaded = OverloadScorer::count_overloaded(*topo_, env.usage());
  series_.push_back(std::move(s));
}

void EpisodeRecorder::record_step(const NetworkEnv& env, const StepResult& res) {
  Sample s = snapshot_(env);
  s.reward     = res.reward;
  s.overloaded = res.info.overloaded_links;
  s.done       = res.done;
  series_.push_back(std::move(s));
}

std::vector<EpisodeRecorder::Sample> EpisodeRecorder::episode(int ep) const {
  std::vector<Sample> out;
  for (const auto& s : series_) if (s.episode == ep) out.push_back(s);
  return out;
}

double EpisodeRecorder::mean_reward() const {
  double sum = 0.0; size_t cnt = 0;
  for (const auto& s : series_) {
    if (s.step == 0) continue;   // reset rows carry no reward
    sum += s.reward; ++cnt;
  }
  return cnt ? sum / cnt : 0.0;
}

int EpisodeRecorder::max_overloaded() const {
  int m = 0;
  for (const auto& s : series_) m = std::max(m, s.overloaded);
  return m;
}

bool EpisodeRecorder::export_csv(const std::string& path, size_t max_steps_per_episode) const {
  std::ofstream ofs(path);
  if (!ofs) return false;

  ofs << "episode,step,link,u,v,open,usage,capacity,ratio,reward,overloaded\n";
  for (const auto& s : series_) {
    if (max_steps_per_episode > 0 && static_cast<size_t>(s.step) > max_steps_per_episode) continue;
    for (size_t i = 0; i < s.links.size(); ++i) {
      const auto& l = s.links[i];
      const auto& id = topo_->links[i].id;
      ofs << s.episode << "," << s.step << "," << i << ","
          << id.u << "," << id.v << "," << l.open << ","
          << std::fixed << std::setprecision(6)
          << l.usage << "," << l.capacity << "," << l.ratio << ","
          << s.reward << "," << s.overloaded << "\n";
    }
  }
  return static_cast<bool>(ofs);
}

} // namespace tesim
