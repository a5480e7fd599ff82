// tesim_run: drive a NetworkEnv with a fixed policy and dump the run.
// 用法：./tesim_run --config config/default.json --episodes 3 --policy random --out results/run.csv
#include "config.hpp"
#include "network_env.hpp"
#include "recorder.hpp"
#include "topo_viewer.hpp"
#include "topology.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <string>

using namespace tesim;

static void usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config cfg.json] [--episodes 1] [--policy all-open|all-closed|random]"
               " [--seed N] [--out run.csv] [--dot net.dot] [--topology-out topo.json] [--render]\n";
}

static Action make_action(const std::string& policy, int n, std::mt19937& rng) {
  if (policy == "all-open")   return Action(n, 1);
  if (policy == "all-closed") return Action(n, 0);
  std::bernoulli_distribution bit(0.5);
  Action a(n, 1);
  for (auto& f : a) f = bit(rng) ? 1 : 0;
  return a;
}

// Decimal seed in [0, 2^32-1]; false on junk or overflow.
static bool parse_seed(const char* text, uint32_t& out) {
  if (!text || !*text || *text == '-') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (errno != 0 || *end != '\0' || v > std::numeric_limits<uint32_t>::max()) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

static bool write_text(const std::string& path, const std::string& text) {
  std::ofstream fo(path);
  if (!fo) return false;
  fo << text;
  return static_cast<bool>(fo);
}

int main(int argc, char** argv) {
  std::string config_path, out_csv, dot_path, topo_out;
  std::string policy = "all-open";
  int episodes = 1;
  bool render = false;
  bool seed_given = false;
  uint32_t seed = 0;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&](const std::string& k)->bool{ return a == k && i + 1 < argc; };
    if (need("--config"))            config_path = argv[++i];
    else if (need("--episodes"))     episodes = std::atoi(argv[++i]);
    else if (need("--policy"))       policy = argv[++i];
    else if (need("--seed")) {
      if (!parse_seed(argv[++i], seed)) { std::cerr << "[fatal] --seed must be an integer in [0, 4294967295]\n"; return 1; }
      seed_given = true;
    }
    else if (need("--out"))          out_csv = argv[++i];
    else if (need("--dot"))          dot_path = argv[++i];
    else if (need("--topology-out")) topo_out = argv[++i];
    else if (a == "--render")        render = true;
    else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
    else { std::cerr << "[fatal] unknown argument: " << a << "\n"; usage(argv[0]); return 1; }
  }
  if (policy != "all-open" && policy != "all-closed" && policy != "random") {
    std::cerr << "[fatal] unknown policy: " << policy << "\n";
    return 1;
  }
  if (episodes <= 0) { std::cerr << "[fatal] --episodes must be positive\n"; return 1; }

  try {
    EnvConfig cfg = config_path.empty() ? EnvConfig() : load_config_json(config_path);
    if (seed_given) cfg.seed = seed;
    validate(cfg);

    NetworkEnv env(cfg);
    EpisodeRecorder rec(&env.topology());

    std::mt19937 policy_rng(cfg.seed ? *cfg.seed + 1 : std::random_device{}());

    for (int ep = 0; ep < episodes; ++ep) {
      env.reset();
      rec.record_reset(env);
      if (render) env.render(std::cout);

      bool done = false;
      while (!done) {
        auto res = env.step(make_action(policy, env.num_links(), policy_rng));
        rec.record_step(env, res);
        if (render) env.render(std::cout);
        done = res.done;
      }
    }
    env.close();

    std::cout << "[OK] " << episodes << " episode(s), " << env.num_links() << " links, policy="
              << policy << ", mean_reward=" << std::fixed << std::setprecision(3)
              << rec.mean_reward() << ", max_overloaded=" << rec.max_overloaded() << "\n";

    if (!out_csv.empty()) {
      if (!rec.export_csv(out_csv)) { std::cerr << "[fatal] cannot write " << out_csv << "\n"; return 1; }
      std::cout << "[OK] wrote " << out_csv << "\n";
    }
    if (!dot_path.empty()) {
      if (!write_text(dot_path, TopoViewer::export_dot(env.topology(), env.link_state(), env.usage()))) {
        std::cerr << "[fatal] cannot write " << dot_path << "\n"; return 1;
      }
      std::cout << "[OK] wrote " << dot_path << "\n";
    }
    if (!topo_out.empty()) {
      if (!write_text(topo_out, topology_to_json(env.topology()) + "\n")) {
        std::cerr << "[fatal] cannot write " << topo_out << "\n"; return 1;
      }
      std::cout << "[OK] wrote " << topo_out << "\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
