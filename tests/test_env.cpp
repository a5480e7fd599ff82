// tests/test_env.cpp
#include "errors.hpp"
#include "network_env.hpp"
#include "scorer.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace tesim;

static EnvConfig seeded(uint32_t seed, int max_steps = 10, double cap = 100.0) {
  EnvConfig cfg;
  cfg.seed = seed;
  cfg.max_steps = max_steps;
  cfg.max_capacity = cap;
  return cfg;
}

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  // Reset: all links open, observation layout
  {
    NetworkEnv env(seeded(1));
    const int m = env.num_links();
    assert(m >= env.topology().num_nodes - 1);
    assert(env.action_size() == m);
    assert(env.observation_size() == 2 * m);
    assert(!env.ready());

    auto obs = env.reset();
    assert(env.ready());
    assert(static_cast<int>(obs.size()) == 2 * m);
    assert(env.current_step() == 0);
    for (int i = 0; i < m; ++i) {
      assert(obs[2*i + 1] == 1.0f);
      const float ratio = static_cast<float>(env.usage()[i] / env.topology().links[i].capacity);
      assert(obs[2*i] == ratio);
    }
    for (int v : env.link_state()) assert(v == 1);
  }

  // Invalid actions are rejected before any state change
  {
    NetworkEnv env(seeded(2));
    env.reset();
    const auto usage_before = env.usage();
    const auto state_before = env.link_state();

    assert(throws<InvalidActionError>([&]{ env.step(Action(env.num_links() + 1, 0)); }));
    assert(throws<InvalidActionError>([&]{ env.step(Action()); }));
    Action bad(env.num_links(), 1); bad[0] = 2;
    assert(throws<InvalidActionError>([&]{ env.step(bad); }));
    assert(throws<std::invalid_argument>([&]{ env.step(Action(1 + env.num_links(), 1)); }));

    assert(env.current_step() == 0);
    assert(env.usage() == usage_before);
    assert(env.link_state() == state_before);
  }

  // step() before reset()
  {
    NetworkEnv env(seeded(3));
    assert(throws<std::logic_error>([&]{ env.step(Action(env.num_links(), 1)); }));
  }

  // done latches at max_steps, counter keeps going
  {
    NetworkEnv env(seeded(4, 3));
    env.reset();
    const Action open(env.num_links(), 1);
    assert(!env.step(open).done);
    assert(!env.step(open).done);
    assert(env.step(open).done);
    assert(env.current_step() == 3);
    auto r = env.step(open);
    assert(r.done);
    assert(env.current_step() == 4);
    assert(env.done());

    env.reset();
    assert(env.current_step() == 0);
    assert(!env.done());
  }

  // Reward is exactly -count of links with usage > capacity
  {
    NetworkEnv env(seeded(5, 50, 40.0));
    std::mt19937 pol(17);
    std::bernoulli_distribution bit(0.6);
    env.reset();
    int saw_overload = 0;
    for (int s = 0; s < 50; ++s) {
      Action a(env.num_links());
      for (auto& f : a) f = bit(pol) ? 1 : 0;
      auto r = env.step(a);
      const int cnt = OverloadScorer::count_overloaded(env.topology(), env.usage());
      assert(r.info.overloaded_links == cnt);
      assert(r.reward == -static_cast<double>(cnt));
      assert(env.link_state() == a);
      for (int i = 0; i < env.num_links(); ++i) assert(r.observation[2*i + 1] == (a[i] ? 1.0f : 0.0f));
      if (cnt > 0) ++saw_overload;
    }
    assert(saw_overload > 0);
  }

  // All links closed -> nothing carried, no overload
  {
    NetworkEnv env(seeded(6, 10, 1.0));
    env.reset();
    auto r = env.step(Action(env.num_links(), 0));
    assert(r.reward == 0.0);
    assert(r.info.overloaded_links == 0);
    for (double u : env.usage()) assert(u == 0.0);
    for (int i = 0; i < env.num_links(); ++i) assert(r.observation[2*i] == 0.0f);
  }

  // Capacity far above any aggregate demand -> no overload with all links open
  {
    NetworkEnv env(seeded(7, 10, 1e9));
    env.reset();
    auto r = env.step(Action(env.num_links(), 1));
    assert(r.info.overloaded_links == 0);
    assert(r.reward == 0.0);
  }

  // New demand on every reset, reproducible per seed, independent per instance
  {
    NetworkEnv a(seeded(8)), b(seeded(8));
    assert(a.num_links() == b.num_links());
    for (int i = 0; i < a.num_links(); ++i) assert(a.topology().links[i].id == b.topology().links[i].id);

    a.reset();
    const auto a1 = a.demand();
    a.reset();
    const auto a2 = a.demand();
    assert(a1 != a2);

    b.reset();
    assert(b.demand() == a1);
    b.reset();
    assert(b.demand() == a2);
    for (int i = 0; i < a.topology().num_nodes; ++i) assert(a2[i][i] == 0);
  }

  // Reset reopens every link
  {
    NetworkEnv env(seeded(9));
    env.reset();
    env.step(Action(env.num_links(), 0));
    env.reset();
    for (int v : env.link_state()) assert(v == 1);
  }

  // Zero-capacity link reports ratio 0
  {
    Topology t; t.num_nodes = 2;
    t.add_link(0, 1, 0.0);
    NetworkEnv env(seeded(10), t);
    auto obs = env.reset();
    assert(obs.size() == 2);
    assert(obs[0] == 0.0f);
    assert(obs[1] == 1.0f);
  }

  // Supplied topology
  {
    Topology tri; tri.num_nodes = 3;
    tri.add_link(0, 1, 10.0);
    tri.add_link(1, 2, 10.0);
    tri.add_link(0, 2, 10.0);
    EnvConfig cfg = seeded(11);
    cfg.num_nodes = 99;   // taken from the topology
    NetworkEnv env(cfg, tri);
    assert(env.config().num_nodes == 3);
    assert(env.num_links() == 3);
    env.reset();
    auto r = env.step({1, 1, 0});
    assert(r.observation[5] == 0.0f);
    assert(env.usage()[2] == 0.0);
    // 0<->2 traffic now crosses (0,1) and (1,2)
    const auto& d = env.demand();
    assert(env.usage()[0] >= d[0][2] + d[2][0]);
  }

  // Construction errors
  {
    EnvConfig c;
    c.num_nodes = 0;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c); }));
    c = EnvConfig(); c.max_interfaces = 0;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c); }));
    c = EnvConfig(); c.max_steps = -1;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c); }));
    c = EnvConfig(); c.max_capacity = -5.0;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c); }));

    Topology star; star.num_nodes = 4;
    star.add_link(0, 1, 1.0); star.add_link(0, 2, 1.0); star.add_link(0, 3, 1.0);
    c = EnvConfig(); c.max_interfaces = 2;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, star); }));
    c.max_interfaces = 3;
    NetworkEnv ok(c, star);
    assert(ok.num_links() == 3);
  }

  // Malformed supplied topologies are rejected before anything indexes by node
  {
    EnvConfig c = seeded(15);

    Topology far; far.num_nodes = 2;
    far.add_link(0, 5, 1.0);
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, far); }));

    Topology neg; neg.num_nodes = 2;
    neg.add_link(-1, 1, 1.0);
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, neg); }));

    Topology loop; loop.num_nodes = 2;
    loop.add_link(1, 1, 1.0);
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, loop); }));

    Topology flipped; flipped.num_nodes = 2;
    flipped.links.push_back(Link{LinkId{1, 0}, 1.0});
    flipped.index[LinkId{1, 0}] = 0;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, flipped); }));

    Topology dup; dup.num_nodes = 2;
    dup.add_link(0, 1, 1.0);
    dup.links.push_back(Link{LinkId{0, 1}, 1.0});
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, dup); }));

    Topology unindexed; unindexed.num_nodes = 2;
    unindexed.links.push_back(Link{LinkId{0, 1}, 1.0});
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, unindexed); }));

    Topology neg_cap; neg_cap.num_nodes = 2;
    neg_cap.add_link(0, 1, -1.0);
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, neg_cap); }));

    Topology empty;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c, empty); }));
  }

  // Generated links need a positive capacity
  {
    EnvConfig c = seeded(16);
    c.max_capacity = 0.0;
    assert(throws<ConfigError>([&]{ NetworkEnv e(c); }));
    c.max_capacity = 1e-3;
    NetworkEnv ok(c);
    for (const auto& l : ok.topology().links) assert(l.capacity > 0.0);
  }

  // Generated topology with a cap of 1 keeps its spanning path
  {
    EnvConfig c = seeded(12);
    c.max_interfaces = 1;
    NetworkEnv env(c);
    assert(env.num_links() == c.num_nodes - 1);
  }

  // render() dumps one line per link
  {
    NetworkEnv env(seeded(13));
    std::ostringstream before;
    env.render(before);
    assert(before.str().find("not reset") != std::string::npos);

    env.reset();
    std::ostringstream os;
    env.render(os);
    const auto text = os.str();
    assert(text.find("step 0/10") != std::string::npos);
    size_t lines = 0, pos = 0;
    while ((pos = text.find("  link ", pos)) != std::string::npos) { ++lines; ++pos; }
    assert(static_cast<int>(lines) == env.num_links());
    env.close();
  }

  // Usable through the abstract interface
  {
    NetworkEnv env(seeded(14, 2));
    Environment& e = env;
    auto obs = e.reset();
    assert(static_cast<int>(obs.size()) == e.observation_size());
    auto r = e.step(Action(e.action_size(), 1));
    assert(!r.done);
  }

  std::cout << "test_env: OK\n";
  return 0;
}
