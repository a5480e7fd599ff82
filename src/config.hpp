#pragma once
#ifndef TESIM_CONFIG_HPP
#define TESIM_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace tesim {

struct EnvConfig {
  int    num_nodes{6};
  int    max_interfaces{4};     // per-node link cap
  double max_capacity{100.0};   // applied to every generated link
  int    max_steps{10};         // episode horizon
  std::optional<uint32_t> seed; // unset -> seeded from std::random_device
  bool   verbose{false};
  std::string topology_file;    // optional JSON topology; overrides generation
                                // (relative to the config file when loaded from one)
};

// Throws ConfigError on non-positive num_nodes / max_interfaces / max_steps,
// a negative capacity, or a zero capacity when the topology is generated.
void validate(const EnvConfig& cfg);

// JSON keys: num_nodes, max_interfaces, max_capacity, max_steps, seed,
// verbose, topology_file. Missing keys keep their defaults; "seed": null
// leaves the env unseeded; a seed above 2^32-1 is rejected. Result is validated.
// load_config_json also resolves a relative topology_file against the
// directory of 'path'.
EnvConfig parse_config_json(const std::string& text);
EnvConfig load_config_json(const std::string& path);

// Whole file into a string; throws std::runtime_error if unreadable.
std::string read_all(const std::string& path);

} // namespace tesim

#endif // TESIM_CONFIG_HPP
