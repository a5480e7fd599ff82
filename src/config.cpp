#include "config.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace tesim {

std::string read_all(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("Cannot open: " + path);
  std::ostringstream ss; ss << ifs.rdbuf(); return ss.str();
}

void validate(const EnvConfig& cfg) {
  if (cfg.num_nodes <= 0)
    throw ConfigError("num_nodes must be positive, got " + std::to_string(cfg.num_nodes));
  if (cfg.max_interfaces <= 0)
    throw ConfigError("max_interfaces must be positive, got " + std::to_string(cfg.max_interfaces));
  if (cfg.max_steps <= 0)
    throw ConfigError("max_steps must be positive, got " + std::to_string(cfg.max_steps));
  // generated links all get max_capacity; loaded topologies carry their own
  if (cfg.topology_file.empty()) {
    if (!(cfg.max_capacity > 0.0))
      throw ConfigError("max_capacity must be positive when the topology is generated");
  } else if (!(cfg.max_capacity >= 0.0)) {
    throw ConfigError("max_capacity must be non-negative");
  }
}

EnvConfig parse_config_json(const std::string& text) {
  using json = nlohmann::json;
  EnvConfig cfg;
  try {
    auto j = json::parse(text);
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    cfg.num_nodes      = j.value("num_nodes",      cfg.num_nodes);
    cfg.max_interfaces = j.value("max_interfaces", cfg.max_interfaces);
    cfg.max_capacity   = j.value("max_capacity",   cfg.max_capacity);
    cfg.max_steps      = j.value("max_steps",      cfg.max_steps);
    cfg.verbose        = j.value("verbose",        cfg.verbose);
    cfg.topology_file  = j.value("topology_file",  cfg.topology_file);

    if (j.contains("seed") && !j.at("seed").is_null()) {
      const auto& s = j.at("seed");
      if (!s.is_number_unsigned()) throw ConfigError("seed must be a non-negative integer");
      const auto wide = s.get<uint64_t>();
      if (wide > std::numeric_limits<uint32_t>::max())
        throw ConfigError("seed " + std::to_string(wide) + " does not fit in 32 bits");
      cfg.seed = static_cast<uint32_t>(wide);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("bad config json: ") + e.what());
  }
  validate(cfg);
  return cfg;
}

EnvConfig load_config_json(const std::string& path) {
  auto cfg = parse_config_json(read_all(path));
  // relative topology_file is looked up next to the config file
  if (!cfg.topology_file.empty()) {
    const std::filesystem::path topo(cfg.topology_file);
    if (topo.is_relative())
      cfg.topology_file = (std::filesystem::path(path).parent_path() / topo).lexically_normal().string();
  }
  if (cfg.verbose) {
    std::cerr << "[config] " << path << ": nodes=" << cfg.num_nodes
              << " max_if=" << cfg.max_interfaces
              << " cap=" << cfg.max_capacity
              << " steps=" << cfg.max_steps
              << " seed=" << (cfg.seed ? std::to_string(*cfg.seed) : std::string("none"))
              << (cfg.topology_file.empty() ? "" : " topology=" + cfg.topology_file)
              << "\n";
  }
  return cfg;
}

} // namespace tesim
