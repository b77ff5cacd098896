#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <clusterlb/cluster/node.h>
#include <clusterlb/config/config.h>
#include <clusterlb/core/status.h>

namespace clusterlb::session {

struct SessionConfig {
    std::vector<cluster::Node> known_nodes;
    std::uint16_t default_port = cluster::kDefaultPort;
    std::string load_balancing = "round_robin";
    std::string log_level = "info";
    bool resolve_hostnames = true;
    std::chrono::milliseconds resolve_timeout{5000};
};

// Keys: known_nodes (required, comma separated), default_port, load_balancing,
// log_level, resolve_hostnames (0/1), resolve_timeout_ms.
clusterlb::Result<SessionConfig> ParseSessionConfig(const config::Config& cfg);

clusterlb::Result<SessionConfig> LoadSessionConfig(std::string path);

} // namespace clusterlb::session
