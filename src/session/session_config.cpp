#include <clusterlb/session/session_config.h>

namespace clusterlb::session {
namespace {

clusterlb::Status Invalid(std::string message) {
    return clusterlb::Status(clusterlb::StatusCode::invalid_argument, std::move(message));
}

} // namespace

clusterlb::Result<SessionConfig> ParseSessionConfig(const config::Config& cfg) {
    SessionConfig out;

    if (cfg.Has("default_port")) {
        auto port = cfg.GetInt("default_port");
        if (!port.ok()) {
            return port.status();
        }
        if (port.value() <= 0 || port.value() > 65535) {
            return Invalid("default_port out of range");
        }
        out.default_port = static_cast<std::uint16_t>(port.value());
    }

    auto nodes_text = cfg.GetString("known_nodes");
    if (!nodes_text.ok()) {
        return nodes_text.status();
    }
    auto nodes = cluster::ParseNodeList(nodes_text.value(), out.default_port);
    if (!nodes.ok()) {
        return nodes.status();
    }
    if (nodes.value().empty()) {
        return Invalid("known_nodes is empty");
    }
    out.known_nodes = std::move(nodes).value();

    if (cfg.Has("load_balancing")) {
        auto lb = cfg.GetString("load_balancing");
        if (!lb.ok()) {
            return lb.status();
        }
        out.load_balancing = std::move(lb).value();
    }

    if (cfg.Has("log_level")) {
        auto level = cfg.GetString("log_level");
        if (!level.ok()) {
            return level.status();
        }
        out.log_level = std::move(level).value();
    }

    if (cfg.Has("resolve_hostnames")) {
        auto flag = cfg.GetInt("resolve_hostnames");
        if (!flag.ok()) {
            return flag.status();
        }
        if (flag.value() != 0 && flag.value() != 1) {
            return Invalid("resolve_hostnames must be 0 or 1");
        }
        out.resolve_hostnames = flag.value() == 1;
    }

    if (cfg.Has("resolve_timeout_ms")) {
        auto ms = cfg.GetInt("resolve_timeout_ms");
        if (!ms.ok()) {
            return ms.status();
        }
        if (ms.value() <= 0) {
            return Invalid("resolve_timeout_ms must be positive");
        }
        out.resolve_timeout = std::chrono::milliseconds(ms.value());
    }

    return out;
}

clusterlb::Result<SessionConfig> LoadSessionConfig(std::string path) {
    auto cfg = config::Config::LoadFile(std::move(path));
    if (!cfg.ok()) {
        return cfg.status();
    }
    return ParseSessionConfig(cfg.value());
}

} // namespace clusterlb::session
