#include <clusterlb/cluster/node.h>
#include <clusterlb/core/log.h>
#include <clusterlb/core/metrics.h>
#include <clusterlb/session/session_builder.h>
#include <clusterlb/session/session_config.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> nodes;
    std::string log_level;
    int picks = 9;
    int threads = 1;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--node" && i + 1 < argc) {
            nodes.emplace_back(argv[++i]);
        } else if (a == "--picks" && i + 1 < argc) {
            picks = std::atoi(argv[++i]);
        } else if (a == "--threads" && i + 1 < argc) {
            threads = std::atoi(argv[++i]);
        } else if (a == "--log" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            std::cerr << "usage: " << argv[0]
                      << " [--config file] [--node host:port]... [--picks N] [--threads T] [--log level]\n";
            return 2;
        }
    }
    if (picks < 0 || threads < 1) {
        std::cerr << "--picks must be >= 0 and --threads >= 1\n";
        return 2;
    }

    clusterlb::session::SessionBuilder builder;
    std::uint16_t default_port = clusterlb::cluster::kDefaultPort;

    if (!config_path.empty()) {
        auto cfg = clusterlb::session::LoadSessionConfig(config_path);
        if (!cfg.ok()) {
            std::cerr << "Invalid config: " << cfg.status().ToString() << "\n";
            return 2;
        }
        if (log_level.empty()) {
            log_level = cfg.value().log_level;
        }
        default_port = cfg.value().default_port;
        builder.FromConfig(cfg.value());
    } else if (nodes.empty()) {
        // Local three node test cluster.
        nodes = {"172.42.0.2:9042", "172.42.0.3:9042", "172.42.0.4:9042"};
    }

    // --log wins over the config file.
    clusterlb::log::Init(log_level.empty() ? "info" : log_level);

    for (const auto& n : nodes) {
        auto node = clusterlb::cluster::ParseNode(n, default_port);
        if (!node.ok()) {
            std::cerr << "Invalid --node: " << node.status().ToString() << "\n";
            return 2;
        }
        builder.KnownNodeAddr(std::move(node).value());
    }

    auto session = builder.Build();
    if (!session.ok()) {
        clusterlb::log::error("failed to create session: {}", session.status().ToString());
        return 1;
    }

    auto& s = *session.value();
    std::mutex out_mu;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = t; i < picks; i += threads) {
                auto st = s.Execute([&](const clusterlb::cluster::Node& node) {
                    std::lock_guard<std::mutex> lk(out_mu);
                    std::cout << "request " << i << " -> " << node.ToString() << "\n";
                    return clusterlb::Status::Ok();
                });
                if (!st.ok()) {
                    clusterlb::log::error("request {} failed: {}", i, st.ToString());
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::cout << clusterlb::DefaultMetrics().ToPrometheusText();
    return 0;
}
