#include <clusterlb/cluster/resolver.h>

#include <clusterlb/core/log.h>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace clusterlb::cluster {
namespace {
using tcp = boost::asio::ip::tcp;

// Shared with the completion handlers, so lookups still running in the
// resolver's worker thread after the deadline never touch a dead frame.
struct ResolveOpState {
    explicit ResolveOpState(std::size_t n) : results(n), errors(n), pending(n) {}

    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    std::vector<tcp::resolver::results_type> results;
    std::vector<boost::system::error_code> errors;
    std::size_t pending;
};

// Lets late lookups complete off the caller's thread. Destroying the
// io_context joins the resolver's worker, which may still sit in getaddrinfo.
void DrainDetached(std::shared_ptr<ResolveOpState> st) {
    st->resolver.cancel();
    std::thread([st = std::move(st)] { st->ioc.run(); }).detach();
}

} // namespace

clusterlb::Result<std::vector<Node>> ResolveNodes(const std::vector<Node>& known, std::chrono::milliseconds timeout) {
    if (known.empty()) {
        return clusterlb::Status(clusterlb::StatusCode::invalid_argument, "empty known nodes list");
    }

    auto st = std::make_shared<ResolveOpState>(known.size());

    for (std::size_t i = 0; i < known.size(); ++i) {
        st->resolver.async_resolve(
            known[i].host, std::to_string(known[i].port), tcp::resolver::numeric_service,
            [st, i](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    st->errors[i] = ec;
                } else {
                    st->results[i] = std::move(results);
                }
                --st->pending;
            });
    }

    // Returns early once every lookup has completed.
    st->ioc.run_for(timeout);

    if (st->pending != 0) {
        DrainDetached(std::move(st));
        return clusterlb::Status(clusterlb::StatusCode::timeout, "timed out resolving known nodes");
    }

    std::vector<Node> out;
    for (std::size_t i = 0; i < known.size(); ++i) {
        if (st->errors[i]) {
            clusterlb::log::warn("failed to resolve {}: {}", known[i].ToString(), st->errors[i].message());
            continue;
        }
        for (const auto& entry : st->results[i]) {
            Node node{entry.endpoint().address().to_string(), known[i].port};
            if (std::find(out.begin(), out.end(), node) == out.end()) {
                out.push_back(std::move(node));
            }
        }
    }

    if (out.empty()) {
        return clusterlb::Status(clusterlb::StatusCode::unavailable, "failed to resolve any known node");
    }
    return out;
}

} // namespace clusterlb::cluster
