#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <clusterlb/core/status.h>

namespace clusterlb::cluster {

inline constexpr std::uint16_t kDefaultPort = 9042;

// An addressable cluster member.
struct Node {
    std::string host;
    std::uint16_t port = kDefaultPort;

    // host:port, with IPv6 hosts bracketed.
    std::string ToString() const;

    bool operator==(const Node& other) const { return host == other.host && port == other.port; }
    bool operator!=(const Node& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Node& node) {
    return os << node.ToString();
}

// Accepts "host", "host:port", "[v6]", "[v6]:port" and bare IPv6 literals.
clusterlb::Result<Node> ParseNode(std::string_view text, std::uint16_t default_port = kDefaultPort);

// Comma separated, e.g. "172.42.0.2,172.42.0.3:19042". Empty items are skipped.
clusterlb::Result<std::vector<Node>> ParseNodeList(std::string_view text, std::uint16_t default_port = kDefaultPort);

} // namespace clusterlb::cluster
