#include <clusterlb/cluster/node.h>

#include <charconv>

namespace clusterlb::cluster {
namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

clusterlb::Status BadNode(std::string_view text, const char* why) {
    std::string msg("invalid node '");
    msg.append(text);
    msg.append("': ");
    msg.append(why);
    return clusterlb::Status(clusterlb::StatusCode::invalid_argument, std::move(msg));
}

bool ParsePort(std::string_view s, std::uint16_t& out) {
    if (s.empty()) {
        return false;
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return false;
    }
    if (value == 0 || value > 65535) {
        return false;
    }
    out = static_cast<std::uint16_t>(value);
    return true;
}

} // namespace

std::string Node::ToString() const {
    std::string out;
    if (host.find(':') != std::string::npos) {
        out.push_back('[');
        out.append(host);
        out.push_back(']');
    } else {
        out.append(host);
    }
    out.push_back(':');
    out.append(std::to_string(port));
    return out;
}

clusterlb::Result<Node> ParseNode(std::string_view text, std::uint16_t default_port) {
    auto s = Trim(text);
    if (s.empty()) {
        return BadNode(text, "empty");
    }

    Node node;
    node.port = default_port;

    if (s.front() == '[') {
        auto close = s.find(']');
        if (close == std::string_view::npos) {
            return BadNode(text, "missing ']'");
        }
        node.host = std::string(s.substr(1, close - 1));
        auto rest = s.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':' || !ParsePort(rest.substr(1), node.port)) {
                return BadNode(text, "bad port");
            }
        }
    } else {
        auto first = s.find(':');
        auto last = s.rfind(':');
        if (first != std::string_view::npos && first == last) {
            node.host = std::string(s.substr(0, first));
            if (!ParsePort(s.substr(first + 1), node.port)) {
                return BadNode(text, "bad port");
            }
        } else {
            // no colon, or an unbracketed IPv6 literal
            node.host = std::string(s);
        }
    }

    if (node.host.empty()) {
        return BadNode(text, "empty host");
    }
    if (node.host.find_first_of("[] \t") != std::string::npos) {
        return BadNode(text, "bad host");
    }
    return node;
}

clusterlb::Result<std::vector<Node>> ParseNodeList(std::string_view text, std::uint16_t default_port) {
    std::vector<Node> out;
    while (true) {
        auto comma = text.find(',');
        auto item = Trim(text.substr(0, comma));
        if (!item.empty()) {
            auto r = ParseNode(item, default_port);
            if (!r.ok()) {
                return r.status();
            }
            out.push_back(std::move(r).value());
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace clusterlb::cluster
