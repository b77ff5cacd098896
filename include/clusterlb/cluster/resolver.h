#pragma once

#include <chrono>
#include <vector>

#include <clusterlb/cluster/node.h>
#include <clusterlb/core/status.h>

namespace clusterlb::cluster {

// Resolves known nodes (hostnames or literals) to one node per distinct
// address, keeping input order and each known node's port. Nodes that fail
// to resolve are logged and skipped. Returns timeout once the deadline
// passes, even if a lookup is still blocked in the system resolver.
//
// Thread-safe: each call uses its own io_context.
clusterlb::Result<std::vector<Node>> ResolveNodes(const std::vector<Node>& known, std::chrono::milliseconds timeout);

} // namespace clusterlb::cluster
