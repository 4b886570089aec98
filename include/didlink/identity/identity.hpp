#pragma once

/// Identity module - multi-node DIDs, identity clusters and link proofs

#include "did.hpp"
#include "did_manager.hpp"
#include "did_node.hpp"
#include "identity_cluster.hpp"
#include "link_proof.hpp"
#include "manager_config.hpp"
