#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <didlink/common/error.hpp>
#include <didlink/common/logger.hpp>
#include <didlink/identity/did_node.hpp>
#include <didlink/identity/identity_cluster.hpp>
#include <didlink/identity/link_proof.hpp>
#include <didlink/identity/manager_config.hpp>
#include <didlink/storage/did_store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didlink {

    /// Cluster that survives when x and y are merged: the older one, and on
    /// equal creation time the one with the lexicographically smaller id.
    const IdentityCluster &selectSurvivor(const IdentityCluster &x, const IdentityCluster &y);

    /// Orchestrates DID creation, linking, revocation and resolution over a
    /// caller-owned DIDStore. Sole enforcer of the cross-entity invariants:
    ///   - a node's cluster_id names a cluster that lists it as a member
    ///   - clusters never lose members and are never empty
    ///   - revocation is terminal and affects exactly one node
    ///   - every operation fully succeeds or leaves the store untouched
    ///
    /// Mutations take the store's exclusive lock, reads its shared lock, so
    /// several managers over one store still see a single writer.
    ///
    /// DID arguments are matched in canonical form: a well-formed DID with
    /// uppercase hex finds the same node as its lowercase spelling.
    class DIDManager {
      public:
        explicit DIDManager(storage::DIDStore &store, ManagerConfig config = ManagerConfig{});

        DIDManager(const DIDManager &) = delete;
        DIDManager &operator=(const DIDManager &) = delete;

        // === Mutations ===

        /// Generate a keypair and register an Active, unlinked node.
        /// The returned private key is not kept anywhere; the caller must retain it.
        dp::Result<NewDIDNode, dp::Error> createDID(const std::string &label);

        /// Link two DIDs into one cluster, given proof of control of both keys.
        /// Creates, joins or merges clusters as needed and appends a LinkProof.
        dp::Result<LinkProof, dp::Error> linkDIDs(const std::string &did_a, const std::vector<uint8_t> &private_key_a,
                                                  const std::string &did_b, const std::vector<uint8_t> &private_key_b);

        /// Revoke a single node. Revoking twice returns the node unchanged.
        dp::Result<DIDNode, dp::Error> revokeDID(const std::string &did, const std::string &reason = "");

        dp::Result<IdentityCluster, dp::Error> labelCluster(const std::string &cluster_id, const std::string &label);

        dp::Result<DIDNode, dp::Error> relabelDID(const std::string &did, const std::string &label);

        // === Queries ===

        /// Cluster containing did, or nullopt when it was never linked
        dp::Result<std::optional<IdentityCluster>, dp::Error> resolveIdentity(const std::string &did) const;

        dp::Result<DIDNode, dp::Error> getNode(const std::string &did) const;

        std::vector<DIDNode> listNodes() const;

        std::vector<IdentityCluster> listClusters() const;

        std::vector<LinkProof> listProofs() const;

        /// Proofs naming did on either side, oldest first
        std::vector<LinkProof> proofsFor(const std::string &did) const;

        /// Re-check a proof's signatures against the stored public keys
        dp::Result<bool, dp::Error> verifyProof(const LinkProof &proof) const;

        /// Whether both DIDs currently resolve to the same cluster
        dp::Result<bool, dp::Error> linkStatus(const std::string &did_a, const std::string &did_b) const;

        inline const ManagerConfig &config() const { return config_; }

      private:
        dp::Result<std::optional<IdentityCluster>, dp::Error> clusterOf(const DIDNode &node) const;

        /// 16 random bytes from libsodium, hex encoded, unused in the store
        dp::Result<std::string, dp::Error> newClusterId() const;

        storage::DIDStore &store_;
        ManagerConfig config_;
        log::Logger log_;
    };

} // namespace didlink
