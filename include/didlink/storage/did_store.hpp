#pragma once

#include <datapod/datapod.hpp>
#include <didlink/identity/did_node.hpp>
#include <didlink/identity/identity_cluster.hpp>
#include <didlink/identity/link_proof.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace didlink::storage {

    /// Persistence boundary for nodes, clusters and link proofs.
    ///
    /// A store holds DID -> DIDNode, cluster_id -> IdentityCluster and an
    /// append-only list of LinkProofs. It enforces no cross-entity invariant;
    /// DIDManager does. Implementations must keep this error contract:
    ///   - getNode fails with ERR_DID_NOT_FOUND
    ///   - getCluster / deleteCluster fail with ERR_CLUSTER_NOT_FOUND
    ///   - list* return insertion order; saving an existing key replaces the
    ///     record without moving it
    ///
    /// Store methods are not synchronized themselves. Every DIDManager bound to
    /// a store serializes through mutex(), giving one writer per store.
    class DIDStore {
      public:
        DIDStore() = default;
        virtual ~DIDStore() = default;

        DIDStore(const DIDStore &) = delete;
        DIDStore &operator=(const DIDStore &) = delete;

        // === Nodes ===

        virtual dp::Result<void, dp::Error> saveNode(const DIDNode &node) = 0;
        virtual dp::Result<DIDNode, dp::Error> getNode(const std::string &did) const = 0;
        virtual bool hasNode(const std::string &did) const = 0;
        virtual std::vector<DIDNode> listNodes() const = 0;

        // === Clusters ===

        virtual dp::Result<void, dp::Error> saveCluster(const IdentityCluster &cluster) = 0;
        virtual dp::Result<IdentityCluster, dp::Error> getCluster(const std::string &cluster_id) const = 0;
        virtual std::vector<IdentityCluster> listClusters() const = 0;
        virtual dp::Result<void, dp::Error> deleteCluster(const std::string &cluster_id) = 0;

        // === Proofs (append-only) ===

        virtual dp::Result<void, dp::Error> saveProof(const LinkProof &proof) = 0;
        virtual std::vector<LinkProof> listProofs() const = 0;

        /// Reader/writer lock shared by every manager operating on this store
        inline std::shared_mutex &mutex() const { return mutex_; }

      private:
        mutable std::shared_mutex mutex_;
    };

} // namespace didlink::storage
