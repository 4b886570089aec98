#pragma once

#include <didlink/common/error.hpp>
#include <didlink/storage/did_store.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace didlink::storage {

    /// Reference DIDStore backed by keyed in-memory maps.
    /// Records live in vectors to keep insertion order; the maps index them.
    class InMemoryDIDStore : public DIDStore {
      public:
        InMemoryDIDStore() = default;

        // === Nodes ===

        inline dp::Result<void, dp::Error> saveNode(const DIDNode &node) override {
            auto did = node.getDID();
            auto it = node_index_.find(did);
            if (it != node_index_.end()) {
                nodes_[it->second] = node;
            } else {
                node_index_[did] = nodes_.size();
                nodes_.push_back(node);
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<DIDNode, dp::Error> getNode(const std::string &did) const override {
            auto it = node_index_.find(did);
            if (it == node_index_.end()) {
                return dp::Result<DIDNode, dp::Error>::err(did_not_found(describe("DID not found", did)));
            }
            return dp::Result<DIDNode, dp::Error>::ok(nodes_[it->second]);
        }

        inline bool hasNode(const std::string &did) const override {
            return node_index_.find(did) != node_index_.end();
        }

        inline std::vector<DIDNode> listNodes() const override { return nodes_; }

        // === Clusters ===

        inline dp::Result<void, dp::Error> saveCluster(const IdentityCluster &cluster) override {
            if (cluster.empty()) {
                return dp::Result<void, dp::Error>::err(
                    dp::Error::invalid_argument("Refusing to store a cluster without members"));
            }
            auto id = cluster.getClusterId();
            auto it = cluster_index_.find(id);
            if (it != cluster_index_.end()) {
                clusters_[it->second] = cluster;
            } else {
                cluster_index_[id] = clusters_.size();
                clusters_.push_back(cluster);
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<IdentityCluster, dp::Error> getCluster(const std::string &cluster_id) const override {
            auto it = cluster_index_.find(cluster_id);
            if (it == cluster_index_.end()) {
                return dp::Result<IdentityCluster, dp::Error>::err(
                    cluster_not_found(describe("Cluster not found", cluster_id)));
            }
            return dp::Result<IdentityCluster, dp::Error>::ok(clusters_[it->second]);
        }

        inline std::vector<IdentityCluster> listClusters() const override { return clusters_; }

        inline dp::Result<void, dp::Error> deleteCluster(const std::string &cluster_id) override {
            auto it = cluster_index_.find(cluster_id);
            if (it == cluster_index_.end()) {
                return dp::Result<void, dp::Error>::err(cluster_not_found(describe("Cluster not found", cluster_id)));
            }

            clusters_.erase(clusters_.begin() + static_cast<std::ptrdiff_t>(it->second));
            cluster_index_.clear();
            for (size_t i = 0; i < clusters_.size(); ++i) {
                cluster_index_[clusters_[i].getClusterId()] = i;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        // === Proofs ===

        inline dp::Result<void, dp::Error> saveProof(const LinkProof &proof) override {
            proofs_.push_back(proof);
            return dp::Result<void, dp::Error>::ok();
        }

        inline std::vector<LinkProof> listProofs() const override { return proofs_; }

        // === Introspection ===

        inline size_t nodeCount() const { return nodes_.size(); }
        inline size_t clusterCount() const { return clusters_.size(); }
        inline size_t proofCount() const { return proofs_.size(); }

        /// Clear the store (for testing)
        inline void clear() {
            nodes_.clear();
            node_index_.clear();
            clusters_.clear();
            cluster_index_.clear();
            proofs_.clear();
        }

      private:
        std::vector<DIDNode> nodes_;
        std::unordered_map<std::string, size_t> node_index_;

        std::vector<IdentityCluster> clusters_;
        std::unordered_map<std::string, size_t> cluster_index_;

        std::vector<LinkProof> proofs_;
    };

} // namespace didlink::storage
