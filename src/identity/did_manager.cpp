#include <didlink/identity/did_manager.hpp>

#include <didlink/identity/did.hpp>
#include <keylock/keylock.hpp>
#include <mutex>
#include <shared_mutex>
#include <sodium.h>
#include <utility>

namespace didlink {

    namespace {

        constexpr size_t CLUSTER_ID_BYTES = 16;

        using OptionalCluster = std::optional<IdentityCluster>;

        /// Lowercase spelling of a well-formed DID; anything else is looked up verbatim
        std::string canonicalDID(const std::string &did) {
            auto parsed = DID::parse(did);
            return parsed.is_ok() ? parsed.value().toString() : did;
        }

    } // namespace

    const IdentityCluster &selectSurvivor(const IdentityCluster &x, const IdentityCluster &y) {
        if (x.created_at != y.created_at) {
            return x.created_at < y.created_at ? x : y;
        }
        return x.getClusterId() <= y.getClusterId() ? x : y;
    }

    DIDManager::DIDManager(storage::DIDStore &store, ManagerConfig config)
        : store_(store), config_(std::move(config)), log_(log::createLogger("DIDManager")) {}

    // ===========================================
    // Creation
    // ===========================================

    dp::Result<NewDIDNode, dp::Error> DIDManager::createDID(const std::string &label) {
        if (!DID::isValidMethod(config_.did_method)) {
            return dp::Result<NewDIDNode, dp::Error>::err(
                dp::Error::invalid_argument(describe("Invalid DID method", config_.did_method)));
        }

        auto key_result = config_.key_source();
        if (key_result.is_err()) {
            return dp::Result<NewDIDNode, dp::Error>::err(key_generation_failed(key_result.error().message));
        }
        const auto key = key_result.value();
        if (!key.hasPrivateKey()) {
            return dp::Result<NewDIDNode, dp::Error>::err(key_generation_failed("Key source returned no private key"));
        }

        auto did = deriveDID(key.getPublicKey(), config_.did_method);

        std::unique_lock lock(store_.mutex());

        // Collisions are improbable, not impossible
        if (store_.hasNode(did)) {
            log_->warn("refusing to create {}: DID already registered", did);
            return dp::Result<NewDIDNode, dp::Error>::err(did_already_exists(describe("DID already exists", did)));
        }

        DIDNode node(did, key.getPublicKey(), label, config_.clock());
        auto saved = store_.saveNode(node);
        if (saved.is_err()) {
            return dp::Result<NewDIDNode, dp::Error>::err(saved.error());
        }

        log_->info("created {} ({})", did, label);
        return dp::Result<NewDIDNode, dp::Error>::ok(NewDIDNode{node, key.getPrivateKey()});
    }

    // ===========================================
    // Linking
    // ===========================================

    dp::Result<LinkProof, dp::Error> DIDManager::linkDIDs(const std::string &did_a_in,
                                                          const std::vector<uint8_t> &private_key_a,
                                                          const std::string &did_b_in,
                                                          const std::vector<uint8_t> &private_key_b) {
        const std::string did_a = canonicalDID(did_a_in);
        const std::string did_b = canonicalDID(did_b_in);
        if (did_a == did_b) {
            return dp::Result<LinkProof, dp::Error>::err(dp::Error::invalid_argument("Cannot link a DID to itself"));
        }

        std::unique_lock lock(store_.mutex());

        auto node_a_result = store_.getNode(did_a);
        if (node_a_result.is_err()) {
            return dp::Result<LinkProof, dp::Error>::err(node_a_result.error());
        }
        auto node_b_result = store_.getNode(did_b);
        if (node_b_result.is_err()) {
            return dp::Result<LinkProof, dp::Error>::err(node_b_result.error());
        }
        DIDNode node_a = node_a_result.value();
        DIDNode node_b = node_b_result.value();

        // Status is checked before any signature: a revoked node never links
        for (const auto *node : {&node_a, &node_b}) {
            if (node->isRevoked()) {
                log_->warn("link rejected: {} is revoked", node->getDID());
                return dp::Result<LinkProof, dp::Error>::err(
                    did_revoked(describe("Cannot link revoked DID", node->getDID())));
            }
        }

        // Both sides sign the same payload and must verify against stored keys
        const auto timestamp = config_.clock();
        const auto payload = buildLinkPayload(config_.domain_tag, did_a, did_b, timestamp);

        auto sig_a = Key::sign(private_key_a, payload);
        if (sig_a.is_err() || !Key::verify(node_a.getPublicKey(), payload, sig_a.value())) {
            log_->warn("link rejected: key supplied for {} does not match", did_a);
            return dp::Result<LinkProof, dp::Error>::err(
                link_proof_invalid(describe("Private key does not match DID", did_a)));
        }
        auto sig_b = Key::sign(private_key_b, payload);
        if (sig_b.is_err() || !Key::verify(node_b.getPublicKey(), payload, sig_b.value())) {
            log_->warn("link rejected: key supplied for {} does not match", did_b);
            return dp::Result<LinkProof, dp::Error>::err(
                link_proof_invalid(describe("Private key does not match DID", did_b)));
        }

        auto cluster_a_result = clusterOf(node_a);
        if (cluster_a_result.is_err()) {
            return dp::Result<LinkProof, dp::Error>::err(cluster_a_result.error());
        }
        auto cluster_b_result = clusterOf(node_b);
        if (cluster_b_result.is_err()) {
            return dp::Result<LinkProof, dp::Error>::err(cluster_b_result.error());
        }
        const OptionalCluster cluster_a = cluster_a_result.value();
        const OptionalCluster cluster_b = cluster_b_result.value();

        // Plan every write before touching the store
        IdentityCluster target;
        bool cluster_changed = true;
        std::vector<DIDNode> node_updates;
        std::optional<std::string> absorbed_id;

        if (!cluster_a && !cluster_b) {
            auto cluster_id = newClusterId();
            if (cluster_id.is_err()) {
                return dp::Result<LinkProof, dp::Error>::err(cluster_id.error());
            }
            target = IdentityCluster(cluster_id.value(), node_a.getLabel(), timestamp);
            target.addMember(did_a);
            target.addMember(did_b);
            node_a.setClusterId(target.getClusterId());
            node_b.setClusterId(target.getClusterId());
            node_updates = {node_a, node_b};
            log_->info("new cluster {} for {} and {}", target.getClusterId(), did_a, did_b);
        } else if (cluster_a && !cluster_b) {
            target = *cluster_a;
            target.addMember(did_b);
            node_b.setClusterId(target.getClusterId());
            node_updates = {node_b};
            log_->info("{} joined cluster {}", did_b, target.getClusterId());
        } else if (!cluster_a && cluster_b) {
            target = *cluster_b;
            target.addMember(did_a);
            node_a.setClusterId(target.getClusterId());
            node_updates = {node_a};
            log_->info("{} joined cluster {}", did_a, target.getClusterId());
        } else if (cluster_a->getClusterId() == cluster_b->getClusterId()) {
            target = *cluster_a;
            bool added_a = target.addMember(did_a);
            bool added_b = target.addMember(did_b);
            cluster_changed = added_a || added_b;
            log_->debug("{} and {} already share cluster {}", did_a, did_b, target.getClusterId());
        } else {
            const IdentityCluster &survivor = selectSurvivor(*cluster_a, *cluster_b);
            const IdentityCluster &absorbed = (&survivor == &*cluster_a) ? *cluster_b : *cluster_a;

            target = survivor;
            if (target.label.empty()) {
                target.label = absorbed.label;
            }
            for (const auto &member : absorbed.getMembers()) {
                target.addMember(member);
                auto member_result = store_.getNode(member);
                if (member_result.is_err()) {
                    log_->error("cluster {} lists unknown member {}", absorbed.getClusterId(), member);
                    return dp::Result<LinkProof, dp::Error>::err(member_result.error());
                }
                DIDNode moved = member_result.value();
                moved.setClusterId(target.getClusterId());
                node_updates.push_back(moved);
            }
            absorbed_id = absorbed.getClusterId();
            log_->info("merged cluster {} into {} ({} members)", absorbed.getClusterId(), target.getClusterId(),
                       target.size());
        }

        // Commit
        if (cluster_changed) {
            auto saved = store_.saveCluster(target);
            if (saved.is_err()) {
                return dp::Result<LinkProof, dp::Error>::err(saved.error());
            }
        }
        for (const auto &node : node_updates) {
            auto saved = store_.saveNode(node);
            if (saved.is_err()) {
                return dp::Result<LinkProof, dp::Error>::err(saved.error());
            }
        }
        if (absorbed_id) {
            auto deleted = store_.deleteCluster(*absorbed_id);
            if (deleted.is_err()) {
                return dp::Result<LinkProof, dp::Error>::err(deleted.error());
            }
        }

        auto proof = LinkProof::create(did_a, sig_a.value(), did_b, sig_b.value(), target.getClusterId(), timestamp);
        auto saved_proof = store_.saveProof(proof);
        if (saved_proof.is_err()) {
            return dp::Result<LinkProof, dp::Error>::err(saved_proof.error());
        }

        log_->info("linked {} <-> {} in cluster {}", proof.getDidA(), proof.getDidB(), proof.getClusterId());
        return dp::Result<LinkProof, dp::Error>::ok(proof);
    }

    // ===========================================
    // Revocation
    // ===========================================

    dp::Result<DIDNode, dp::Error> DIDManager::revokeDID(const std::string &did_in, const std::string &reason) {
        const std::string did = canonicalDID(did_in);
        std::unique_lock lock(store_.mutex());

        auto node_result = store_.getNode(did);
        if (node_result.is_err()) {
            return node_result;
        }

        DIDNode node = node_result.value();
        if (node.isRevoked()) {
            log_->debug("{} already revoked", did);
            return dp::Result<DIDNode, dp::Error>::ok(node);
        }

        // Cluster membership and every other node stay untouched
        node.markRevoked(config_.clock(), reason);
        auto saved = store_.saveNode(node);
        if (saved.is_err()) {
            return dp::Result<DIDNode, dp::Error>::err(saved.error());
        }

        log_->info("revoked {} ({})", did, reason.empty() ? "no reason given" : reason);
        return dp::Result<DIDNode, dp::Error>::ok(node);
    }

    // ===========================================
    // Labels
    // ===========================================

    dp::Result<IdentityCluster, dp::Error> DIDManager::labelCluster(const std::string &cluster_id,
                                                                    const std::string &label) {
        std::unique_lock lock(store_.mutex());

        auto cluster_result = store_.getCluster(cluster_id);
        if (cluster_result.is_err()) {
            return cluster_result;
        }

        IdentityCluster cluster = cluster_result.value();
        cluster.setLabel(label);
        auto saved = store_.saveCluster(cluster);
        if (saved.is_err()) {
            return dp::Result<IdentityCluster, dp::Error>::err(saved.error());
        }
        return dp::Result<IdentityCluster, dp::Error>::ok(cluster);
    }

    dp::Result<DIDNode, dp::Error> DIDManager::relabelDID(const std::string &did_in, const std::string &label) {
        const std::string did = canonicalDID(did_in);
        std::unique_lock lock(store_.mutex());

        auto node_result = store_.getNode(did);
        if (node_result.is_err()) {
            return node_result;
        }

        DIDNode node = node_result.value();
        node.label = dp::String(label.c_str());
        auto saved = store_.saveNode(node);
        if (saved.is_err()) {
            return dp::Result<DIDNode, dp::Error>::err(saved.error());
        }
        return dp::Result<DIDNode, dp::Error>::ok(node);
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<std::optional<IdentityCluster>, dp::Error> DIDManager::resolveIdentity(const std::string &did_in) const {
        const std::string did = canonicalDID(did_in);
        std::shared_lock lock(store_.mutex());

        auto node_result = store_.getNode(did);
        if (node_result.is_err()) {
            return dp::Result<OptionalCluster, dp::Error>::err(node_result.error());
        }
        return clusterOf(node_result.value());
    }

    dp::Result<DIDNode, dp::Error> DIDManager::getNode(const std::string &did_in) const {
        const std::string did = canonicalDID(did_in);
        std::shared_lock lock(store_.mutex());
        return store_.getNode(did);
    }

    std::vector<DIDNode> DIDManager::listNodes() const {
        std::shared_lock lock(store_.mutex());
        return store_.listNodes();
    }

    std::vector<IdentityCluster> DIDManager::listClusters() const {
        std::shared_lock lock(store_.mutex());
        return store_.listClusters();
    }

    std::vector<LinkProof> DIDManager::listProofs() const {
        std::shared_lock lock(store_.mutex());
        return store_.listProofs();
    }

    std::vector<LinkProof> DIDManager::proofsFor(const std::string &did_in) const {
        const std::string did = canonicalDID(did_in);
        std::shared_lock lock(store_.mutex());
        std::vector<LinkProof> result;
        for (const auto &proof : store_.listProofs()) {
            if (proof.involves(did)) {
                result.push_back(proof);
            }
        }
        return result;
    }

    dp::Result<bool, dp::Error> DIDManager::verifyProof(const LinkProof &proof) const {
        std::shared_lock lock(store_.mutex());

        auto node_a = store_.getNode(proof.getDidA());
        if (node_a.is_err()) {
            return dp::Result<bool, dp::Error>::err(node_a.error());
        }
        auto node_b = store_.getNode(proof.getDidB());
        if (node_b.is_err()) {
            return dp::Result<bool, dp::Error>::err(node_b.error());
        }

        bool valid = proof.verify(node_a.value().getPublicKey(), node_b.value().getPublicKey(), config_.domain_tag);
        return dp::Result<bool, dp::Error>::ok(valid);
    }

    dp::Result<bool, dp::Error> DIDManager::linkStatus(const std::string &did_a, const std::string &did_b) const {
        std::shared_lock lock(store_.mutex());

        auto node_a = store_.getNode(canonicalDID(did_a));
        if (node_a.is_err()) {
            return dp::Result<bool, dp::Error>::err(node_a.error());
        }
        auto node_b = store_.getNode(canonicalDID(did_b));
        if (node_b.is_err()) {
            return dp::Result<bool, dp::Error>::err(node_b.error());
        }

        const auto cluster_a = node_a.value().getClusterId();
        const auto cluster_b = node_b.value().getClusterId();
        return dp::Result<bool, dp::Error>::ok(cluster_a && cluster_b && *cluster_a == *cluster_b);
    }

    // ===========================================
    // Internals (caller holds the store lock)
    // ===========================================

    dp::Result<std::optional<IdentityCluster>, dp::Error> DIDManager::clusterOf(const DIDNode &node) const {
        if (!node.hasCluster()) {
            return dp::Result<OptionalCluster, dp::Error>::ok(OptionalCluster{});
        }

        auto cluster_id = node.getClusterId().value();
        auto cluster_result = store_.getCluster(cluster_id);
        if (cluster_result.is_err()) {
            // A dangling reference is a store bug, not routine control flow
            log_->error("store inconsistency: {} references missing cluster {}", node.getDID(), cluster_id);
            return dp::Result<OptionalCluster, dp::Error>::err(cluster_result.error());
        }
        return dp::Result<OptionalCluster, dp::Error>::ok(OptionalCluster(cluster_result.value()));
    }

    dp::Result<std::string, dp::Error> DIDManager::newClusterId() const {
        if (sodium_init() < 0) {
            return dp::Result<std::string, dp::Error>::err(dp::Error::io_error("libsodium initialization failed"));
        }

        std::string id;
        do {
            std::vector<uint8_t> bytes(CLUSTER_ID_BYTES);
            randombytes_buf(bytes.data(), bytes.size());
            id = keylock::keylock::to_hex(bytes);
        } while (store_.getCluster(id).is_ok());
        return dp::Result<std::string, dp::Error>::ok(id);
    }

} // namespace didlink
