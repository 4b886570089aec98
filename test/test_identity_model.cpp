#include "didlink/identity/did_node.hpp"
#include "didlink/identity/identity_cluster.hpp"
#include <doctest/doctest.h>

using namespace didlink;

namespace {
    DIDNode makeNode(const std::string &label = "laptop") {
        std::vector<uint8_t> pub(32, 0xAB);
        return DIDNode("did:didlink:" + std::string(64, 'a'), pub, label, 1700000000000);
    }
} // namespace

TEST_SUITE("DIDNode Tests") {
    TEST_CASE("New node is active and unlinked") {
        auto node = makeNode();
        CHECK(node.isActive());
        CHECK_FALSE(node.isRevoked());
        CHECK_FALSE(node.hasCluster());
        CHECK_FALSE(node.getClusterId().has_value());
        CHECK_FALSE(node.getRevokedAt().has_value());
        CHECK_FALSE(node.getRevocationReason().has_value());
        CHECK(node.getLabel() == "laptop");
        CHECK(node.getPublicKey().size() == 32);
        CHECK(node.created_at == 1700000000000);
    }

    TEST_CASE("Revocation sets timestamp and reason") {
        auto node = makeNode();
        node.markRevoked(1700000005000, "lost device");

        CHECK(node.isRevoked());
        CHECK(node.getStatus() == DIDStatus::Revoked);
        REQUIRE(node.getRevokedAt().has_value());
        CHECK(node.getRevokedAt().value() == 1700000005000);
        CHECK(node.getRevocationReason().value() == "lost device");
    }

    TEST_CASE("Cluster assignment") {
        auto node = makeNode();
        node.setClusterId("c0ffee");
        CHECK(node.hasCluster());
        CHECK(node.getClusterId().value() == "c0ffee");
    }

    TEST_CASE("Binary serialization keeps every field") {
        auto node = makeNode("phone");
        node.setClusterId("cluster-1");
        node.markRevoked(42, "stolen");

        auto restored = DIDNode::fromBytes(node.toBytes());
        REQUIRE(restored.is_ok());

        const auto &copy = restored.value();
        CHECK(copy.getDID() == node.getDID());
        CHECK(copy.getPublicKey() == node.getPublicKey());
        CHECK(copy.getLabel() == "phone");
        CHECK(copy.getStatus() == DIDStatus::Revoked);
        CHECK(copy.getClusterId().value() == "cluster-1");
        CHECK(copy.created_at == node.created_at);
        CHECK(copy.getRevokedAt().value() == 42);
        CHECK(copy.getRevocationReason().value() == "stolen");
    }

    TEST_CASE("Garbage bytes are rejected") {
        std::vector<uint8_t> garbage = {0x01, 0x02, 0x03};
        CHECK(DIDNode::fromBytes(garbage).is_err());
    }

    TEST_CASE("JSON rendering") {
        auto node = makeNode("say \"hi\"");
        auto json = node.toJson();

        CHECK(json.find("\"status\":\"active\"") != std::string::npos);
        CHECK(json.find("\"cluster_id\":null") != std::string::npos);
        CHECK(json.find("\"revoked_at\":null") != std::string::npos);
        CHECK(json.find("\"label\":\"say \\\"hi\\\"\"") != std::string::npos);
        CHECK(json.find(std::string(64, 'a')) != std::string::npos);
        CHECK(json.find("private") == std::string::npos);

        node.markRevoked(7, "");
        auto revoked_json = node.toJson();
        CHECK(revoked_json.find("\"status\":\"revoked\"") != std::string::npos);
        CHECK(revoked_json.find("\"revoked_at\":7") != std::string::npos);
    }

    TEST_CASE("Status names") {
        CHECK(didStatusToString(DIDStatus::Active) == "active");
        CHECK(didStatusToString(DIDStatus::Revoked) == "revoked");
    }
}

TEST_SUITE("IdentityCluster Tests") {
    TEST_CASE("Members keep insertion order and reject duplicates") {
        IdentityCluster cluster("c1", "alice", 100);
        CHECK(cluster.empty());

        CHECK(cluster.addMember("did:didlink:b"));
        CHECK(cluster.addMember("did:didlink:a"));
        CHECK_FALSE(cluster.addMember("did:didlink:b"));

        REQUIRE(cluster.size() == 2);
        auto members = cluster.getMembers();
        CHECK(members[0] == "did:didlink:b");
        CHECK(members[1] == "did:didlink:a");
        CHECK(cluster.hasMember("did:didlink:a"));
        CHECK_FALSE(cluster.hasMember("did:didlink:c"));
    }

    TEST_CASE("Label can be changed") {
        IdentityCluster cluster("c1", "", 100);
        CHECK(cluster.getLabel().empty());
        cluster.setLabel("work");
        CHECK(cluster.getLabel() == "work");
    }

    TEST_CASE("Binary serialization") {
        IdentityCluster cluster("c1", "alice", 100);
        cluster.addMember("did:didlink:x");
        cluster.addMember("did:didlink:y");

        auto restored = IdentityCluster::fromBytes(cluster.toBytes());
        REQUIRE(restored.is_ok());
        CHECK(restored.value().getClusterId() == "c1");
        CHECK(restored.value().getLabel() == "alice");
        CHECK(restored.value().getMembers() == cluster.getMembers());
        CHECK(restored.value().created_at == 100);
    }

    TEST_CASE("JSON rendering") {
        IdentityCluster unlabeled("c2", "", 5);
        unlabeled.addMember("did:didlink:x");
        auto json = unlabeled.toJson();
        CHECK(json == "{\"cluster_id\":\"c2\",\"label\":null,\"member_dids\":[\"did:didlink:x\"],\"created_at\":5}");
    }
}
