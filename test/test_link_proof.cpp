#include "didlink/crypto/key.hpp"
#include "didlink/identity/did.hpp"
#include "didlink/identity/link_proof.hpp"
#include <doctest/doctest.h>
#include <string>

using namespace didlink;

namespace {
    std::string payloadString(const std::vector<uint8_t> &payload) { return std::string(payload.begin(), payload.end()); }

    struct SignedPair {
        Key key_x;
        Key key_y;
        std::string did_x;
        std::string did_y;
        LinkProof proof;
    };

    SignedPair makeSignedPair(dp::i64 ts, const std::string &tag = DEFAULT_LINK_DOMAIN_TAG) {
        auto key_x = Key::generate().value();
        auto key_y = Key::generate().value();
        auto did_x = deriveDID(key_x.getPublicKey());
        auto did_y = deriveDID(key_y.getPublicKey());

        auto payload = buildLinkPayload(tag, did_x, did_y, ts);
        auto sig_x = key_x.sign(payload).value();
        auto sig_y = key_y.sign(payload).value();

        auto proof = LinkProof::create(did_x, sig_x, did_y, sig_y, "cluster", ts);
        return SignedPair{key_x, key_y, did_x, did_y, proof};
    }

    const Key &keyFor(const SignedPair &pair, const std::string &did) {
        return did == pair.did_x ? pair.key_x : pair.key_y;
    }
} // namespace

TEST_SUITE("Link Payload Tests") {
    TEST_CASE("Payload layout") {
        auto payload = buildLinkPayload("tag", "did:x:1", "did:x:2", 1234);
        std::string expected("tag\0did:x:1\0did:x:2\0" "1234", 24);
        CHECK(payloadString(payload) == expected);
    }

    TEST_CASE("Payload does not depend on argument order") {
        auto forward = buildLinkPayload(DEFAULT_LINK_DOMAIN_TAG, "did:x:aaa", "did:x:bbb", 99);
        auto backward = buildLinkPayload(DEFAULT_LINK_DOMAIN_TAG, "did:x:bbb", "did:x:aaa", 99);
        CHECK(forward == backward);
    }

    TEST_CASE("Payload binds domain tag and timestamp") {
        auto base = buildLinkPayload("tag-a", "did:x:1", "did:x:2", 1);
        CHECK(base != buildLinkPayload("tag-b", "did:x:1", "did:x:2", 1));
        CHECK(base != buildLinkPayload("tag-a", "did:x:1", "did:x:2", 2));
        CHECK(base != buildLinkPayload("tag-a", "did:x:1", "did:x:3", 1));
    }
}

TEST_SUITE("LinkProof Tests") {
    TEST_CASE("DIDs are stored in canonical order") {
        auto pair = makeSignedPair(500);
        const auto &proof = pair.proof;

        CHECK(proof.getDidA() < proof.getDidB());
        CHECK(proof.involves(pair.did_x));
        CHECK(proof.involves(pair.did_y));
        CHECK_FALSE(proof.involves("did:didlink:" + std::string(64, '0')));
        CHECK(proof.created_at == 500);
        CHECK(proof.getClusterId() == "cluster");
    }

    TEST_CASE("Signatures follow their DIDs when reordered") {
        auto pair = makeSignedPair(500);
        const auto &proof = pair.proof;
        auto payload = proof.canonicalPayload();

        CHECK(Key::verify(keyFor(pair, proof.getDidA()).getPublicKey(), payload, proof.getSignatureA()));
        CHECK(Key::verify(keyFor(pair, proof.getDidB()).getPublicKey(), payload, proof.getSignatureB()));
    }

    TEST_CASE("Valid proof verifies") {
        auto pair = makeSignedPair(777);
        const auto &proof = pair.proof;
        CHECK(proof.verify(keyFor(pair, proof.getDidA()).getPublicKey(), keyFor(pair, proof.getDidB()).getPublicKey()));
    }

    TEST_CASE("Swapped keys do not verify") {
        auto pair = makeSignedPair(777);
        const auto &proof = pair.proof;
        CHECK_FALSE(
            proof.verify(keyFor(pair, proof.getDidB()).getPublicKey(), keyFor(pair, proof.getDidA()).getPublicKey()));
    }

    TEST_CASE("Wrong domain tag does not verify") {
        auto pair = makeSignedPair(777, "other-protocol/v1");
        const auto &proof = pair.proof;
        auto pub_a = keyFor(pair, proof.getDidA()).getPublicKey();
        auto pub_b = keyFor(pair, proof.getDidB()).getPublicKey();

        CHECK_FALSE(proof.verify(pub_a, pub_b));
        CHECK(proof.verify(pub_a, pub_b, "other-protocol/v1"));
    }

    TEST_CASE("Tampered fields do not verify") {
        auto pair = makeSignedPair(777);
        auto pub_a = keyFor(pair, pair.proof.getDidA()).getPublicKey();
        auto pub_b = keyFor(pair, pair.proof.getDidB()).getPublicKey();

        SUBCASE("timestamp") {
            auto tampered = pair.proof;
            tampered.created_at += 1;
            CHECK_FALSE(tampered.verify(pub_a, pub_b));
        }

        SUBCASE("signature byte") {
            auto tampered = pair.proof;
            tampered.signature_a[0] ^= 0x01;
            CHECK_FALSE(tampered.verify(pub_a, pub_b));
        }

        SUBCASE("truncated signature") {
            auto tampered = pair.proof;
            tampered.signature_b.clear();
            CHECK_FALSE(tampered.verify(pub_a, pub_b));
        }
    }

    TEST_CASE("Binary serialization preserves verifiability") {
        auto pair = makeSignedPair(31337);
        auto restored = LinkProof::fromBytes(pair.proof.toBytes());
        REQUIRE(restored.is_ok());

        const auto &copy = restored.value();
        CHECK(copy.getDidA() == pair.proof.getDidA());
        CHECK(copy.getDidB() == pair.proof.getDidB());
        CHECK(copy.getSignatureA() == pair.proof.getSignatureA());
        CHECK(copy.created_at == 31337);
        CHECK(copy.verify(keyFor(pair, copy.getDidA()).getPublicKey(), keyFor(pair, copy.getDidB()).getPublicKey()));
    }

    TEST_CASE("JSON rendering") {
        auto pair = makeSignedPair(1);
        auto json = pair.proof.toJson();
        CHECK(json.find("\"did_a\":\"" + pair.proof.getDidA() + "\"") != std::string::npos);
        CHECK(json.find("\"signature_a\":\"") != std::string::npos);
        CHECK(json.find("\"created_at\":1}") != std::string::npos);
    }
}
