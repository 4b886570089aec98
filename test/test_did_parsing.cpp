#include "didlink/crypto/key.hpp"
#include "didlink/identity/did.hpp"
#include <doctest/doctest.h>
#include <cctype>
#include <unordered_set>

using namespace didlink;

namespace {
    const std::string HEX_ID = "7f83b1657ff1fc53b92dc18148a1d65dfc2d4b1fa3d677284addd200126d9069";
}

TEST_SUITE("DID Parsing Tests") {

    TEST_CASE("Parse valid DID string") {
        auto result = DID::parse("did:didlink:" + HEX_ID);
        REQUIRE(result.is_ok());
        CHECK(result.value().getMethod() == "didlink");
        CHECK(result.value().getMethodSpecificId() == HEX_ID);
        CHECK(result.value().toString() == "did:didlink:" + HEX_ID);
    }

    TEST_CASE("Parse accepts other methods") {
        auto result = DID::parse("did:robot7:" + HEX_ID);
        REQUIRE(result.is_ok());
        CHECK(result.value().getMethod() == "robot7");
    }

    TEST_CASE("Uppercase hex is normalized") {
        std::string upper = HEX_ID;
        for (auto &c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        auto result = DID::parse("did:didlink:" + upper);
        REQUIRE(result.is_ok());
        CHECK(result.value().getMethodSpecificId() == HEX_ID);
    }

    TEST_CASE("Reject invalid DID - wrong scheme") {
        auto result = DID::parse("urn:didlink:" + HEX_ID);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_DID);
    }

    TEST_CASE("Reject invalid DID - bad method") {
        CHECK(DID::parse("did::" + HEX_ID).is_err());
        CHECK(DID::parse("did:Did-Link:" + HEX_ID).is_err());
    }

    TEST_CASE("Reject invalid DID - missing method-specific-id") {
        auto result = DID::parse("did:didlink");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_DID);
    }

    TEST_CASE("Reject invalid DID - wrong length method-specific-id") {
        CHECK(DID::parse("did:didlink:abc123").is_err());
    }

    TEST_CASE("Reject invalid DID - non-hex method-specific-id") {
        auto result = DID::parse("did:didlink:" + std::string(64, 'z'));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_INVALID_DID);
    }

    TEST_CASE("Create DID from Key") {
        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());

        auto did = DID::fromKey(key_result.value());
        CHECK_FALSE(did.isEmpty());
        CHECK(did.getMethod() == "didlink");
        CHECK(did.getMethodSpecificId() == key_result.value().getId());
    }

    TEST_CASE("Derivation is deterministic and recovers the public key") {
        auto key = Key::generate().value();

        auto first = deriveDID(key.getPublicKey());
        auto second = deriveDID(key.getPublicKey());
        CHECK(first == second);

        auto parsed = DID::parse(first);
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().getPublicKey() == key.getPublicKey());
    }

    TEST_CASE("Custom method is carried into the DID") {
        auto key = Key::generate().value();
        auto did = deriveDID(key.getPublicKey(), "fleet");
        CHECK(did.rfind("did:fleet:", 0) == 0);
    }

    TEST_CASE("DID equality and hashing") {
        auto a = DID::parse("did:didlink:" + HEX_ID).value();
        auto b = DID::parse("did:didlink:" + HEX_ID).value();
        CHECK(a == b);

        std::unordered_set<DID> set;
        set.insert(a);
        set.insert(b);
        CHECK(set.size() == 1);
    }

    TEST_CASE("Empty DID") {
        DID did;
        CHECK(did.isEmpty());
        CHECK(did.getPublicKey().empty());
    }
}
