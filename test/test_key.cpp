#include "didlink/crypto/key.hpp"
#include <doctest/doctest.h>

using namespace didlink;

TEST_SUITE("Key Tests") {
    TEST_CASE("Generate keypair") {
        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());

        const auto &key = key_result.value();
        CHECK(key.getPublicKey().size() == ED25519_PUBLIC_KEY_SIZE);
        CHECK(key.getPrivateKey().size() == 64); // seed + public key
        CHECK(key.hasPrivateKey());
        CHECK(key.getId().size() == 64);
        CHECK(key.getId() != "unknown");
    }

    TEST_CASE("Generated keys are distinct") {
        auto a = Key::generate();
        auto b = Key::generate();
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK(a.value() != b.value());
    }

    TEST_CASE("Sign and verify data") {
        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());

        const auto &key = key_result.value();
        std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

        auto sign_result = key.sign(data);
        REQUIRE(sign_result.is_ok());

        const auto &signature = sign_result.value();
        CHECK(signature.size() == ED25519_SIGNATURE_SIZE);
        CHECK(key.verify(data, signature));

        std::vector<uint8_t> other = {0x01, 0x02, 0x03, 0x04, 0x06};
        CHECK_FALSE(key.verify(other, signature));
    }

    TEST_CASE("Signing is deterministic") {
        auto key = Key::generate().value();
        std::vector<uint8_t> data = {'d', 'i', 'd'};

        auto first = Key::sign(key.getPrivateKey(), data);
        auto second = Key::sign(key.getPrivateKey(), data);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value() == second.value());
    }

    TEST_CASE("Signature from another key does not verify") {
        auto key_a = Key::generate().value();
        auto key_b = Key::generate().value();
        std::vector<uint8_t> data = {0xAA, 0xBB};

        auto sig = key_b.sign(data);
        REQUIRE(sig.is_ok());
        CHECK_FALSE(Key::verify(key_a.getPublicKey(), data, sig.value()));
        CHECK(Key::verify(key_b.getPublicKey(), data, sig.value()));
    }

    TEST_CASE("Malformed inputs verify as false") {
        auto key = Key::generate().value();
        std::vector<uint8_t> data = {0x01};
        auto sig = key.sign(data).value();

        std::vector<uint8_t> short_key(16, 0x00);
        CHECK_FALSE(Key::verify(short_key, data, sig));

        std::vector<uint8_t> short_sig(sig.begin(), sig.begin() + 32);
        CHECK_FALSE(Key::verify(key.getPublicKey(), data, short_sig));
    }

    TEST_CASE("Signing with malformed private key fails") {
        std::vector<uint8_t> bad(10, 0x01);
        auto result = Key::sign(bad, {0x01});
        CHECK(result.is_err());
    }

    TEST_CASE("Load from public key only") {
        auto original = Key::generate().value();

        auto loaded = Key::fromPublicKey(original.getPublicKey());
        REQUIRE(loaded.is_ok());
        CHECK_FALSE(loaded.value().hasPrivateKey());
        CHECK(loaded.value() == original);

        auto sign_result = loaded.value().sign({0x01});
        CHECK(sign_result.is_err());
    }

    TEST_CASE("Load from keypair bytes") {
        auto original = Key::generate().value();

        auto loaded = Key::fromKeypair(original.getPublicKey(), original.getPrivateKey());
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().hasPrivateKey());

        std::vector<uint8_t> data = {0x10, 0x20};
        auto sig = loaded.value().sign(data);
        REQUIRE(sig.is_ok());
        CHECK(original.verify(data, sig.value()));
    }

    TEST_CASE("Reject wrong-size key material") {
        CHECK(Key::fromPublicKey(std::vector<uint8_t>(31, 0)).is_err());
        CHECK(Key::fromKeypair(std::vector<uint8_t>(32, 0), std::vector<uint8_t>(48, 0)).is_err());
    }
}
