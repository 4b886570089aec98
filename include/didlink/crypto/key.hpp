#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <didlink/common/error.hpp>
#include <exception>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace didlink {

    constexpr std::size_t ED25519_PUBLIC_KEY_SIZE = 32;
    constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;

    /// Ed25519 keypair for one DID node
    /// Header-only implementation using keylock for crypto operations
    class Key {
      public:
        /// Generate new Ed25519 keypair from the libsodium CSPRNG
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty() || keypair.public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(key_generation_failed());
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from keypair bytes (private key can be 32 or 64 bytes for Ed25519)
        inline static dp::Result<Key, dp::Error> fromKeypair(const std::vector<uint8_t> &public_key,
                                                             const std::vector<uint8_t> &private_key) {
            if (public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }
            // Ed25519 private key can be 32 bytes (seed) or 64 bytes (seed + public key)
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            keypair.private_key = private_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only (for verification)
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Sign payload with raw private key bytes. Ed25519 signing is deterministic.
        inline static dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &private_key,
                                                                       const std::vector<uint8_t> &payload) {
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            try {
                keylock::keylock crypto(keylock::Algorithm::Ed25519);
                auto result = crypto.sign(payload, private_key);
                if (!result.success) {
                    return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                        dp::Error::io_error(dp::String(result.error_message.c_str())));
                }
                return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
            } catch (const std::exception &e) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        /// Verify signature against raw public key bytes. Malformed input yields false.
        inline static bool verify(const std::vector<uint8_t> &public_key, const std::vector<uint8_t> &payload,
                                  const std::vector<uint8_t> &signature) {
            if (public_key.size() != ED25519_PUBLIC_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
                return false;
            }

            try {
                keylock::keylock crypto(keylock::Algorithm::Ed25519);
                auto result = crypto.verify(payload, signature, public_key);
                return result.success;
            } catch (const std::exception &) {
                return false;
            }
        }

        /// Sign data with this key's private half
        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::invalid_argument("No private key available"));
            }
            return sign(keypair_.private_key, data);
        }

        /// Verify signature with this key's public half
        inline bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &signature) const {
            return verify(keypair_.public_key, data, signature);
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline const std::vector<uint8_t> &getPrivateKey() const { return keypair_.private_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Hex encoded public key
        inline std::string getId() const {
            if (keypair_.public_key.empty()) {
                return "unknown";
            }
            return keylock::keylock::to_hex(keypair_.public_key);
        }

        /// Equality operator (compares public keys)
        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        keylock::KeyPair keypair_;
    };

} // namespace didlink
