#pragma once

#include <cctype>
#include <datapod/datapod.hpp>
#include <didlink/common/error.hpp>
#include <didlink/crypto/key.hpp>
#include <functional>
#include <keylock/keylock.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace didlink {

    /// Decentralized Identifier for a single node
    /// Format: did:<method>:<method-specific-id>
    /// The method-specific-id is the hex encoded Ed25519 public key, so the
    /// public key can be recovered from the DID alone.
    class DID {
      public:
        static constexpr const char *SCHEME = "did";
        static constexpr const char *DEFAULT_METHOD = "didlink";

        DID() = default;

        /// Parse a DID string (did:<method>:<64 hex chars>)
        inline static dp::Result<DID, dp::Error> parse(const std::string &did_string) {
            if (did_string.size() < 4 || did_string.substr(0, 4) != "did:") {
                return dp::Result<DID, dp::Error>::err(invalid_did("Invalid DID: must start with 'did:'"));
            }

            size_t first_colon = did_string.find(':', 0);
            size_t second_colon = did_string.find(':', first_colon + 1);

            if (second_colon == std::string::npos) {
                return dp::Result<DID, dp::Error>::err(invalid_did("Invalid DID: missing method-specific-id"));
            }

            std::string method = did_string.substr(first_colon + 1, second_colon - first_colon - 1);
            if (!isValidMethod(method)) {
                return dp::Result<DID, dp::Error>::err(
                    invalid_did(describe("Invalid DID method", method.empty() ? "<empty>" : method)));
            }

            std::string method_specific_id = did_string.substr(second_colon + 1);

            // Public key hex = 64 chars
            if (method_specific_id.size() != ED25519_PUBLIC_KEY_SIZE * 2) {
                return dp::Result<DID, dp::Error>::err(
                    invalid_did("Invalid DID: method-specific-id must be 64 hex characters (Ed25519 public key)"));
            }

            for (char c : method_specific_id) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) {
                    return dp::Result<DID, dp::Error>::err(
                        invalid_did("Invalid DID: method-specific-id must be hexadecimal"));
                }
            }

            DID did;
            did.method_ = dp::String(method.c_str());
            did.method_specific_id_ = dp::String(toLower(method_specific_id).c_str());
            return dp::Result<DID, dp::Error>::ok(did);
        }

        /// Derive the DID of a public key. Same input always yields the same DID.
        inline static DID fromPublicKey(const std::vector<uint8_t> &public_key,
                                        const std::string &method = DEFAULT_METHOD) {
            DID did;
            did.method_ = dp::String(method.c_str());
            did.method_specific_id_ = dp::String(keylock::keylock::to_hex(public_key).c_str());
            return did;
        }

        inline static DID fromKey(const Key &key, const std::string &method = DEFAULT_METHOD) {
            return fromPublicKey(key.getPublicKey(), method);
        }

        /// Full DID string (did:<method>:<id>)
        inline std::string toString() const {
            return std::string(SCHEME) + ":" + std::string(method_.c_str()) + ":" +
                   std::string(method_specific_id_.c_str());
        }

        inline std::string getMethod() const { return std::string(method_.c_str()); }

        inline std::string getMethodSpecificId() const { return std::string(method_specific_id_.c_str()); }

        /// Decode the public key carried in the method-specific-id
        inline std::vector<uint8_t> getPublicKey() const {
            if (isEmpty()) {
                return {};
            }
            return keylock::keylock::from_hex(getMethodSpecificId());
        }

        inline bool isEmpty() const { return method_specific_id_.empty(); }

        inline bool operator==(const DID &other) const { return toString() == other.toString(); }

        inline bool operator!=(const DID &other) const { return !(*this == other); }

        inline bool operator<(const DID &other) const { return toString() < other.toString(); }

        inline size_t hash() const { return std::hash<std::string>{}(toString()); }

        auto members() { return std::tie(method_, method_specific_id_); }
        auto members() const { return std::tie(method_, method_specific_id_); }

        /// Method names are non-empty lowercase letters and digits
        inline static bool isValidMethod(const std::string &method) {
            if (method.empty()) {
                return false;
            }
            for (char c : method) {
                if (!std::islower(static_cast<unsigned char>(c)) && !std::isdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
            }
            return true;
        }

      private:
        inline static std::string toLower(std::string value) {
            for (auto &c : value) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return value;
        }

        dp::String method_;
        dp::String method_specific_id_;
    };

    /// Canonical DID string for a public key
    inline std::string deriveDID(const std::vector<uint8_t> &public_key,
                                 const std::string &method = DID::DEFAULT_METHOD) {
        return DID::fromPublicKey(public_key, method).toString();
    }

} // namespace didlink

namespace std {
    template <> struct hash<didlink::DID> {
        size_t operator()(const didlink::DID &did) const { return did.hash(); }
    };
} // namespace std
