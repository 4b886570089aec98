#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace didlink {

    // ===========================================
    // Identity error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_DID_ALREADY_EXISTS = 200;
    constexpr dp::u32 ERR_DID_NOT_FOUND = 201;
    constexpr dp::u32 ERR_DID_REVOKED = 202;
    constexpr dp::u32 ERR_CLUSTER_NOT_FOUND = 203;
    constexpr dp::u32 ERR_LINK_PROOF_INVALID = 204;
    constexpr dp::u32 ERR_INVALID_DID = 205;
    constexpr dp::u32 ERR_KEY_GENERATION_FAILED = 206;
    constexpr dp::u32 ERR_STORE_IO = 207;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error did_already_exists(const dp::String &msg = "DID already exists") {
        return dp::Error{ERR_DID_ALREADY_EXISTS, msg};
    }

    inline dp::Error did_not_found(const dp::String &msg = "DID not found") { return dp::Error{ERR_DID_NOT_FOUND, msg}; }

    inline dp::Error did_revoked(const dp::String &msg = "DID is revoked") { return dp::Error{ERR_DID_REVOKED, msg}; }

    inline dp::Error cluster_not_found(const dp::String &msg = "Identity cluster not found") {
        return dp::Error{ERR_CLUSTER_NOT_FOUND, msg};
    }

    inline dp::Error link_proof_invalid(const dp::String &msg = "Link proof verification failed") {
        return dp::Error{ERR_LINK_PROOF_INVALID, msg};
    }

    inline dp::Error invalid_did(const dp::String &msg = "Invalid DID") { return dp::Error{ERR_INVALID_DID, msg}; }

    inline dp::Error key_generation_failed(const dp::String &msg = "Failed to generate keypair") {
        return dp::Error{ERR_KEY_GENERATION_FAILED, msg};
    }

    inline dp::Error store_io(const dp::String &msg = "Store I/O failed") { return dp::Error{ERR_STORE_IO, msg}; }

    /// Build a message of the form "<prefix>: <subject>"
    inline dp::String describe(const std::string &prefix, const std::string &subject) {
        return dp::String((prefix + ": " + subject).c_str());
    }

    // ===========================================
    // Classification
    // ===========================================

    /// True for the identity-specific codes above
    inline bool isIdentityError(const dp::Error &err) {
        return err.code >= ERR_DID_ALREADY_EXISTS && err.code <= ERR_STORE_IO;
    }

    inline std::string errorCodeName(dp::u32 code) {
        switch (code) {
        case ERR_DID_ALREADY_EXISTS:
            return "DIDAlreadyExists";
        case ERR_DID_NOT_FOUND:
            return "DIDNotFound";
        case ERR_DID_REVOKED:
            return "DIDRevoked";
        case ERR_CLUSTER_NOT_FOUND:
            return "ClusterNotFound";
        case ERR_LINK_PROOF_INVALID:
            return "LinkProofInvalid";
        case ERR_INVALID_DID:
            return "InvalidDID";
        case ERR_KEY_GENERATION_FAILED:
            return "KeyGenerationFailed";
        case ERR_STORE_IO:
            return "StoreIO";
        default:
            return "unknown";
        }
    }

} // namespace didlink
