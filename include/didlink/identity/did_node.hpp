#pragma once

#include <datapod/datapod.hpp>
#include <didlink/common/json.hpp>
#include <exception>
#include <keylock/keylock.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace didlink {

    /// Node lifecycle status. Revoked is terminal.
    enum class DIDStatus : dp::u8 {
        Active = 0,
        Revoked = 1,
    };

    inline std::string didStatusToString(DIDStatus status) {
        switch (status) {
        case DIDStatus::Active:
            return "active";
        case DIDStatus::Revoked:
            return "revoked";
        default:
            return "unknown";
        }
    }

    /// One node's identity: its DID, public key, label and lifecycle.
    /// Never carries private key material.
    struct DIDNode {
        dp::String did;
        dp::Vector<dp::u8> public_key;
        dp::String label;
        dp::u8 status{static_cast<dp::u8>(DIDStatus::Active)};
        dp::String cluster_id; // Empty when not linked; the cluster's member list is authoritative
        dp::i64 created_at{0};
        dp::i64 revoked_at{0};
        dp::String revocation_reason;

        DIDNode() = default;

        DIDNode(const std::string &did_str, const std::vector<uint8_t> &pub, const std::string &label_str,
                dp::i64 created)
            : did(dp::String(did_str.c_str())), public_key(dp::Vector<dp::u8>(pub.begin(), pub.end())),
              label(dp::String(label_str.c_str())), created_at(created) {}

        inline std::string getDID() const { return std::string(did.c_str()); }

        inline std::vector<uint8_t> getPublicKey() const {
            return std::vector<uint8_t>(public_key.begin(), public_key.end());
        }

        inline std::string getLabel() const { return std::string(label.c_str()); }

        inline DIDStatus getStatus() const { return static_cast<DIDStatus>(status); }

        inline bool isActive() const { return getStatus() == DIDStatus::Active; }

        inline bool isRevoked() const { return getStatus() == DIDStatus::Revoked; }

        inline bool hasCluster() const { return !cluster_id.empty(); }

        inline std::optional<std::string> getClusterId() const {
            if (!hasCluster()) {
                return std::nullopt;
            }
            return std::string(cluster_id.c_str());
        }

        inline std::optional<dp::i64> getRevokedAt() const {
            if (!isRevoked()) {
                return std::nullopt;
            }
            return revoked_at;
        }

        /// Reason given at revocation (possibly empty); nullopt while active
        inline std::optional<std::string> getRevocationReason() const {
            if (!isRevoked()) {
                return std::nullopt;
            }
            return std::string(revocation_reason.c_str());
        }

        inline void setClusterId(const std::string &id) { cluster_id = dp::String(id.c_str()); }

        /// Terminal transition; callers check isRevoked() first
        inline void markRevoked(dp::i64 when, const std::string &reason) {
            status = static_cast<dp::u8>(DIDStatus::Revoked);
            revoked_at = when;
            revocation_reason = dp::String(reason.c_str());
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<DIDNode &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<DIDNode, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, DIDNode>(buf);
                return dp::Result<DIDNode, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<DIDNode, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"did\":" << json::quote(getDID()) << ",\"public_key\":\""
                << keylock::keylock::to_hex(getPublicKey()) << "\",\"label\":" << json::quote(getLabel())
                << ",\"status\":\"" << didStatusToString(getStatus()) << "\",\"cluster_id\":";
            if (hasCluster()) {
                oss << json::quote(std::string(cluster_id.c_str()));
            } else {
                oss << "null";
            }
            oss << ",\"created_at\":" << created_at << ",\"revoked_at\":";
            if (isRevoked()) {
                oss << revoked_at << ",\"revocation_reason\":"
                    << json::quote(std::string(revocation_reason.c_str()));
            } else {
                oss << "null,\"revocation_reason\":null";
            }
            oss << "}";
            return oss.str();
        }

        auto members() {
            return std::tie(did, public_key, label, status, cluster_id, created_at, revoked_at, revocation_reason);
        }
        auto members() const {
            return std::tie(did, public_key, label, status, cluster_id, created_at, revoked_at, revocation_reason);
        }
    };

    /// Result of DID creation: the only place the private key is ever handed out
    struct NewDIDNode {
        DIDNode node;
        std::vector<uint8_t> private_key;
    };

} // namespace didlink
