#pragma once

#include <datapod/datapod.hpp>
#include <didlink/common/json.hpp>
#include <didlink/crypto/key.hpp>
#include <exception>
#include <keylock/keylock.hpp>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace didlink {

    constexpr const char *DEFAULT_LINK_DOMAIN_TAG = "didlink/link-proof/v1";

    /// Bytes both nodes sign when linking:
    ///   <domain_tag> 0x00 <did_a> 0x00 <did_b> 0x00 <timestamp_ms>
    /// DIDs are put in canonical (lexicographic) order first, so the payload does
    /// not depend on which side initiated the link.
    inline std::vector<uint8_t> buildLinkPayload(const std::string &domain_tag, const std::string &did_a,
                                                 const std::string &did_b, dp::i64 timestamp_ms) {
        const std::string &first = did_a <= did_b ? did_a : did_b;
        const std::string &second = did_a <= did_b ? did_b : did_a;
        std::string ts = std::to_string(timestamp_ms);

        std::vector<uint8_t> payload;
        payload.reserve(domain_tag.size() + first.size() + second.size() + ts.size() + 3);
        payload.insert(payload.end(), domain_tag.begin(), domain_tag.end());
        payload.push_back(0x00);
        payload.insert(payload.end(), first.begin(), first.end());
        payload.push_back(0x00);
        payload.insert(payload.end(), second.begin(), second.end());
        payload.push_back(0x00);
        payload.insert(payload.end(), ts.begin(), ts.end());
        return payload;
    }

    /// Immutable evidence that two DIDs consented to share a cluster.
    /// did_a < did_b always; signature_a belongs to did_a.
    struct LinkProof {
        dp::String did_a;
        dp::String did_b;
        dp::Vector<dp::u8> signature_a;
        dp::Vector<dp::u8> signature_b;
        dp::String cluster_id;
        dp::i64 created_at{0};

        LinkProof() = default;

        /// Build a proof from two (did, signature) pairs given in any order
        inline static LinkProof create(const std::string &did_x, const std::vector<uint8_t> &sig_x,
                                       const std::string &did_y, const std::vector<uint8_t> &sig_y,
                                       const std::string &cluster, dp::i64 timestamp_ms) {
            bool swap = did_y < did_x;
            const std::string &first = swap ? did_y : did_x;
            const std::string &second = swap ? did_x : did_y;
            const std::vector<uint8_t> &first_sig = swap ? sig_y : sig_x;
            const std::vector<uint8_t> &second_sig = swap ? sig_x : sig_y;

            LinkProof proof;
            proof.did_a = dp::String(first.c_str());
            proof.did_b = dp::String(second.c_str());
            proof.signature_a = dp::Vector<dp::u8>(first_sig.begin(), first_sig.end());
            proof.signature_b = dp::Vector<dp::u8>(second_sig.begin(), second_sig.end());
            proof.cluster_id = dp::String(cluster.c_str());
            proof.created_at = timestamp_ms;
            return proof;
        }

        inline std::string getDidA() const { return std::string(did_a.c_str()); }

        inline std::string getDidB() const { return std::string(did_b.c_str()); }

        inline std::string getClusterId() const { return std::string(cluster_id.c_str()); }

        inline std::vector<uint8_t> getSignatureA() const {
            return std::vector<uint8_t>(signature_a.begin(), signature_a.end());
        }

        inline std::vector<uint8_t> getSignatureB() const {
            return std::vector<uint8_t>(signature_b.begin(), signature_b.end());
        }

        inline bool involves(const std::string &did) const { return getDidA() == did || getDidB() == did; }

        /// The exact bytes both signatures cover
        inline std::vector<uint8_t> canonicalPayload(const std::string &domain_tag = DEFAULT_LINK_DOMAIN_TAG) const {
            return buildLinkPayload(domain_tag, getDidA(), getDidB(), created_at);
        }

        /// Valid iff both signatures verify over the identical payload
        inline bool verify(const std::vector<uint8_t> &public_key_a, const std::vector<uint8_t> &public_key_b,
                           const std::string &domain_tag = DEFAULT_LINK_DOMAIN_TAG) const {
            auto payload = canonicalPayload(domain_tag);
            return Key::verify(public_key_a, payload, getSignatureA()) &&
                   Key::verify(public_key_b, payload, getSignatureB());
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<LinkProof &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<LinkProof, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, LinkProof>(buf);
                return dp::Result<LinkProof, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<LinkProof, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"did_a\":" << json::quote(getDidA()) << ",\"did_b\":" << json::quote(getDidB())
                << ",\"signature_a\":\"" << keylock::keylock::to_hex(getSignatureA()) << "\",\"signature_b\":\""
                << keylock::keylock::to_hex(getSignatureB()) << "\",\"cluster_id\":" << json::quote(getClusterId())
                << ",\"created_at\":" << created_at << "}";
            return oss.str();
        }

        auto members() { return std::tie(did_a, did_b, signature_a, signature_b, cluster_id, created_at); }
        auto members() const { return std::tie(did_a, did_b, signature_a, signature_b, cluster_id, created_at); }
    };

} // namespace didlink
