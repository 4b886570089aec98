#pragma once

#include <datapod/datapod.hpp>
#include <didlink/common/json.hpp>
#include <exception>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace didlink {

    /// The set of DIDs known to belong to one identity.
    /// Members keep insertion order and are never removed.
    struct IdentityCluster {
        dp::String cluster_id;
        dp::String label;
        dp::Vector<dp::String> member_dids;
        dp::i64 created_at{0};

        IdentityCluster() = default;

        IdentityCluster(const std::string &id, const std::string &label_str, dp::i64 created)
            : cluster_id(dp::String(id.c_str())), label(dp::String(label_str.c_str())), created_at(created) {}

        inline std::string getClusterId() const { return std::string(cluster_id.c_str()); }

        inline std::string getLabel() const { return std::string(label.c_str()); }

        inline void setLabel(const std::string &label_str) { label = dp::String(label_str.c_str()); }

        inline std::vector<std::string> getMembers() const {
            std::vector<std::string> result;
            result.reserve(member_dids.size());
            for (const auto &m : member_dids) {
                result.push_back(std::string(m.c_str()));
            }
            return result;
        }

        inline bool hasMember(const std::string &did) const {
            for (const auto &m : member_dids) {
                if (std::string(m.c_str()) == did) {
                    return true;
                }
            }
            return false;
        }

        /// Returns false when the DID was already a member
        inline bool addMember(const std::string &did) {
            if (hasMember(did)) {
                return false;
            }
            member_dids.push_back(dp::String(did.c_str()));
            return true;
        }

        inline size_t size() const { return member_dids.size(); }

        inline bool empty() const { return member_dids.empty(); }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<IdentityCluster &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<IdentityCluster, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, IdentityCluster>(buf);
                return dp::Result<IdentityCluster, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<IdentityCluster, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"cluster_id\":" << json::quote(getClusterId()) << ",\"label\":";
            if (label.empty()) {
                oss << "null";
            } else {
                oss << json::quote(getLabel());
            }
            oss << ",\"member_dids\":[";
            for (size_t i = 0; i < member_dids.size(); ++i) {
                if (i > 0) {
                    oss << ",";
                }
                oss << json::quote(std::string(member_dids[i].c_str()));
            }
            oss << "],\"created_at\":" << created_at << "}";
            return oss.str();
        }

        auto members() { return std::tie(cluster_id, label, member_dids, created_at); }
        auto members() const { return std::tie(cluster_id, label, member_dids, created_at); }
    };

} // namespace didlink
