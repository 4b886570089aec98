#pragma once

#include <datapod/datapod.hpp>
#include <didlink/common/time.hpp>
#include <didlink/crypto/key.hpp>
#include <didlink/identity/did.hpp>
#include <didlink/identity/link_proof.hpp>
#include <functional>
#include <string>

namespace didlink {

    /// DIDManager configuration
    struct ManagerConfig {
        std::string did_method = DID::DEFAULT_METHOD;      // did:<method>:<hex public key>
        std::string domain_tag = DEFAULT_LINK_DOMAIN_TAG; // prefixed to every link payload
        std::function<dp::i64()> clock = currentTimestampMs;
        std::function<dp::Result<Key, dp::Error>()> key_source = Key::generate;
    };

} // namespace didlink
