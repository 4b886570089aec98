#pragma once

// didlink facade
// Composes crypto, identity and storage modules

#include "didlink/common/error.hpp"
#include "didlink/common/logger.hpp"
#include "didlink/crypto/key.hpp"
#include "didlink/identity/identity.hpp"
#include "didlink/storage/did_store.hpp"
#include "didlink/storage/file_store.hpp"
#include "didlink/storage/memory_store.hpp"

namespace didlink {

    inline constexpr const char *VERSION_STRING = "0.1.0";

} // namespace didlink
