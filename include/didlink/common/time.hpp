#pragma once

#include <chrono>
#include <datapod/datapod.hpp>

namespace didlink {

    /// Milliseconds since the Unix epoch
    inline dp::i64 currentTimestampMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

} // namespace didlink
