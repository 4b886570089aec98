#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace didlink::log {

    using Logger = std::shared_ptr<spdlog::logger>;

    /// Get the logger registered under tag, creating a stderr logger on first use
    Logger createLogger(const std::string &tag);

    /// Set the level of every didlink logger, including ones created later.
    /// Loggers created outside didlink keep their own level.
    void setLevel(spdlog::level::level_enum level);

    /// Level applied to newly created didlink loggers
    spdlog::level::level_enum level();

} // namespace didlink::log
