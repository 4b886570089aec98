#include <didlink/common/logger.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace didlink::log {

    namespace {

        std::atomic<spdlog::level::level_enum> default_level{spdlog::level::info};

        std::mutex &registryMutex() {
            static std::mutex mutex;
            return mutex;
        }

        // Tags handed out by createLogger; setLevel touches only these
        std::set<std::string> &registeredTags() {
            static std::set<std::string> tags;
            return tags;
        }

        void setPattern(spdlog::logger &logger) { logger.set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %n: %v"); }

    } // namespace

    Logger createLogger(const std::string &tag) {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto logger = spdlog::get(tag);
        if (logger == nullptr) {
            // Diagnostics go to stderr so program output on stdout stays clean
            logger = spdlog::stderr_color_mt(tag);
            setPattern(*logger);
            logger->set_level(default_level.load());
        }
        registeredTags().insert(tag);
        return logger;
    }

    void setLevel(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(registryMutex());
        default_level.store(level);
        for (const auto &tag : registeredTags()) {
            if (auto logger = spdlog::get(tag)) {
                logger->set_level(level);
            }
        }
    }

    spdlog::level::level_enum level() { return default_level.load(); }

} // namespace didlink::log
