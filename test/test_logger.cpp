#include "didlink/common/logger.hpp"
#include <doctest/doctest.h>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace didlink;

TEST_SUITE("Logger Tests") {
    TEST_CASE("Loggers are shared by tag") {
        auto first = log::createLogger("LoggerTestShared");
        auto second = log::createLogger("LoggerTestShared");
        CHECK(first.get() == second.get());
        CHECK(first->name() == "LoggerTestShared");
    }

    TEST_CASE("Diagnostics go to stderr") {
        auto logger = log::createLogger("LoggerTestStderr");
        REQUIRE(logger->sinks().size() == 1);

        auto sink = logger->sinks()[0];
        CHECK(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sink) != nullptr);
        CHECK(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sink) == nullptr);
    }

    TEST_CASE("setLevel only touches didlink loggers") {
        auto foreign = spdlog::stdout_color_mt("LoggerTestForeign");
        foreign->set_level(spdlog::level::info);

        auto ours = log::createLogger("LoggerTestOurs");
        log::setLevel(spdlog::level::warn);

        CHECK(ours->level() == spdlog::level::warn);
        CHECK(foreign->level() == spdlog::level::info);
        CHECK(log::level() == spdlog::level::warn);

        // Loggers created after the call pick up the new level
        auto later = log::createLogger("LoggerTestLater");
        CHECK(later->level() == spdlog::level::warn);

        log::setLevel(spdlog::level::info);
        CHECK(ours->level() == spdlog::level::info);
        CHECK(later->level() == spdlog::level::info);

        spdlog::drop("LoggerTestForeign");
    }
}
