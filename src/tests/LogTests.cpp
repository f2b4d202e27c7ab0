// SPDX-License-Identifier: Apache-2.0
#include "TempDirectory.hpp"

#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace supervox;
using namespace supervox::test;

namespace
{

    /// @brief Captures log output for the lifetime of the object and restores the defaults afterwards.
    struct LogCapture
    {
        std::vector<std::pair<log::Level, std::string>> lines;

        LogCapture()
        {
            log::setCallback(
                [this](log::Level level, std::string_view message) { lines.emplace_back(level, message); });
        }

        ~LogCapture()
        {
            log::setCallback({});
            log::setLevel(log::Level::Info);
            log::closeFile();
        }

        LogCapture(const LogCapture&) = delete;
        LogCapture& operator=(const LogCapture&) = delete;
    };

} // namespace

TEST_CASE("parseLevel accepts level names in any case", "[log]")
{
    CHECK(log::parseLevel("ERROR") == log::Level::Error);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("Warn") == log::Level::Warning);
    CHECK(log::parseLevel("info") == log::Level::Info);
    CHECK(log::parseLevel("DEBUG") == log::Level::Debug);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK_FALSE(log::parseLevel("verbose").has_value());
    CHECK_FALSE(log::parseLevel("").has_value());
}

TEST_CASE("Messages above the level are dropped", "[log]")
{
    auto capture = LogCapture {};
    log::setLevel(log::Level::Warning);

    log::error("e {}", 1);
    log::warning("w");
    log::info("i");
    log::debug("d");

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0] == std::pair { log::Level::Error, std::string("e 1") });
    CHECK(capture.lines[1].first == log::Level::Warning);
}

TEST_CASE("The file sink receives messages alongside the callback", "[log]")
{
    auto dir = TempDirectory("log");
    auto capture = LogCapture {};
    auto const path = dir / "logs/app.log";

    REQUIRE(log::openFile(path).has_value());
    CHECK(log::currentFile() == path);

    log::info("Recording started");
    log::closeFile();
    CHECK_FALSE(log::currentFile().has_value());
    log::info("after close");

    auto file = std::ifstream(path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    CHECK(content.contains("| INFO  | Recording started"));
    CHECK_FALSE(content.contains("after close"));
    CHECK(capture.lines.size() == 2);
}

TEST_CASE("openFile fails when the directory cannot be created", "[log]")
{
    auto dir = TempDirectory("log");
    auto capture = LogCapture {};
    {
        auto blocker = std::ofstream(dir / "blocker");
        blocker << "x";
    }

    auto const opened = log::openFile(dir / "blocker/app.log");
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().code == ErrorCode::IoError);
    CHECK_FALSE(log::currentFile().has_value());
}
