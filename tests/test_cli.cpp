#include <gtest/gtest.h>
#include "rangefetch/cli.hpp"
#include "rangefetch/errors.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using rangefetch::ArgumentError;
using rangefetch::parseArguments;

namespace {

rangefetch::CommandLine parse(const std::vector<const char*>& args) {
    return parseArguments(static_cast<int>(args.size()), args.data());
}

// ── Accepted input ─────────────────────────────────────────────

TEST(CliTest, SingleUrlIsAccepted) {
    const auto command_line = parse({"rangefetch", "https://example.com/file.bin"});
    EXPECT_EQ(command_line.url, "https://example.com/file.bin");
    EXPECT_FALSE(command_line.show_help);
}

TEST(CliTest, HelpFlags) {
    EXPECT_TRUE(parse({"rangefetch", "--help"}).show_help);
    EXPECT_TRUE(parse({"rangefetch", "-h"}).show_help);
    EXPECT_TRUE(parse({"rangefetch", "-h", "https://example.com/"}).show_help);
}

// ── Rejected input ─────────────────────────────────────────────

TEST(CliTest, MissingUrlThrows) {
    try {
        parse({"rangefetch"});
        FAIL() << "expected ArgumentError";
    } catch (const ArgumentError& e) {
        EXPECT_NE(std::string(e.what()).find("URL"), std::string::npos) << e.what();
    }
}

TEST(CliTest, EmptyUrlThrows) {
    EXPECT_THROW(parse({"rangefetch", ""}), ArgumentError);
}

TEST(CliTest, NoArgvAtAllThrows) {
    EXPECT_THROW(parse({}), ArgumentError);
}

TEST(CliTest, ExtraArgumentThrows) {
    EXPECT_THROW(parse({"rangefetch", "https://a.example/", "https://b.example/"}), ArgumentError);
}

TEST(CliTest, UsageNamesProgram) {
    const auto usage = rangefetch::usageText("rangefetch");
    EXPECT_EQ(usage.rfind("Usage: rangefetch <url>\n", 0), 0u) << usage;
    EXPECT_NE(usage.find("--help"), std::string::npos);
}

// ── Fatal exit ─────────────────────────────────────────────────

TEST(CliDeathTest, FatalErrorExitsWithStatusOne) {
    EXPECT_EXIT(rangefetch::exitWithFatalError(rangefetch::TransferError("connection reset")),
                ::testing::ExitedWithCode(1), "Fatal error: connection reset");
}

TEST(CliDeathTest, FatalErrorSkipsAtexitHandlers) {
    // A handler that ran would turn the status into 3.
    EXPECT_EXIT(
        {
            std::atexit([] { std::_Exit(3); });
            rangefetch::exitWithFatalError(rangefetch::TransferError("boom"));
        },
        ::testing::ExitedWithCode(1), "Fatal error: boom");
}

} // namespace
