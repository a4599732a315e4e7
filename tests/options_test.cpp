#include "parafetch/options.hpp"
#include "test_support.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;
using parafetch::CliOptions;
using parafetch::parseOptions;

CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "parafetch");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return parseOptions(static_cast<int>(argv.size()), argv.data());
}

TEST(OptionsTest, DefaultsWithPositionalPairs) {
    const auto options = parse({"https://example.test/a", "a.bin"});

    EXPECT_EQ(options.out_dir, std::filesystem::path("out"));
    EXPECT_EQ(options.max_concurrency, 0u);
    EXPECT_EQ(options.grace_period, 10s);
    EXPECT_EQ(options.connect_timeout, 30s);
    EXPECT_EQ(options.progress_interval, 1000ms);
    EXPECT_EQ(options.log_level, spdlog::level::info);
    EXPECT_FALSE(options.report_path.has_value());
    ASSERT_EQ(options.downloads.size(), 1u);
    EXPECT_EQ(options.downloads[0].first, "https://example.test/a");
    EXPECT_EQ(options.downloads[0].second, "a.bin");
}

TEST(OptionsTest, ParsesEveryOption) {
    const auto options = parse({"-m", "list.txt", "-d", "dl", "-j", "4", "-g", "0", "-r", "report.log",
                                "--connect-timeout", "7", "--progress", "250", "-l", "debug"});

    EXPECT_EQ(options.manifest.value_or(""), std::filesystem::path("list.txt"));
    EXPECT_EQ(options.out_dir, std::filesystem::path("dl"));
    EXPECT_EQ(options.max_concurrency, 4u);
    EXPECT_EQ(options.grace_period, 0s);
    EXPECT_EQ(options.report_path.value_or(""), "report.log");
    EXPECT_EQ(options.connect_timeout, 7s);
    EXPECT_EQ(options.progress_interval, 250ms);
    EXPECT_EQ(options.log_level, spdlog::level::debug);
    EXPECT_TRUE(options.downloads.empty());
}

TEST(OptionsTest, HelpShortCircuits) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h", "--bogus"}).show_help);
}

TEST(OptionsTest, RejectsMalformedInput) {
    EXPECT_THROW(parse({}), std::runtime_error);
    EXPECT_THROW(parse({"https://example.test/a"}), std::runtime_error);
    EXPECT_THROW(parse({"--bogus", "https://example.test/a", "a"}), std::runtime_error);
    EXPECT_THROW(parse({"-j"}), std::runtime_error);
    EXPECT_THROW(parse({"-j", "-1", "https://example.test/a", "a"}), std::runtime_error);
    EXPECT_THROW(parse({"-j", "two", "https://example.test/a", "a"}), std::runtime_error);
    EXPECT_THROW(parse({"-g", "5s", "https://example.test/a", "a"}), std::runtime_error);
    EXPECT_THROW(parse({"--progress", "0", "https://example.test/a", "a"}), std::runtime_error);
    EXPECT_THROW(parse({"-l", "loud", "https://example.test/a", "a"}), std::runtime_error);
}

TEST(OptionsTest, CollectSpecsCombinesManifestAndPairs) {
    parafetch::test::TempDir dir;
    parafetch::test::writeFile(dir.file("list.toml"),
                               "[[downloads]]\nurl = \"https://example.test/one.iso\"\n");
    const auto options = parse({"-m", dir.file("list.toml"), "-d", dir.file("dl"),
                                "https://example.test/two", "two.bin"});

    const auto specs = parafetch::collectSpecs(options);

    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].destination, dir.file("dl/one.iso"));
    EXPECT_EQ(specs[1].url, "https://example.test/two");
    EXPECT_EQ(specs[1].destination, dir.file("dl/two.bin"));
}

TEST(OptionsTest, UsageMentionsExitCodes) {
    std::ostringstream out;
    parafetch::printUsage(out, "parafetch");
    EXPECT_NE(out.str().find("--grace"), std::string::npos);
    EXPECT_NE(out.str().find("130"), std::string::npos);
}

} // namespace
