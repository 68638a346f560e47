// GoogleTest tests for the discover tool's JSON + CLI options
#include "discover/DiscoverOptions.hpp"
#include <options/Options.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using speedwire_opts::Options;

namespace {

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        speedwire_opts::discover_opts::register_options();
        dir = std::filesystem::temp_directory_path() /
              ("speedwire_opts_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string write_config(const std::string& text) {
        auto path = dir / "config.json";
        std::ofstream(path) << text;
        return path.string();
    }

    Options::ParseResult parse(std::vector<std::string> args, std::string& err) {
        args.insert(args.begin(), "speedwire-discover");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
    }

    std::filesystem::path dir;
};

} // namespace

TEST_F(OptionsTest, DefaultsWithoutArguments)
{
    std::string err;
    ASSERT_EQ(parse({}, err), Options::ParseResult::Ok) << err;
    const auto opts = speedwire_opts::discover_opts::get();
    EXPECT_EQ(opts.interface_name, "");
    EXPECT_EQ(opts.password, "0000");
    EXPECT_EQ(opts.timeout_ms, 3000);
    EXPECT_FALSE(opts.verbose_packets);
    EXPECT_EQ(opts.group, "239.12.255.254");
    EXPECT_EQ(opts.port, 9522);
    EXPECT_FALSE(Options::get_config_file().has_value());
}

TEST_F(OptionsTest, JsonSeedsDefaultsAndCliOverrides)
{
    const auto config = write_config(R"({
        "discover": { "interface": "eth1", "password": "1234", "timeout_ms": 5000, "verbose_packets": true },
        "connection": { "port": 9600 }
    })");

    std::string err;
    ASSERT_EQ(parse({"-c", config, "-p", "9999", "--log-level", "debug"}, err), Options::ParseResult::Ok) << err;
    const auto opts = speedwire_opts::discover_opts::get();
    EXPECT_EQ(opts.interface_name, "eth1");
    EXPECT_EQ(opts.password, "9999");
    EXPECT_EQ(opts.timeout_ms, 5000);
    EXPECT_TRUE(opts.verbose_packets);
    EXPECT_EQ(opts.log_level, "debug");
    EXPECT_EQ(opts.port, 9600);
    ASSERT_TRUE(Options::get_config_dir().has_value());
    EXPECT_EQ(std::filesystem::canonical(*Options::get_config_dir()), std::filesystem::canonical(dir));
}

TEST_F(OptionsTest, WrongJsonTypesAreIgnored)
{
    const auto config = write_config(R"({ "discover": { "timeout_ms": "long", "password": 42 } })");
    std::string err;
    ASSERT_EQ(parse({"--config", config}, err), Options::ParseResult::Ok) << err;
    const auto opts = speedwire_opts::discover_opts::get();
    EXPECT_EQ(opts.timeout_ms, 3000);
    EXPECT_EQ(opts.password, "0000");
}

TEST_F(OptionsTest, InvalidValuesAreErrors)
{
    std::string err;
    EXPECT_EQ(parse({"--timeout-ms", "10"}, err), Options::ParseResult::Error);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(parse({"--log-level", "loud"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--port", "70000"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--no-such-flag"}, err), Options::ParseResult::Error);
}

TEST_F(OptionsTest, BadConfigFileIsError)
{
    std::string err;
    EXPECT_EQ(parse({"-c", (dir / "missing.json").string()}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("cannot open config file"), std::string::npos);

    const auto config = write_config("{ not json");
    EXPECT_EQ(parse({"-c", config}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("malformed config file"), std::string::npos);
}
