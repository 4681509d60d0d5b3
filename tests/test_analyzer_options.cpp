#include <gtest/gtest.h>
#include "analyzer/AnalyzerOptions.hpp"
#include <options/Options.hpp>

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using procsync_opts::Options;

namespace {

struct Argv {
    Argv(std::initializer_list<std::string> args) : storage(args) {
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

Options::ParseResult parse(std::initializer_list<std::string> args, std::string& err) {
    Argv a(args);
    return Options::load_and_parse(a.argc(), a.argv(), err);
}

std::string write_config(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST(AnalyzerOptionsTest, DefaultsWithoutArguments)
{
    std::string err;
    ASSERT_EQ(parse({"proc-sync-analyzer"}, err), Options::ParseResult::Ok) << err;

    auto opts = analyzer_opts::resolve();
    EXPECT_EQ(opts.count, 4);
    EXPECT_DOUBLE_EQ(opts.speed, 1.0);
    EXPECT_EQ(opts.priority, ProcSync::PriorityLevel::Normal);
    EXPECT_EQ(opts.base_delay.count(), 50);
    EXPECT_EQ(opts.grace.count(), 1000);
    EXPECT_EQ(opts.tick.count(), 200);
    EXPECT_EQ(opts.priority_backend, ProcSync::PriorityBackend::Auto);
    EXPECT_EQ(opts.sample_interval.count(), 1000);
    EXPECT_DOUBLE_EQ(opts.sample_log_probability, 0.1);
    EXPECT_TRUE(opts.ui_enabled);
    EXPECT_EQ(opts.run_seconds, 0);
}

TEST(AnalyzerOptionsTest, CommandLineOverrides)
{
    std::string err;
    ASSERT_EQ(parse({"proc-sync-analyzer", "--count", "8", "--speed", "0.25x", "--priority", "high",
                     "--noui", "--priority-backend", "none", "--run-seconds", "3", "--tick-ms", "100",
                     "--sample-log-probability", "0.5"}, err),
              Options::ParseResult::Ok) << err;

    auto opts = analyzer_opts::resolve();
    EXPECT_EQ(opts.count, 8);
    EXPECT_DOUBLE_EQ(opts.speed, 0.25);
    EXPECT_EQ(opts.priority, ProcSync::PriorityLevel::High);
    EXPECT_FALSE(opts.ui_enabled);
    EXPECT_EQ(opts.priority_backend, ProcSync::PriorityBackend::None);
    EXPECT_EQ(opts.run_seconds, 3);
    EXPECT_EQ(opts.tick.count(), 100);
    EXPECT_DOUBLE_EQ(opts.sample_log_probability, 0.5);
}

TEST(AnalyzerOptionsTest, RejectsOutOfRangeValues)
{
    std::string err;
    EXPECT_EQ(parse({"proc-sync-analyzer", "--count", "33"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"proc-sync-analyzer", "--count", "0"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"proc-sync-analyzer", "--speed", "3x"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"proc-sync-analyzer", "--priority", "realtime"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"proc-sync-analyzer", "--priority-backend", "rtkit"}, err), Options::ParseResult::Error);
    EXPECT_EQ(parse({"proc-sync-analyzer", "--bogus"}, err), Options::ParseResult::Error);
}

TEST(AnalyzerOptionsTest, ConfigFileSuppliesDefaults)
{
    const auto path = write_config("procsync_options_test.json", R"({
        "pool": { "count": 2, "speed": "5x", "priority": "Low", "base_delay_ms": 20 },
        "monitor": { "interval_ms": 250, "log_probability": 0.0 },
        "ui": false,
        "run_seconds": 9
    })");

    std::string err;
    ASSERT_EQ(parse({"proc-sync-analyzer", "-c", path}, err), Options::ParseResult::Ok) << err;
    auto opts = analyzer_opts::resolve();
    EXPECT_EQ(opts.count, 2);
    EXPECT_DOUBLE_EQ(opts.speed, 5.0);
    EXPECT_EQ(opts.priority, ProcSync::PriorityLevel::Low);
    EXPECT_EQ(opts.base_delay.count(), 20);
    EXPECT_EQ(opts.sample_interval.count(), 250);
    EXPECT_DOUBLE_EQ(opts.sample_log_probability, 0.0);
    EXPECT_FALSE(opts.ui_enabled);
    EXPECT_EQ(opts.run_seconds, 9);
    ASSERT_TRUE(Options::get_config_file().has_value());

    // Command line wins over the file
    ASSERT_EQ(parse({"proc-sync-analyzer", "--config", path, "--count", "6", "--ui"}, err), Options::ParseResult::Ok) << err;
    opts = analyzer_opts::resolve();
    EXPECT_EQ(opts.count, 6);
    EXPECT_TRUE(opts.ui_enabled);

    std::filesystem::remove(path);
}

TEST(AnalyzerOptionsTest, InvalidConfigValueFailsResolve)
{
    const auto path = write_config("procsync_options_bad_count.json", R"({ "pool": { "count": 99 } })");
    std::string err;
    ASSERT_EQ(parse({"proc-sync-analyzer", "-c", path}, err), Options::ParseResult::Ok) << err;
    EXPECT_THROW(analyzer_opts::resolve(), std::invalid_argument);
    std::filesystem::remove(path);
}

TEST(AnalyzerOptionsTest, UnreadableConfigIsAnError)
{
    std::string err;
    EXPECT_EQ(parse({"proc-sync-analyzer", "-c", "/nonexistent/analyzer.json"}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("cannot open config file"), std::string::npos);

    const auto path = write_config("procsync_options_malformed.json", "{ \"pool\": ");
    EXPECT_EQ(parse({"proc-sync-analyzer", "-c", path}, err), Options::ParseResult::Error);
    EXPECT_NE(err.find("malformed config file"), std::string::npos);
    std::filesystem::remove(path);
}
