#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "support/test_files.hpp"

using namespace shootsync::infra;
namespace support = shootsync::test_support;

namespace {

constexpr const char* kTwoShares = R"(
destinations:
  - name: nas
    host: 192.168.1.10
    share: photos
    username: $SHOOTSYNC_TEST_USER
    password: ${SHOOTSYNC_TEST_PASS}
    base_path: Photoshoots
  - host: backup.local
    port: 0
    share: archive
    base_path: /Backup/Photos
workers: 8
queue_capacity: 16
timeout_seconds: 10
extensions: [JPG, ".nef", cr3]
progress: true
)";

auto parse(std::vector<const char*> argv, int& exit_code) {
    argv.insert(argv.begin(), "shootsync");
    return shootsync::args_parser::parse_args(static_cast<int>(argv.size()), argv.data(), exit_code);
}

} // namespace

TEST(ConfigTest, ParsesDestinationsAndOptions)
{
    ::setenv("SHOOTSYNC_TEST_USER", "photographer", 1);
    ::setenv("SHOOTSYNC_TEST_PASS", "s3cret", 1);

    auto cfg = parse_config_string(kTwoShares);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    ASSERT_EQ(cfg->destinations.size(), 2u);

    const auto& nas = cfg->destinations[0];
    EXPECT_EQ(nas.label(), "nas");
    EXPECT_EQ(nas.host, "192.168.1.10");
    EXPECT_EQ(nas.port, kDefaultSmbPort);
    EXPECT_EQ(nas.username, "photographer");
    EXPECT_EQ(nas.password, "s3cret");
    EXPECT_EQ(nas.base_path, "Photoshoots");

    const auto& backup = cfg->destinations[1];
    EXPECT_EQ(backup.label(), "backup.local/archive");
    EXPECT_EQ(backup.port, 445);

    EXPECT_EQ(cfg->effective_workers(), 8u);
    EXPECT_EQ(cfg->effective_queue_capacity(), 16u);
    EXPECT_EQ(cfg->effective_timeout(), std::chrono::seconds(10));
    EXPECT_TRUE(cfg->progress);

    const std::vector<std::string> exts{".jpg", ".nef", ".cr3"};
    EXPECT_EQ(cfg->effective_extensions(), exts);
}

TEST(ConfigTest, LegacySmbSharesKey)
{
    auto cfg = parse_config_string(R"(
smb_shares:
  - host: nas
    share: photos
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    ASSERT_EQ(cfg->destinations.size(), 1u);
    EXPECT_EQ(cfg->destinations[0].share, "photos");
}

TEST(ConfigTest, Defaults)
{
    Config cfg;
    EXPECT_EQ(cfg.effective_workers(), kDefaultWorkers);
    EXPECT_EQ(cfg.effective_queue_capacity(), kDefaultWorkers);
    EXPECT_EQ(cfg.effective_timeout(), kDefaultTimeout);
    EXPECT_EQ(cfg.effective_extensions(), default_extensions());

    cfg.workers = 2;
    EXPECT_EQ(cfg.effective_queue_capacity(), 2u);
}

TEST(ConfigTest, RejectsInvalidDestinations)
{
    EXPECT_FALSE(parse_config_string("destinations:\n  - host: nas\n").has_value());
    EXPECT_FALSE(parse_config_string("destinations:\n  - host: nas\n    share: p\n    port: 70000\n").has_value());
    EXPECT_FALSE(parse_config_string("destinations: nas\n").has_value());
    EXPECT_FALSE(parse_config_string("workers: many\n").has_value());
    EXPECT_FALSE(parse_config_string("- just\n- a list\n").has_value());
}

TEST(ConfigTest, EmptyDocumentIsEmptyConfig)
{
    auto cfg = parse_config_string("");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->destinations.empty());
}

TEST(ConfigTest, ExpandEnv)
{
    ::setenv("SHOOTSYNC_TEST_DOMAIN", "STUDIO", 1);
    ::unsetenv("SHOOTSYNC_TEST_UNSET");
    EXPECT_EQ(expand_env("$SHOOTSYNC_TEST_DOMAIN"), "STUDIO");
    EXPECT_EQ(expand_env("${SHOOTSYNC_TEST_DOMAIN}\\user"), "STUDIO\\user");
    EXPECT_EQ(expand_env("x$SHOOTSYNC_TEST_UNSET.y"), "x.y");
    EXPECT_EQ(expand_env("cost $ 5"), "cost $ 5");
    EXPECT_EQ(expand_env("plain"), "plain");
}

TEST(ConfigTest, MergePrefersCli)
{
    auto file = parse_config_string(kTwoShares);
    ASSERT_TRUE(file.has_value());

    Config cli;
    cli.workers = 2;
    cli.verbose = true;
    file->merge_with(cli);

    EXPECT_EQ(file->effective_workers(), 2u);
    EXPECT_EQ(file->effective_queue_capacity(), 16u);
    EXPECT_TRUE(file->verbose);
    EXPECT_EQ(file->destinations.size(), 2u);
}

TEST(ConfigTest, SelectOnly)
{
    auto cfg = parse_config_string(kTwoShares);
    ASSERT_TRUE(cfg.has_value());

    cfg->only = {"backup.local/archive"};
    auto selected = cfg->selected_destinations();
    ASSERT_TRUE(selected.has_value());
    ASSERT_EQ(selected->size(), 1u);
    EXPECT_EQ((*selected)[0].host, "backup.local");

    cfg->only = {"missing"};
    EXPECT_FALSE(cfg->selected_destinations().has_value());
}

TEST(ConfigTest, Validate)
{
    Config cfg;
    EXPECT_TRUE(validate(cfg).has_value());

    cfg.workers = 0;
    EXPECT_FALSE(validate(cfg).has_value());
    cfg.workers = 1;
    cfg.queue_capacity = 0;
    EXPECT_FALSE(validate(cfg).has_value());
    cfg.queue_capacity = 1;

    DestinationConfig a;
    a.host = "nas";
    a.share = "photos";
    cfg.destinations = {a, a};
    EXPECT_FALSE(validate(cfg).has_value());
}

TEST(ConfigTest, LoadFromExplicitFile)
{
    support::TempDir dir;
    const auto path = dir.path() / "config.yaml";
    support::write_file(path, kTwoShares);

    auto cfg = load_config_from_file(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->destinations.size(), 2u);

    EXPECT_FALSE(load_config_from_file(dir.path() / "absent.yaml").has_value());
}

TEST(ArgsParserTest, RequiredOptions)
{
    int exit_code = -1;
    auto args = parse({"--source", "/media/card", "--name", "Wedding", "-w", "3", "--only", "nas"}, exit_code);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(args->source, "/media/card");
    EXPECT_EQ(args->name, "Wedding");
    EXPECT_EQ(args->workers, 3u);
    ASSERT_EQ(args->only.size(), 1u);

    const auto cfg = config_from_cli(*args);
    EXPECT_EQ(cfg.effective_workers(), 3u);
    EXPECT_EQ(cfg.only, args->only);
}

TEST(ArgsParserTest, MissingNameFails)
{
    int exit_code = 0;
    auto args = parse({"--source", "/media/card"}, exit_code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(exit_code, 0);
}

TEST(ArgsParserTest, ZeroWorkersRejected)
{
    int exit_code = 0;
    auto args = parse({"-s", "/media/card", "-n", "Wedding", "--workers", "0"}, exit_code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(exit_code, 0);
}

TEST(ArgsParserTest, VersionNeedsNothingElse)
{
    int exit_code = -1;
    auto args = parse({"--version"}, exit_code);
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->version);
    EXPECT_EQ(exit_code, 0);
}
