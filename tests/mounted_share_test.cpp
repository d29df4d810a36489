#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <sstream>

#include "adapters/mounted_share.hpp"
#include "support/test_files.hpp"

using namespace shootsync;
namespace support = shootsync::test_support;
using namespace std::chrono_literals;

namespace {

auto mounted_config(const std::filesystem::path& mount) -> infra::DestinationConfig {
    infra::DestinationConfig cfg;
    cfg.host = "nas";
    cfg.share = "photos";
    cfg.mount_path = mount.string();
    return cfg;
}

} // namespace

TEST(MountedShareTest, DefaultMountPathUsesGvfsLayout)
{
    ::setenv("XDG_RUNTIME_DIR", "/run/user/1000", 1);
    infra::DestinationConfig cfg;
    cfg.host = "192.168.1.10";
    cfg.share = "photos";
    EXPECT_EQ(adapters::remote::default_mount_path(cfg),
              std::filesystem::path("/run/user/1000/gvfs/smb-share:server=192.168.1.10,share=photos"));
}

TEST(MountedShareTest, MissingMountPointFailsToConnect)
{
    support::TempDir dir;
    adapters::remote::MountedShareClient client;
    auto session = client.connect(mounted_config(dir.path() / "not-mounted"), 1000ms);
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().code, infra::ErrorCode::ConnectionFailed);
}

TEST(MountedShareTest, MkdirAndWrite)
{
    support::TempDir dir;
    adapters::remote::MountedShareClient client;
    auto session = client.connect(mounted_config(dir.path()), 1000ms);
    ASSERT_TRUE(session.has_value()) << session.error().message;

    auto share = (*session)->mount("photos");
    ASSERT_TRUE(share.has_value()) << share.error().message;
    EXPECT_TRUE((*share)->supports_concurrent_use());

    auto created = (*share)->mkdir("Photoshoots");
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, adapters::remote::MkdirOutcome::Created);

    auto again = (*share)->mkdir("Photoshoots");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, adapters::remote::MkdirOutcome::AlreadyExists);

    // Родитель отсутствует
    auto orphan = (*share)->mkdir("Missing/2025-01-15");
    EXPECT_FALSE(orphan.has_value());

    std::istringstream data("jpeg bytes");
    auto written = (*share)->create_and_write("Photoshoots/IMG_001.jpg", data);
    ASSERT_TRUE(written.has_value()) << written.error().message;
    EXPECT_EQ(*written, 10u);
    EXPECT_TRUE(std::filesystem::is_regular_file(dir.path() / "Photoshoots" / "IMG_001.jpg"));

    (*share)->close();
    (*session)->logoff();
}

TEST(MountedShareTest, MkdirOverFileIsError)
{
    support::TempDir dir;
    support::write_file(dir.path() / "Photoshoots", "file, not a directory");

    adapters::remote::MountedShareClient client;
    auto session = client.connect(mounted_config(dir.path()), 1000ms);
    ASSERT_TRUE(session.has_value());
    auto share = (*session)->mount("photos");
    ASSERT_TRUE(share.has_value());

    auto res = (*share)->mkdir("Photoshoots");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::RemoteIo);
}

TEST(MountedShareTest, WriteIntoMissingDirectoryFails)
{
    support::TempDir dir;
    adapters::remote::MountedShareClient client;
    auto session = client.connect(mounted_config(dir.path()), 1000ms);
    ASSERT_TRUE(session.has_value());
    auto share = (*session)->mount("photos");
    ASSERT_TRUE(share.has_value());

    std::istringstream data("bytes");
    auto res = (*share)->create_and_write("nowhere/IMG.jpg", data);
    EXPECT_FALSE(res.has_value());
}
