#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(shootsync::build_info::git_commit.empty());
    EXPECT_FALSE(shootsync::build_info::git_commit_short.empty());
    EXPECT_EQ(shootsync::build_info::git_commit_short.size(), 7); // короткий SHA
}

TEST(BuildInfoTest, GitInfoMatchesConstants)
{
    constexpr auto info = shootsync::build_info::get_git_info();
    EXPECT_EQ(info.commit, shootsync::build_info::git_commit);
    EXPECT_EQ(info.commit_short, shootsync::build_info::git_commit_short);
    EXPECT_EQ(info.dirty, shootsync::build_info::git_dirty);
    EXPECT_FALSE(info.timestamp.empty());
}
