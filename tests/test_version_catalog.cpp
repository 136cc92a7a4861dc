#include "migfetch/version_catalog.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

constexpr const char kListPath[] = "/ipns/dist.ipfs.io/go-ipfs/versions";

class VersionCatalogTests : public ::testing::Test {
  protected:
    testutil::FakeFetcher fetcher;
    migfetch::VersionCatalog catalog{fetcher};
    migfetch::CancelContext ctx;

    std::vector<std::string> List(bool descending) {
        std::vector<std::string> out;
        auto r = catalog.ListVersions(ctx, "go-ipfs", descending, out);
        EXPECT_TRUE(r.ok) << r.msg;
        return out;
    }
};

TEST_F(VersionCatalogTests, LatestSkipsDevVersions) {
    fetcher.Serve(kListPath, "v0.1.0\nv0.2.0\nv0.3.0-dev\n");

    std::string latest;
    auto r = catalog.LatestStable(ctx, "go-ipfs", latest);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(latest, "v0.2.0");
    ASSERT_EQ(fetcher.requests.size(), 1u);
    EXPECT_EQ(fetcher.requests[0], kListPath);
}

TEST_F(VersionCatalogTests, LatestSkipsNewerDevBetweenReleases) {
    fetcher.Serve(kListPath, "v1.0.0\nv1.1.0-dev\nv1.2.0\n");

    std::string latest;
    ASSERT_TRUE(catalog.LatestStable(ctx, "go-ipfs", latest).ok);
    EXPECT_EQ(latest, "v1.2.0");
}

TEST_F(VersionCatalogTests, ReleaseCandidateCountsAsStable) {
    fetcher.Serve(kListPath, "v0.3.0\nv0.4.0-rc1\nv0.5.0-dev\n");

    std::string latest;
    ASSERT_TRUE(catalog.LatestStable(ctx, "go-ipfs", latest).ok);
    EXPECT_EQ(latest, "v0.4.0-rc1");
}

TEST_F(VersionCatalogTests, OnlyDevVersionsIsNotFound) {
    fetcher.Serve(kListPath, "v0.1.0-dev\nv0.2.0-dev\n");

    std::string latest;
    auto r = catalog.LatestStable(ctx, "go-ipfs", latest);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::NotFound);
    EXPECT_TRUE(latest.empty());
}

TEST_F(VersionCatalogTests, EmptyListIsNotFound) {
    fetcher.Serve(kListPath, "");

    std::string latest;
    auto r = catalog.LatestStable(ctx, "go-ipfs", latest);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::NotFound);
}

TEST_F(VersionCatalogTests, SortsAscendingAndRestoresPrefix) {
    fetcher.Serve(kListPath, "v0.10.0\nv0.2.0\nv0.9.1\nv0.2.0-rc1\n");

    EXPECT_EQ(List(false), (std::vector<std::string>{"v0.2.0-rc1", "v0.2.0", "v0.9.1", "v0.10.0"}));
}

TEST_F(VersionCatalogTests, DescendingIsExactReverse) {
    fetcher.Serve(kListPath, "v1.0.0+b\nv0.5.0\nv1.0.0+a\nv1.0.0\n");

    const auto asc = List(false);
    auto desc = List(true);
    EXPECT_EQ(asc, (std::vector<std::string>{"v0.5.0", "v1.0.0+b", "v1.0.0+a", "v1.0.0"}));
    std::reverse(desc.begin(), desc.end());
    EXPECT_EQ(desc, asc);
}

TEST_F(VersionCatalogTests, DropsUnparseableLinesAndHandlesCrlf) {
    fetcher.Serve(kListPath, "garbage\r\nv1.2\r\n\r\nv0.1.0\r\n1.0.0\r\nvv1.0.0\r\nv0.0.1");

    EXPECT_EQ(List(false), (std::vector<std::string>{"v0.0.1", "v0.1.0", "1.0.0"}));
}

TEST_F(VersionCatalogTests, FetchFailureIsReadError) {
    std::vector<std::string> out;
    auto r = catalog.ListVersions(ctx, "go-ipfs", false, out);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::Read);
    EXPECT_NE(r.msg.find("go-ipfs"), std::string::npos);

    std::string latest;
    auto lr = catalog.LatestStable(ctx, "go-ipfs", latest);
    ASSERT_FALSE(lr.ok);
    EXPECT_EQ(lr.kind, migfetch::ErrorKind::Read);
}

TEST_F(VersionCatalogTests, OverlongLineIsReadError) {
    fetcher.Serve(kListPath, "v0.1.0\n" + std::string(70 * 1024, '1') + "\n");

    std::vector<std::string> out;
    auto r = catalog.ListVersions(ctx, "go-ipfs", false, out);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::Read);
}

TEST_F(VersionCatalogTests, CustomDistRoot) {
    migfetch::VersionCatalog local(fetcher, "/ipfs/QmRoot/");
    fetcher.Serve("/ipfs/QmRoot/fs-repo-migrations/versions", "v1.0.0\n");

    std::vector<std::string> out;
    ASSERT_TRUE(local.ListVersions(ctx, "fs-repo-migrations", false, out).ok);
    EXPECT_EQ(out, std::vector<std::string>{"v1.0.0"});
}

TEST_F(VersionCatalogTests, CancelledContextFailsWithoutFallback) {
    fetcher.Serve(kListPath, "v0.1.0\n");
    ctx.Cancel();

    std::vector<std::string> out;
    auto r = catalog.ListVersions(ctx, "go-ipfs", false, out);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::Cancelled);
}

TEST(ParseVersionListTest, StreamErrorIsReadError) {
    testutil::BrokenReader reader;
    std::vector<migfetch::ListedVersion> out;
    auto r = migfetch::VersionCatalog::ParseVersionList(reader, out);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, migfetch::ErrorKind::Read);
}

TEST(ParseVersionListTest, KeepsPrefixPerEntry) {
    testutil::MemoryReader reader(std::string("v2.0.0\n1.0.0\nr1.5.0\n"));
    std::vector<migfetch::ListedVersion> out;
    ASSERT_TRUE(migfetch::VersionCatalog::ParseVersionList(reader, out).ok);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].ToString(), "1.0.0");
    EXPECT_EQ(out[0].prefix, '\0');
    EXPECT_EQ(out[1].ToString(), "r1.5.0");
    EXPECT_EQ(out[2].ToString(), "v2.0.0");
}

} // namespace
