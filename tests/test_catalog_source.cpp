#include "catalog/catalog_source.hpp"
#include "testing.hpp"

#include <chrono>
#include <gtest/gtest.h>

namespace otasrv {

namespace {

const FamilySpec kPlugin{.name = "plugin", .extension = ".wasm"};

class CatalogSourceTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

} // namespace

TEST_F(CatalogSourceTest, ScanningSourceSeesNewFilesImmediately) {
    ScanningCatalogSource source(tmp.Path(), kPlugin);

    CatalogPtr catalog;
    ASSERT_TRUE(source.Snapshot(catalog).ok);
    EXPECT_TRUE(catalog->Empty());

    tmp.WriteFile("plugin_1.0.0.wasm", "x");
    ASSERT_TRUE(source.Snapshot(catalog).ok);
    EXPECT_EQ(catalog->LatestVersionText(), "1.0.0");
}

TEST_F(CatalogSourceTest, CachedSourceServesStaleSnapshotUntilRefresh) {
    tmp.WriteFile("plugin_1.0.0.wasm", "x");
    CachedCatalogSource source(tmp.Path(), kPlugin, std::chrono::hours(1));

    CatalogPtr first;
    ASSERT_TRUE(source.Snapshot(first).ok);
    EXPECT_EQ(first->LatestVersionText(), "1.0.0");

    tmp.WriteFile("plugin_2.0.0.wasm", "y");
    CatalogPtr second;
    ASSERT_TRUE(source.Snapshot(second).ok);
    EXPECT_EQ(second.get(), first.get());
    EXPECT_EQ(second->LatestVersionText(), "1.0.0");

    ASSERT_TRUE(source.Refresh().ok);
    CatalogPtr third;
    ASSERT_TRUE(source.Snapshot(third).ok);
    EXPECT_EQ(third->LatestVersionText(), "2.0.0");
    // Earlier snapshots stay valid for requests still holding them.
    EXPECT_EQ(first->LatestVersionText(), "1.0.0");
}

TEST_F(CatalogSourceTest, CachedSourceRescansOnceExpired) {
    CachedCatalogSource source(tmp.Path(), kPlugin, std::chrono::nanoseconds(1));

    CatalogPtr catalog;
    ASSERT_TRUE(source.Snapshot(catalog).ok);
    EXPECT_TRUE(catalog->Empty());

    tmp.WriteFile("plugin_1.2.0.wasm", "x");
    ASSERT_TRUE(source.Snapshot(catalog).ok);
    EXPECT_EQ(catalog->LatestVersionText(), "1.2.0");
}

TEST_F(CatalogSourceTest, FailedRefreshKeepsPreviousSnapshot) {
    const std::string dir = tmp.MakeDir("artifacts");
    tmp.WriteFile("artifacts/plugin_1.0.0.wasm", "x");
    CachedCatalogSource source(dir, kPlugin, std::chrono::hours(1));

    CatalogPtr catalog;
    ASSERT_TRUE(source.Snapshot(catalog).ok);

    tmp.Remove("artifacts/plugin_1.0.0.wasm");
    ASSERT_EQ(::rmdir(dir.c_str()), 0);
    EXPECT_FALSE(source.Refresh().ok);

    CatalogPtr after;
    ASSERT_TRUE(source.Snapshot(after).ok);
    EXPECT_EQ(after->LatestVersionText(), "1.0.0");
}

TEST_F(CatalogSourceTest, FactoryPicksSourceByInterval) {
    auto scanning = MakeCatalogSource(tmp.Path(), kPlugin, std::chrono::seconds(0));
    EXPECT_NE(dynamic_cast<ScanningCatalogSource*>(scanning.get()), nullptr);

    auto cached = MakeCatalogSource(tmp.Path(), kPlugin, std::chrono::seconds(30));
    EXPECT_NE(dynamic_cast<CachedCatalogSource*>(cached.get()), nullptr);
}

} // namespace otasrv
