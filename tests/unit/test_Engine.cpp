#include <gtest/gtest.h>
#include "sync/Engine.hpp"
#include "sync/Progress.hpp"
#include "sync/TransferFailed.hpp"
#include "FakeClient.hpp"
#include "TempDir.hpp"

using namespace zs;
using namespace zs::sync;

class EngineTest : public ::testing::Test {
protected:
    test::TempDir src;
    std::shared_ptr<test::FakeClient> client = std::make_shared<test::FakeClient>();
    config::Config cfg;

    void SetUp() override {
        cfg.storage.zone = "zone";
        cfg.storage.access_key = "secret";
        cfg.sync.local_path = src.path();
        cfg.sync.parallel = 4;
    }

    model::Summary run() {
        Engine engine(cfg, client);
        return engine.run();
    }
};

TEST_F(EngineTest, UploadMirrorsLocalTreeAndDeletesStaleObjects) {
    src.write("index.html", "<html/>");
    src.write("js/app.js", "console.log(1)");
    client->put("zone/stale.txt", "old");

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 2u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(client->data("zone/js/app.js"), "console.log(1)");
    EXPECT_FALSE(client->has("zone/stale.txt"));
    EXPECT_EQ(summary.toString(), "Summary: 2 uploaded, 0 skipped, 1 deleted");
}

TEST_F(EngineTest, SecondRunIsANoOp) {
    src.write("a.txt", "alpha");
    src.write("sub/b.txt", "beta");
    run();
    client->clearCalls();

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 0u);
    EXPECT_EQ(summary.deleted, 0u);
    EXPECT_EQ(summary.skipped, 2u);
    EXPECT_EQ(client->mutatingCalls(), 0u);
}

TEST_F(EngineTest, TiersUploadInOrderRegardlessOfEnumeration) {
    src.write("manifest.json", "{}");
    src.write("index.html", "<html/>");
    src.write("a.txt", "a");
    cfg.sync.parallel = 1;
    cfg.sync.upload_last = {"manifest.json"};

    run();

    EXPECT_EQ(client->callsOf("PUT"),
              (std::vector<std::string>{"zone/a.txt", "zone/index.html", "zone/manifest.json"}));
}

TEST_F(EngineTest, UploadsUnderRemotePath) {
    src.write("a.txt", "a");
    client->put("zone/other/keep.txt", "k");
    cfg.sync.remote_path = "/v1.2.3/";

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 1u);
    EXPECT_TRUE(client->has("zone/v1.2.3/a.txt"));
    EXPECT_TRUE(client->has("zone/other/keep.txt"));
}

TEST_F(EngineTest, DownloadMirrorsRemoteAndDeletesLocalOrphans) {
    client->put("zone/docs/readme.md", "# hi");
    client->put("zone/same.txt", "same");
    src.write("same.txt", "same");
    src.write("orphan/old.txt", "old");
    cfg.sync.direction = model::Direction::Download;

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_EQ(src.read("docs/readme.md"), "# hi");
    EXPECT_FALSE(src.exists("orphan/old.txt"));
    EXPECT_FALSE(src.exists("orphan"));
    EXPECT_EQ(summary.toString(), "Summary: 1 downloaded, 1 skipped, 1 deleted");
}

TEST_F(EngineTest, DownloadCreatesMissingLocalRoot) {
    client->put("zone/a.txt", "a");
    cfg.sync.direction = model::Direction::Download;
    cfg.sync.local_path = src.path() / "fresh";

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 1u);
    EXPECT_EQ(src.read("fresh/a.txt"), "a");
}

TEST_F(EngineTest, DryRunChangesNothingButReportsCounts) {
    src.write("a.txt", "a");
    client->put("zone/stale.txt", "old");
    cfg.sync.dry_run = true;

    Engine engine(cfg, client);
    const auto summary = engine.run();

    EXPECT_EQ(summary.transferred, 1u);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_TRUE(summary.dry_run);
    EXPECT_EQ(client->mutatingCalls(), 0u);
    EXPECT_TRUE(client->has("zone/stale.txt"));
    EXPECT_EQ(engine.progress()->snapshot().completed_files, 1u);
}

TEST_F(EngineTest, FailedTransferAbortsBeforeLaterTiersAndDeletions) {
    src.write("a.txt", "a");
    src.write("index.html", "<html/>");
    client->put("zone/stale.txt", "old");
    client->failUploads.insert("zone/a.txt");

    EXPECT_THROW(run(), TransferFailed);
    EXPECT_TRUE(client->callsOf("DELETE").empty());
    EXPECT_FALSE(client->has("zone/index.html"));
    EXPECT_TRUE(client->has("zone/stale.txt"));
}

TEST_F(EngineTest, CollectPolicyFinishesTheRunAndCountsFailures) {
    src.write("a.txt", "a");
    src.write("index.html", "<html/>");
    client->put("zone/stale.txt", "old");
    client->failUploads.insert("zone/a.txt");
    cfg.sync.failure_policy = model::FailurePolicy::Collect;

    const auto summary = run();

    EXPECT_EQ(summary.transferred, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_FALSE(summary.ok());
}

TEST_F(EngineTest, MissingLocalRootFailsBeforeAnyRemoteCall) {
    cfg.sync.local_path = src.path() / "missing";
    EXPECT_THROW(run(), storage::StorageError);
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(EngineTest, ListingFailureAbortsTheRun) {
    src.write("a.txt", "a");
    client->failLists.insert("zone/");
    EXPECT_THROW(run(), storage::StorageError);
    EXPECT_EQ(client->mutatingCalls(), 0u);
}
