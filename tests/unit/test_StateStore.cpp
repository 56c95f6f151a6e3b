#include <gtest/gtest.h>

#include "state/Lock.hpp"
#include "state/Store.hpp"
#include "util/errors.hpp"
#include "support.hpp"

#include <nlohmann/json.hpp>

using namespace mds;
using namespace mds::state;
using namespace mds::test;

class StateStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override { test_dir = makeTestDir("state"); }
    void TearDown() override { fs::remove_all(test_dir); }

    [[nodiscard]] Store store() const { return Store::forDirectory(test_dir, ".mdsync_config.json"); }

    [[nodiscard]] SyncConfig sampleConfig() const {
        SyncConfig cfg;
        cfg.local_path = test_dir;
        cfg.remote.backend = remote::Backend::Drive;
        cfg.remote.folder_id = "1AbC";
        cfg.remote.folder_name = "Notes";
        cfg.last_sync = util::parseTimestamp("2026-10-19T10:00:00Z");
        cfg.files["report.md"] = SyncRecord{
            "1XyZ",
            util::parseTimestamp("2026-10-19T10:00:00.250000Z"),
            util::parseTimestamp("2026-10-19T09:59:58.120000Z")
        };
        return cfg;
    }
};

TEST_F(StateStoreTest, MissingFileMeansNotInitialized) {
    EXPECT_FALSE(store().exists());
    EXPECT_THROW((void)store().load(), NotInitializedError);
}

TEST_F(StateStoreTest, SaveThenLoadPreservesMappingAndTimestamps) {
    const auto cfg = sampleConfig();
    store().save(cfg);

    const auto loaded = store().load();
    EXPECT_EQ(loaded.local_path, cfg.local_path);
    EXPECT_EQ(loaded.remote.backend, remote::Backend::Drive);
    EXPECT_EQ(loaded.remote.folder_id, "1AbC");
    EXPECT_EQ(loaded.last_sync, cfg.last_sync);
    ASSERT_EQ(loaded.files.size(), 1u);

    const auto* rec = loaded.find("report.md");
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->remote_location, "1XyZ");
    EXPECT_EQ(rec->last_upload, cfg.files.at("report.md").last_upload);
    EXPECT_EQ(rec->local_mtime, cfg.files.at("report.md").local_mtime);
}

TEST_F(StateStoreTest, PersistedLayoutUsesDocumentedKeys) {
    store().save(sampleConfig());
    const auto j = nlohmann::json::parse(util::readFileToString(store().path()));

    EXPECT_EQ(j.at("remote").at("backend"), "drive");
    EXPECT_EQ(j.at("last_sync"), "2026-10-19T10:00:00.000000Z");
    EXPECT_EQ(j.at("files").at("report.md").at("remote_location"), "1XyZ");
    EXPECT_EQ(j.at("files").at("report.md").at("last_upload"), "2026-10-19T10:00:00.250000Z");
}

TEST_F(StateStoreTest, UnknownFieldsAndNullTimestampsAreTolerated) {
    writeTextFile(store().path(), R"({
        "local_path": "/tmp/notes",
        "remote": {"backend": "mount", "path": "/mnt/drive/Notes", "future": true},
        "last_sync": null,
        "schema": 7,
        "files": {
            "a.md": {"remote_location": "a.docx", "last_upload": null, "checksum": "abc"},
            "b.md": {"remote_location": "b.docx"}
        }
    })");

    const auto cfg = store().load();
    EXPECT_EQ(cfg.remote.backend, remote::Backend::Mount);
    EXPECT_EQ(cfg.remote.path, fs::path("/mnt/drive/Notes"));
    EXPECT_FALSE(cfg.last_sync.has_value());
    ASSERT_EQ(cfg.files.size(), 2u);
    EXPECT_FALSE(cfg.files.at("a.md").hasBaseline());
    EXPECT_FALSE(cfg.files.at("b.md").local_mtime.has_value());
}

TEST_F(StateStoreTest, CorruptFileIsAPersistenceError) {
    writeTextFile(store().path(), "{\"local_path\": \"/tmp\", \"remote\": ");
    EXPECT_THROW((void)store().load(), PersistenceError);
}

TEST_F(StateStoreTest, NaiveTimestampInFileIsRejected) {
    writeTextFile(store().path(), R"({"local_path": "/tmp", "remote": {"backend": "mount", "path": "/tmp"},
        "last_sync": "2026-10-19T10:00:00"})");
    EXPECT_THROW((void)store().load(), PersistenceError);
}

TEST_F(StateStoreTest, InterruptedSaveLeavesPreviousConfigReadable) {
    auto cfg = sampleConfig();
    store().save(cfg);

    // A crash between writing the temp sibling and the rename leaves only a stray temp file.
    writeTextFile(util::tempSiblingFor(store().path()), "{\"local_path\": \"/tm");

    const auto loaded = store().load();
    EXPECT_EQ(loaded.files.size(), 1u);

    cfg.files.erase("report.md");
    store().save(cfg);
    EXPECT_TRUE(store().load().files.empty());
}

TEST_F(StateStoreTest, SaveIntoMissingDirectoryFails) {
    const auto missing = Store::forDirectory(test_dir / "nope", ".mdsync_config.json");
    EXPECT_THROW(missing.save(sampleConfig()), PersistenceError);
}

TEST_F(StateStoreTest, SecondLockHolderFailsFast) {
    const auto lockPath = Lock::pathFor(store().path());
    EXPECT_EQ(lockPath.filename(), ".mdsync_config.json.lock");

    {
        const Lock first(lockPath);
        EXPECT_THROW(Lock second(lockPath), SyncInProgressError);
    }

    EXPECT_NO_THROW(Lock again(lockPath));
}
