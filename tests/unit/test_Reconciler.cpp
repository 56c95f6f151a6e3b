#include <gtest/gtest.h>

#include "sync/Reconciler.hpp"
#include "sync/Workspace.hpp"
#include "remote/MountStore.hpp"
#include "runtime/Context.hpp"
#include "state/SyncConfig.hpp"
#include "util/errors.hpp"
#include "support.hpp"

#include <algorithm>
#include <atomic>
#include <fmt/core.h>

using namespace mds;
using namespace mds::sync;
using namespace mds::sync::model;
using namespace mds::test;
using namespace std::chrono_literals;

class ReconcilerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path local;
    fs::path mount;
    std::shared_ptr<FakeConverter> converter;
    std::shared_ptr<remote::MountStore> store;
    runtime::Context ctx;
    state::SyncConfig config;

    void SetUp() override {
        test_dir = makeTestDir("reconcile");
        local = test_dir / "notes";
        mount = test_dir / "drive";
        fs::create_directories(local);
        fs::create_directories(mount);

        converter = std::make_shared<FakeConverter>();
        store = std::make_shared<remote::MountStore>(mount, ".docx");

        ctx.converter = converter;

        config.local_path = local;
        config.remote.backend = remote::Backend::Mount;
        config.remote.path = mount;
    }

    void TearDown() override { fs::remove_all(test_dir); }

    Report runOnce() {
        const Workspace scratch;
        return Reconciler(ctx, store).run(config, scratch.path());
    }
};

TEST_F(ReconcilerTest, NewLocalDocumentsArePushedOnceThenIdle) {
    writeTextFile(local / "a.md", "# A");
    writeTextFile(local / "b.md", "# B");

    const auto before = util::now();
    const auto first = runOnce();
    const auto after = util::now();

    EXPECT_EQ(first.pushed(), 2u);
    EXPECT_EQ(first.pulled(), 0u);
    EXPECT_FALSE(first.hasWarnings());

    EXPECT_EQ(util::readFileToString(mount / "a.docx"), "to-remote:# A");
    EXPECT_EQ(util::readFileToString(mount / "b.docx"), "to-remote:# B");

    ASSERT_EQ(config.files.size(), 2u);
    for (const auto& [name, rec] : config.files) {
        ASSERT_TRUE(rec.last_upload.has_value()) << name;
        EXPECT_GE(*rec.last_upload, before);
        EXPECT_LE(*rec.last_upload, after);
        EXPECT_EQ(rec.local_mtime, util::modifiedTime(local / name));
    }
    EXPECT_EQ(config.files.at("a.md").remote_location, "a.docx");

    const auto mapping = config.files;
    const int callsAfterFirst = converter->calls.load();

    const auto second = runOnce();
    EXPECT_TRUE(second.outcomes.empty());
    EXPECT_EQ(second.unchanged_local, 2u);
    EXPECT_EQ(second.unchanged_remote, 2u);
    EXPECT_EQ(converter->calls.load(), callsAfterFirst);

    for (const auto& [name, rec] : mapping) {
        EXPECT_EQ(config.files.at(name).last_upload, rec.last_upload);
        EXPECT_EQ(config.files.at(name).remote_location, rec.remote_location);
    }
}

TEST_F(ReconcilerTest, RemoteOnlyDocumentIsPulled) {
    writeTextFile(mount / "c.docx", "binary c");

    const auto report = runOnce();

    EXPECT_EQ(report.pulled(), 1u);
    EXPECT_EQ(report.pushed(), 0u);
    EXPECT_EQ(util::readFileToString(local / "c.md"), "to-local:binary c");

    const auto* rec = config.find("c.md");
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->remote_location, "c.docx");
    ASSERT_TRUE(rec->last_upload.has_value());
    EXPECT_EQ(rec->local_mtime, util::modifiedTime(local / "c.md"));
    EXPECT_LE(*rec->local_mtime, *rec->last_upload);

    // the freshly written c.md must not bounce back as a push
    EXPECT_TRUE(runOnce().outcomes.empty());
}

TEST_F(ReconcilerTest, OneFailingConversionDoesNotStopTheOthers) {
    writeTextFile(local / "a.md", "a");
    writeTextFile(local / "b.md", "b");
    writeTextFile(local / "c.md", "c");
    converter->failFor = {"b.md"};

    const auto report = runOnce();

    EXPECT_EQ(report.pushed(), 2u);
    EXPECT_EQ(report.failed(), 1u);
    EXPECT_TRUE(report.hasWarnings());
    EXPECT_TRUE(config.files.contains("a.md"));
    EXPECT_TRUE(config.files.contains("c.md"));
    EXPECT_FALSE(config.files.contains("b.md"));
    EXPECT_FALSE(fs::exists(mount / "b.docx"));

    const auto failed = std::ranges::find(report.outcomes, Outcome::Status::Failed, &Outcome::status);
    ASSERT_NE(failed, report.outcomes.end());
    EXPECT_EQ(failed->key, "b.md");
    EXPECT_NE(failed->reason.find("forced conversion failure"), std::string::npos);

    // next run retries only the failed document
    converter->failFor.clear();
    const auto retry = runOnce();
    ASSERT_EQ(retry.outcomes.size(), 1u);
    EXPECT_EQ(retry.outcomes[0].key, "b.md");
    EXPECT_EQ(retry.outcomes[0].status, Outcome::Status::Pushed);
}

TEST_F(ReconcilerTest, FailedPullLeavesNoPartialLocalFile) {
    writeTextFile(mount / "d.docx", "d");
    converter->failFor = {"fetched.docx"};

    const auto report = runOnce();

    EXPECT_EQ(report.failed(), 1u);
    EXPECT_FALSE(fs::exists(local / "d.md"));
    EXPECT_FALSE(config.files.contains("d.md"));
}

TEST_F(ReconcilerTest, NewerLocalEditIsPushedAgain) {
    writeTextFile(local / "a.md", "v1");
    runOnce();

    writeTextFile(local / "a.md", "v2");
    setModifiedTime(local / "a.md", *config.files.at("a.md").last_upload + 1s);

    const auto report = runOnce();
    EXPECT_EQ(report.pushed(), 1u);
    EXPECT_EQ(report.pulled(), 0u);
    EXPECT_EQ(util::readFileToString(mount / "a.docx"), "to-remote:v2");
}

TEST_F(ReconcilerTest, NewerRemoteEditIsPulled) {
    writeTextFile(local / "a.md", "v1");
    runOnce();

    writeTextFile(mount / "a.docx", "edited in drive");
    setModifiedTime(mount / "a.docx", *config.files.at("a.md").last_upload + 1s);

    const auto report = runOnce();
    EXPECT_EQ(report.pulled(), 1u);
    EXPECT_EQ(report.pushed(), 0u);
    EXPECT_EQ(util::readFileToString(local / "a.md"), "to-local:edited in drive");
}

TEST_F(ReconcilerTest, RecordWithoutBaselineForcesSync) {
    writeTextFile(local / "a.md", "a");
    config.files["a.md"] = state::SyncRecord{"a.docx", std::nullopt, std::nullopt};

    const auto report = runOnce();
    EXPECT_EQ(report.pushed(), 1u);
    EXPECT_TRUE(config.files.at("a.md").hasBaseline());
}

TEST_F(ReconcilerTest, NonDocumentsAndHiddenFilesAreIgnored) {
    writeTextFile(local / "todo.txt", "x");
    writeTextFile(local / ".draft.md", "x");
    writeTextFile(local / ".mdsync_config.json", "{}");

    const auto report = runOnce();
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(converter->calls.load(), 0);
}

TEST_F(ReconcilerTest, UnreachableRemoteAbortsTheRun) {
    writeTextFile(local / "a.md", "a");
    fs::remove_all(mount);

    EXPECT_THROW((void)runOnce(), RemoteError);
    EXPECT_TRUE(config.files.empty());
}

namespace {

// Rejects every upload the way an expired Drive token does.
class RejectingStore final : public remote::Store {
public:
    std::atomic<int> storeCalls{0};

    std::vector<remote::RemoteDocument> listDocuments() override { return {}; }
    void fetch(const std::string&, const fs::path&) override { throw TransferError("not used"); }

    std::string store(const std::string& name, const fs::path&) override {
        ++storeCalls;
        throw RemoteAuthError("token rejected while storing " + name);
    }

    std::string describe() const override { return "rejecting store"; }
};

}

TEST_F(ReconcilerTest, RemoteFailureSkipsTheRemainingQueue) {
    ctx.config.sync.workers = 1;
    for (int i = 0; i < 20; ++i) writeTextFile(local / fmt::format("doc{:02}.md", i), std::to_string(i));
    const auto rejecting = std::make_shared<RejectingStore>();

    const Workspace scratch;
    EXPECT_THROW((void)Reconciler(ctx, rejecting).run(config, scratch.path()), RemoteAuthError);

    EXPECT_EQ(rejecting->storeCalls.load(), 1);
    EXPECT_EQ(converter->calls.load(), 1);
    EXPECT_TRUE(config.files.empty());
}

TEST_F(ReconcilerTest, ParallelWorkersReachTheSameState) {
    ctx.config.sync.workers = 4;
    for (int i = 0; i < 12; ++i) writeTextFile(local / fmt::format("doc{:02}.md", i), std::to_string(i));
    for (int i = 0; i < 5; ++i) writeTextFile(mount / fmt::format("remote{:02}.docx", i), std::to_string(i));

    const auto report = runOnce();

    EXPECT_EQ(report.pushed(), 12u);
    EXPECT_EQ(report.pulled(), 5u);
    EXPECT_EQ(config.files.size(), 17u);
    EXPECT_TRUE(runOnce().outcomes.empty());
}

TEST_F(ReconcilerTest, InterruptedRunStopsBeforeThePullPhase) {
    writeTextFile(local / "a.md", "a");
    writeTextFile(mount / "c.docx", "c");
    ctx.interrupted = [] { return true; };

    const auto report = runOnce();

    EXPECT_TRUE(report.interrupted);
    EXPECT_EQ(report.pushed(), 0u);
    EXPECT_EQ(report.pulled(), 0u);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].key, "a.md");
    EXPECT_NE(report.outcomes[0].reason.find("interrupted"), std::string::npos);
    EXPECT_TRUE(config.files.empty());
    EXPECT_FALSE(fs::exists(local / "c.md"));
    EXPECT_EQ(converter->calls.load(), 0);

    ctx.interrupted = [] { return false; };
    const auto resumed = runOnce();
    EXPECT_FALSE(resumed.interrupted);
    EXPECT_EQ(resumed.pushed(), 1u);
    EXPECT_EQ(resumed.pulled(), 1u);
}

TEST_F(ReconcilerTest, ScratchSpaceIsRemovedAfterTheRun) {
    writeTextFile(local / "a.md", "a");
    fs::path scratchPath;
    {
        const Workspace scratch;
        scratchPath = scratch.path();
        Reconciler(ctx, store).run(config, scratch.path());
        EXPECT_TRUE(fs::exists(scratchPath / "push"));
    }
    EXPECT_FALSE(fs::exists(scratchPath));
}
