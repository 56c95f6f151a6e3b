#include <gtest/gtest.h>

#include "remote/MountStore.hpp"
#include "concurrency/Deadline.hpp"
#include "util/errors.hpp"
#include "support.hpp"

#include <chrono>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace mds;
using namespace mds::remote;
using namespace mds::test;
using namespace std::chrono_literals;

class MountStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path mount;
    std::unique_ptr<MountStore> store;

    void SetUp() override {
        test_dir = makeTestDir("mount");
        mount = test_dir / "drive";
        fs::create_directories(mount);
        store = std::make_unique<MountStore>(mount, ".docx", 5s);
    }

    void TearDown() override { fs::remove_all(test_dir); }
};

TEST_F(MountStoreTest, ListsOnlyVisibleRemoteDocumentsSorted) {
    writeTextFile(mount / "b.docx", "b");
    writeTextFile(mount / "a.docx", "a");
    writeTextFile(mount / "notes.txt", "x");
    writeTextFile(mount / ".~lock.a.docx", "x");
    fs::create_directories(mount / "sub.docx");

    const auto docs = store->listDocuments();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].name, "a.docx");
    EXPECT_EQ(docs[0].location, "a.docx");
    EXPECT_EQ(docs[1].name, "b.docx");
    EXPECT_EQ(docs[1].modified, util::modifiedTime(mount / "b.docx"));
}

TEST_F(MountStoreTest, StoreCreatesThenOverwritesByName) {
    writeTextFile(test_dir / "v1.docx", "first");
    writeTextFile(test_dir / "v2.docx", "second");

    EXPECT_EQ(store->store("report.docx", test_dir / "v1.docx"), "report.docx");
    EXPECT_EQ(util::readFileToString(mount / "report.docx"), "first");

    EXPECT_EQ(store->store("report.docx", test_dir / "v2.docx"), "report.docx");
    EXPECT_EQ(util::readFileToString(mount / "report.docx"), "second");
    EXPECT_EQ(store->listDocuments().size(), 1u);
}

TEST_F(MountStoreTest, FetchCopiesContent) {
    writeTextFile(mount / "c.docx", "remote body");
    store->fetch("c.docx", test_dir / "out.docx");
    EXPECT_EQ(util::readFileToString(test_dir / "out.docx"), "remote body");
}

TEST_F(MountStoreTest, FetchOfMissingDocumentIsATransferError) {
    EXPECT_THROW(store->fetch("gone.docx", test_dir / "out.docx"), TransferError);
}

TEST_F(MountStoreTest, LocationsCannotEscapeTheFolder) {
    writeTextFile(test_dir / "secret.docx", "x");
    EXPECT_THROW(store->fetch("../secret.docx", test_dir / "out.docx"), TransferError);
    EXPECT_THROW((void)store->store("../escape.docx", test_dir / "secret.docx"), TransferError);
}

TEST_F(MountStoreTest, UnreachableFolderIsARemoteError) {
    fs::remove_all(mount);
    EXPECT_THROW((void)store->listDocuments(), RemoteError);
}

TEST_F(MountStoreTest, StoreIntoVanishedFolderIsARemoteError) {
    writeTextFile(test_dir / "v1.docx", "first");
    fs::remove_all(mount);
    EXPECT_THROW((void)store->store("report.docx", test_dir / "v1.docx"), RemoteError);
}

TEST_F(MountStoreTest, StoreNeverLeavesStagingFilesBehind) {
    writeTextFile(test_dir / "v1.docx", "first");
    (void)store->store("report.docx", test_dir / "v1.docx");
    EXPECT_THROW((void)store->store("report.docx", test_dir / "missing.docx"), TransferError);

    std::vector<std::string> names;
    for (const auto& e : fs::directory_iterator(mount)) names.push_back(e.path().filename().string());
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "report.docx");
    EXPECT_EQ(util::readFileToString(mount / "report.docx"), "first");
}

TEST_F(MountStoreTest, BlockedStoreGivesUpAtTheDeadline) {
    // reading a fifo with no writer blocks, like a stalled network mount
    const auto fifo = test_dir / "stalled.docx";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);

    MountStore slow(mount, ".docx", 50ms);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW((void)slow.store("stalled.docx", fifo), TransferError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    // release the abandoned call so it finishes before the folder is removed
    int fd = -1;
    for (int i = 0; i < 200 && fd < 0; ++i) {
        fd = ::open(fifo.c_str(), O_WRONLY | O_NONBLOCK);
        if (fd < 0) std::this_thread::sleep_for(10ms);
    }
    ASSERT_GE(fd, 0);
    ::close(fd);
    for (int i = 0; i < 200 && !fs::exists(mount / "stalled.docx"); ++i) std::this_thread::sleep_for(10ms);
}

TEST(DeadlineTest, ExpiredCallRaisesTheRequestedError) {
    EXPECT_THROW(concurrency::withDeadline<RemoteError>(20ms, "Listing slow folder", [] {
        std::this_thread::sleep_for(300ms);
        return 1;
    }), RemoteError);

    try {
        concurrency::withDeadline<TransferError>(20ms, "Fetching a.docx", [] { std::this_thread::sleep_for(300ms); });
        FAIL() << "expected a timeout";
    } catch (const TransferError& e) {
        EXPECT_EQ(std::string(e.what()), "Fetching a.docx timed out after 20ms");
    }
}

TEST(DeadlineTest, ResultsAndErrorsPassThroughInTime) {
    EXPECT_EQ(concurrency::withDeadline<RemoteError>(2s, "quick", [] { return 7; }), 7);
    EXPECT_THROW(concurrency::withDeadline<RemoteError>(2s, "failing", [] { throw TransferError("boom"); }),
                 TransferError);
}

TEST(DeadlineTest, NonPositiveLimitWaitsForTheResult) {
    const auto value = concurrency::withDeadline<RemoteError>(0ms, "unbounded", [] {
        std::this_thread::sleep_for(50ms);
        return std::string("done");
    });
    EXPECT_EQ(value, "done");
}
