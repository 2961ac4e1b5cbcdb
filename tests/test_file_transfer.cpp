#include <gtest/gtest.h>
#include <ssh/file_transfer.hpp>
#include "fakes.hpp"

class FileTransferTest : public ::testing::Test {
protected:
    TempDir local{"transfer_local"};
    TempDir remote{"transfer_remote"};
    std::shared_ptr<FakeFactory> factory = std::make_shared<FakeFactory>();

    void SetUp() override {
        factory->state->remote_root = remote.path();
    }

    ConnectionConfig config() const {
        ConnectionConfig c;
        c.host = "storage";
        c.user = "backup";
        return c;
    }

    std::vector<TransferEvent::Kind> kinds() const {
        std::vector<TransferEvent::Kind> out;
        for (const auto& e : factory->state->events) out.push_back(e.kind);
        return out;
    }
};

TEST_F(FileTransferTest, UploadThenDownloadRoundTrips) {
    std::string payload = "line one\nline two\n\x01\x02 binary tail";
    auto a = local.write("a.txt", payload);
    auto c = local.path() / "c.txt";

    ConnectionManager conn(config(), factory);
    FileTransferService files(conn);

    auto up = files.upload(a.string(), "/tmp/b.txt");
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_TRUE(up.value);

    auto down = files.download("/tmp/b.txt", c.string());
    ASSERT_TRUE(down.is_ok()) << down.error;
    EXPECT_TRUE(down.value);

    EXPECT_EQ(TempDir::read(c), payload);
    EXPECT_EQ(factory->state->sftp_opened, 1);
    EXPECT_EQ(factory->state->sessions_opened, 0);  // exec session untouched
}

TEST_F(FileTransferTest, UploadEmitsLifecycleEvents) {
    auto a = local.write("a.txt", std::string(20, 'x'));

    ConnectionManager conn(config(), factory);
    ASSERT_TRUE(FileTransferService(conn).upload(a.string(), "/data/new/dir/b.txt").is_ok());

    using K = TransferEvent::Kind;
    std::vector<K> expected{K::Mkdir, K::Open, K::Put, K::Put, K::Put, K::Close, K::Finish};
    EXPECT_EQ(kinds(), expected);

    const auto& events = factory->state->events;
    EXPECT_EQ(events[2].offset, 0u);
    EXPECT_EQ(events[2].size, 8u);
    EXPECT_EQ(events[4].offset, 16u);
    EXPECT_EQ(events[4].size, 4u);
    EXPECT_EQ(events[5].path, "/data/new/dir/b.txt");
}

TEST_F(FileTransferTest, EventsAreLogged) {
    ScopedLog log("transfer_events");
    auto a = local.write("a.txt", "abc");

    ConnectionManager conn(config(), factory);
    ASSERT_TRUE(FileTransferService(conn).upload(a.string(), "/tmp/b.txt").is_ok());

    std::string text = log.contents();
    EXPECT_NE(text.find("upload(\"" + a.string() + "\", \"/tmp/b.txt\")"), std::string::npos);
    EXPECT_NE(text.find("put(/tmp/b.txt, size 3 bytes, offset 0)"), std::string::npos);
    EXPECT_NE(text.find("finish"), std::string::npos);
}

TEST_F(FileTransferTest, TransientFailureReconnectsAndSucceeds) {
    auto a = local.write("a.txt", "payload");
    factory->state->transfer_transient_failures = 2;

    ConnectionManager conn(config(), factory);
    auto up = FileTransferService(conn).upload(a.string(), "/tmp/b.txt");

    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(factory->state->transfer_calls, 3);
    EXPECT_EQ(factory->state->sftp_opened, 3);
    EXPECT_EQ(TempDir::read(remote.path() / "tmp/b.txt"), "payload");
}

TEST_F(FileTransferTest, TransientFailureGivesUpAfterThreeAttempts) {
    auto a = local.write("a.txt", "payload");
    factory->state->transfer_transient_failures = 10;

    ConnectionManager conn(config(), factory);
    auto up = FileTransferService(conn).upload(a.string(), "/tmp/b.txt");

    ASSERT_TRUE(up.is_err());
    EXPECT_EQ(up.kind, ErrorKind::TransientIO);
    EXPECT_EQ(factory->state->transfer_calls, 3);
}

TEST_F(FileTransferTest, PermanentFailureIsTransferError) {
    auto a = local.write("a.txt", "payload");
    factory->state->transfer_error = ErrorKind::Transfer;

    ConnectionManager conn(config(), factory);
    auto up = FileTransferService(conn).upload(a.string(), "/root/b.txt");

    ASSERT_TRUE(up.is_err());
    EXPECT_EQ(up.kind, ErrorKind::Transfer);
    EXPECT_NE(up.error.find("upload failed"), std::string::npos);
    EXPECT_NE(up.error.find("/root/b.txt"), std::string::npos);
    EXPECT_EQ(factory->state->transfer_calls, 1);
}

TEST_F(FileTransferTest, MissingRemoteFileFailsDownload) {
    ConnectionManager conn(config(), factory);
    auto down = FileTransferService(conn).download("/nope.txt", (local.path() / "x").string());

    ASSERT_TRUE(down.is_err());
    EXPECT_EQ(down.kind, ErrorKind::Transfer);
    EXPECT_NE(down.error.find("download failed (/nope.txt -> "), std::string::npos);
}

TEST_F(FileTransferTest, ConnectionFailureKeepsItsKind) {
    factory->state->connect_error = ErrorKind::Connection;
    auto a = local.write("a.txt", "payload");

    ConnectionManager conn(config(), factory);
    auto up = FileTransferService(conn).upload(a.string(), "/tmp/b.txt");

    ASSERT_TRUE(up.is_err());
    EXPECT_EQ(up.kind, ErrorKind::Connection);
    EXPECT_EQ(factory->state->transfer_calls, 0);
}
