// ============================================================
// test_session_coordinator.cpp -- Whole nodes talking over one hub
// ============================================================

#include "../session/session_coordinator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

class RecordingSink : public UiSink {
public:
    void on_chat(const ChatMessageFrame& msg, const std::string& sender_name) override {
        std::lock_guard<std::mutex> lk(mutex_);
        chats_.push_back(sender_name + ": " + msg.text);
    }

    void on_secure_chat(const SecureMessage& msg) override {
        std::lock_guard<std::mutex> lk(mutex_);
        secure_.push_back(msg.text);
    }

    void on_transfer_offer(const TransferJobInfo& job) override {
        std::lock_guard<std::mutex> lk(mutex_);
        offers_.push_back(job);
    }

    void on_notification(const Notification& n) override {
        std::lock_guard<std::mutex> lk(mutex_);
        notes_.push_back(n);
    }

    std::vector<std::string> chats() {
        std::lock_guard<std::mutex> lk(mutex_);
        return chats_;
    }

    std::vector<std::string> secure() {
        std::lock_guard<std::mutex> lk(mutex_);
        return secure_;
    }

    std::vector<TransferJobInfo> offers() {
        std::lock_guard<std::mutex> lk(mutex_);
        return offers_;
    }

    bool has_note(const std::string& kind, u64 ref_id = 0) {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& n : notes_) {
            if (n.kind == kind && (ref_id == 0 || n.ref_id == ref_id)) return true;
        }
        return false;
    }

private:
    std::mutex                   mutex_;
    std::vector<std::string>     chats_;
    std::vector<std::string>     secure_;
    std::vector<TransferJobInfo> offers_;
    std::vector<Notification>    notes_;
};

struct Node {
    LanConfig                                cfg;
    std::shared_ptr<StaticInterfaceProvider> iface;
    std::shared_ptr<RecordingSink>           sink;
    std::unique_ptr<SessionCoordinator>      session;

    bool knows(u64 node_id) const {
        for (auto& p : session->peers()) {
            if (p.node_id == node_id) return true;
        }
        return false;
    }
};

class SessionCoordinatorTest : public ::testing::Test {
protected:
    SessionCoordinatorTest() : hub_(std::make_shared<DatagramHub>()) {}

    void SetUp() override {
        hub_->set_copies(2);
        alice_ = make_node("alice");
        bob_   = make_node("bob");
        zed_   = make_node("zed");
        ASSERT_TRUE(wait_until([&] {
            return alice_->knows(bob_->session->node_id()) &&
                   alice_->knows(zed_->session->node_id()) &&
                   bob_->knows(alice_->session->node_id()) &&
                   zed_->knows(alice_->session->node_id());
        }));
    }

    void TearDown() override {
        for (Node* n : {alice_.get(), bob_.get(), zed_.get()}) {
            if (n) n->session->stop();
        }
    }

    std::unique_ptr<Node> make_node(const std::string& name) {
        auto n = std::make_unique<Node>();
        n->cfg     = test_config(dir_, name);
        n->iface   = std::make_shared<StaticInterfaceProvider>(loopback_iface());
        n->sink    = std::make_shared<RecordingSink>();
        n->session = std::make_unique<SessionCoordinator>(
            n->cfg, std::make_unique<HubTransport>(hub_, "127.0.0.1"), n->iface);
        n->session->add_sink(n->sink);
        n->session->start();
        return n;
    }

    std::string make_source(const std::string& name, size_t size, u32 seed) {
        std::string path = dir_.str("src/" + name);
        write_file(path, make_bytes(size, seed));
        return path;
    }

    u64 wait_offer(Node& n) {
        wait_until([&] { return !n.sink->offers().empty(); });
        auto offers = n.sink->offers();
        return offers.empty() ? 0 : offers.back().job_id;
    }

    TempDir dir_;
    std::shared_ptr<DatagramHub> hub_;
    std::unique_ptr<Node> alice_;
    std::unique_ptr<Node> bob_;
    std::unique_ptr<Node> zed_;
};

} // namespace

TEST_F(SessionCoordinatorTest, PeersCarryNameAndTransferPort) {
    std::vector<Peer> peers = alice_->session->peers();
    ASSERT_EQ(peers.size(), 2u);
    for (auto& p : peers) {
        EXPECT_NE(p.node_id, alice_->session->node_id());
        EXPECT_EQ(p.ip, "127.0.0.1");
        EXPECT_NE(p.transfer_port, 0);
        EXPECT_EQ(p.protocol_version, LANLINK_VERSION);
        if (p.node_id == bob_->session->node_id()) {
            EXPECT_EQ(p.name, "bob");
            EXPECT_EQ(p.transfer_port, bob_->session->transfer_port());
        }
    }
    EXPECT_GE(peers[0].last_seen_ms, peers[1].last_seen_ms);
}

TEST_F(SessionCoordinatorTest, ChatArrivesOnceDespiteDuplicates) {
    alice_->session->send_chat("hello");
    ASSERT_TRUE(wait_until([&] { return !bob_->sink->chats().empty(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(bob_->sink->chats(), (std::vector<std::string>{"alice: hello"}));
    EXPECT_EQ(zed_->sink->chats(), (std::vector<std::string>{"alice: hello"}));
    EXPECT_TRUE(alice_->sink->chats().empty());
}

TEST_F(SessionCoordinatorTest, SecureChannelIsPrivateToMembers) {
    auto created = alice_->session->create_channel("482913");
    JoinResult r = bob_->session->join_channel("482913");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.channel_id, created.first);

    alice_->session->send_secure(created.first, "secret");
    ASSERT_TRUE(wait_until([&] { return !bob_->sink->secure().empty(); }));
    EXPECT_EQ(bob_->sink->secure().front(), "secret");

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_TRUE(zed_->sink->secure().empty());
    EXPECT_TRUE(zed_->session->channels().empty());

    ASSERT_TRUE(wait_until([&] {
        auto chans = alice_->session->channels();
        return chans.size() == 1 && chans[0].members.size() == 2;
    }));

    // Closed channels leave the table
    alice_->session->close_channel(created.first);
    EXPECT_TRUE(wait_until([&] { return bob_->session->channels().empty(); }));
    EXPECT_TRUE(wait_until([&] { return alice_->session->channels().empty(); }));
}

TEST_F(SessionCoordinatorTest, FailedJoinIsNotified) {
    alice_->session->create_channel("482913");
    EXPECT_EQ(zed_->session->join_channel("000000").error, JoinError::NO_MATCH);
    EXPECT_TRUE(wait_until([&] { return zed_->sink->has_note("channel.join.no_match"); }));
}

TEST_F(SessionCoordinatorTest, BundleOfThreeFilesEndToEnd) {
    std::vector<std::string> files = {
        make_source("a.txt", 1000, 1),
        make_source("b.bin", 150000, 2),
        make_source("c.dat", 0, 3),
    };
    u64 id = alice_->session->offer_files(bob_->session->node_id(), files);
    ASSERT_EQ(wait_offer(*bob_), id);

    auto offer = bob_->sink->offers().back();
    EXPECT_TRUE(offer.bundled);
    EXPECT_EQ(offer.entries.size(), 3u);
    EXPECT_EQ(offer.peer_name, "alice");

    EXPECT_TRUE(bob_->session->accept_offer(id));
    ASSERT_TRUE(wait_until([&] { return bob_->sink->has_note("transfer.completed", id); }, 10000));
    ASSERT_TRUE(wait_until([&] { return alice_->sink->has_note("transfer.completed", id); }, 10000));

    fs::path down(bob_->cfg.download_dir);
    EXPECT_EQ(read_file(down / "a.txt"), make_bytes(1000, 1));
    EXPECT_EQ(read_file(down / "b.bin"), make_bytes(150000, 2));
    EXPECT_TRUE(fs::exists(down / "c.dat"));

    EXPECT_TRUE(alice_->session->jobs().empty());
    EXPECT_TRUE(bob_->session->jobs().empty());
}

TEST_F(SessionCoordinatorTest, RejectedOfferIsNotifiedToSender) {
    u64 id = alice_->session->offer_files(zed_->session->node_id(), {make_source("x.bin", 10, 4)});
    ASSERT_EQ(wait_offer(*zed_), id);
    EXPECT_EQ(zed_->session->jobs().size(), 1u);

    EXPECT_TRUE(zed_->session->reject_offer(id));
    EXPECT_TRUE(wait_until([&] { return alice_->sink->has_note("transfer.rejected", id); }));
    EXPECT_TRUE(wait_until([&] { return zed_->sink->has_note("transfer.rejected", id); }));
    EXPECT_FALSE(fs::exists(fs::path(zed_->cfg.download_dir) / "x.bin"));
}

TEST_F(SessionCoordinatorTest, CancelledOfferIsNotifiedToBoth) {
    u64 id = alice_->session->offer_files(bob_->session->node_id(), {make_source("y.bin", 10, 5)});
    ASSERT_EQ(wait_offer(*bob_), id);

    EXPECT_TRUE(alice_->session->cancel_transfer(id));
    EXPECT_TRUE(wait_until([&] { return alice_->sink->has_note("transfer.cancelled", id); }));
    EXPECT_TRUE(wait_until([&] { return bob_->sink->has_note("transfer.cancelled", id); }));
}

TEST_F(SessionCoordinatorTest, OfferToUnknownPeerThrows) {
    EXPECT_THROW(alice_->session->offer_files(0x1234, {make_source("z.bin", 1, 6)}),
                 std::invalid_argument);
}

TEST_F(SessionCoordinatorTest, SilentPeerExpires) {
    u64 zed_id = zed_->session->node_id();
    zed_->session->stop();
    EXPECT_TRUE(wait_until([&] { return !alice_->knows(zed_id); }, 6000));
    EXPECT_TRUE(alice_->knows(bob_->session->node_id()));
}

TEST_F(SessionCoordinatorTest, AnnouncingPeersOutliveTheTimeout) {
    std::this_thread::sleep_for(std::chrono::milliseconds(alice_->cfg.peer_timeout_ms + 700));
    EXPECT_TRUE(alice_->knows(bob_->session->node_id()));
    EXPECT_TRUE(alice_->knows(zed_->session->node_id()));
}

TEST_F(SessionCoordinatorTest, InterfaceChangeIsNotified) {
    InterfaceInfo moved = loopback_iface();
    moved.address = "127.0.0.2";
    alice_->iface->set(moved);
    EXPECT_TRUE(wait_until([&] { return alice_->sink->has_note("network.changed"); }));
    EXPECT_FALSE(bob_->sink->has_note("network.changed"));
}

TEST(NotificationKind, NamesEveryOutcome) {
    TransferJobInfo job;
    job.state = JobState::COMPLETED;
    EXPECT_EQ(notification_kind(job), "transfer.completed");
    job.state = JobState::FAILED;
    job.error = TransferError::CHECKSUM_MISMATCH;
    EXPECT_EQ(notification_kind(job), "transfer.failed.checksum_mismatch");
    job.error = TransferError::DISK_ERROR;
    EXPECT_EQ(notification_kind(job), "transfer.failed.disk_error");
    job.error = TransferError::CONNECTION_LOST;
    EXPECT_EQ(notification_kind(job), "transfer.failed.connection_lost");
    job.state = JobState::IN_PROGRESS;
    EXPECT_EQ(notification_kind(job), "");

    EXPECT_EQ(notification_kind(JoinError::LOCKED_OUT), "channel.join.locked_out");
    EXPECT_EQ(notification_kind(JoinError::CHANNEL_CLOSED), "channel.join.closed");
}
