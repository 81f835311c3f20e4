// ============================================================
// test_broadcast_engine.cpp -- Discovery, chat ordering, interface changes
// ============================================================

#include "../discovery/broadcast_engine.hpp"
#include "../common/codec.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

struct Recorder {
    std::mutex                    mutex;
    std::vector<DiscoveryFrame>   discoveries;
    std::vector<u8>               versions;
    std::vector<ChatMessageFrame> chats;
    std::vector<Frame>            channel_frames;
    std::vector<bool>             changes;  // now_up per change

    BroadcastCallbacks callbacks() {
        BroadcastCallbacks cb;
        cb.on_discovery = [this](const DiscoveryFrame& f, const std::string&, u8 version) {
            std::lock_guard<std::mutex> lk(mutex);
            discoveries.push_back(f);
            versions.push_back(version);
        };
        cb.on_chat = [this](const ChatMessageFrame& f) {
            std::lock_guard<std::mutex> lk(mutex);
            chats.push_back(f);
        };
        cb.on_channel_frame = [this](const Frame& f, const std::string&) {
            std::lock_guard<std::mutex> lk(mutex);
            channel_frames.push_back(f);
        };
        cb.on_network_changed = [this](const InterfaceInfo&, const InterfaceInfo&, bool up) {
            std::lock_guard<std::mutex> lk(mutex);
            changes.push_back(up);
        };
        return cb;
    }

    std::vector<u64> chat_seqs() {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<u64> out;
        for (auto& c : chats) out.push_back(c.seq);
        return out;
    }

    size_t chat_count() {
        std::lock_guard<std::mutex> lk(mutex);
        return chats.size();
    }

    bool saw_node(u64 id) {
        std::lock_guard<std::mutex> lk(mutex);
        for (auto& d : discoveries) {
            if (d.node_id == id) return true;
        }
        return false;
    }
};

class BroadcastEngineTest : public ::testing::Test {
protected:
    BroadcastEngineTest()
        : cfg_(test_config(dir_, "bcast"))
        , hub_(std::make_shared<DatagramHub>())
        , iface_(std::make_shared<StaticInterfaceProvider>(loopback_iface()))
    {}

    std::unique_ptr<BroadcastEngine> make_engine(u64 node_id, Recorder& rec) {
        auto e = std::make_unique<BroadcastEngine>(
            cfg_, node_id, std::make_unique<HubTransport>(hub_, "127.0.0.1"), iface_);
        e->set_callbacks(rec.callbacks());
        return e;
    }

    static std::vector<u8> chat_bytes(u64 sender, u64 seq, const std::string& text) {
        ChatMessageFrame f;
        f.sender_id = sender;
        f.seq = seq;
        f.text = text;
        return codec::encode(f);
    }

    TempDir   dir_;
    LanConfig cfg_;
    std::shared_ptr<DatagramHub>             hub_;
    std::shared_ptr<StaticInterfaceProvider> iface_;
};

} // namespace

TEST_F(BroadcastEngineTest, PeersDiscoverEachOther) {
    Recorder ra, rb;
    auto a = make_engine(0xA, ra);
    auto b = make_engine(0xB, rb);
    a->start();
    b->start();

    EXPECT_TRUE(wait_until([&] { return rb.saw_node(0xA) && ra.saw_node(0xB); }, 2000));
    EXPECT_FALSE(ra.saw_node(0xA));
    {
        std::lock_guard<std::mutex> lk(ra.mutex);
        EXPECT_FALSE(ra.versions.empty());
        for (u8 v : ra.versions) EXPECT_EQ(v, LANLINK_VERSION);
    }

    a->stop();
    b->stop();
}

TEST_F(BroadcastEngineTest, DuplicatedChatIsDeliveredOnce) {
    hub_->set_copies(2);
    Recorder ra, rb;
    auto a = make_engine(0xA, ra);
    auto b = make_engine(0xB, rb);
    a->start();
    b->start();

    EXPECT_EQ(a->send("hello"), 1u);
    EXPECT_EQ(a->send("again"), 2u);
    ASSERT_TRUE(wait_until([&] { return rb.chat_count() >= 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(rb.chat_seqs(), (std::vector<u64>{1, 2}));
    {
        std::lock_guard<std::mutex> lk(rb.mutex);
        EXPECT_EQ(rb.chats[0].text, "hello");
        EXPECT_EQ(rb.chats[0].sender_id, 0xAu);
    }
    EXPECT_EQ(ra.chat_count(), 0u);

    a->stop();
    b->stop();
}

TEST_F(BroadcastEngineTest, ChatSequenceToleratesGapsDropsStale) {
    Recorder rec;
    auto e = make_engine(0x1, rec);

    for (u64 seq : {1, 3, 2, 3, 5, 4}) {
        auto bytes = chat_bytes(0x77, seq, "m" + std::to_string(seq));
        e->on_receive(bytes.data(), bytes.size(), "10.0.0.7");
    }
    auto other = chat_bytes(0x88, 1, "other sender");
    e->on_receive(other.data(), other.size(), "10.0.0.8");

    EXPECT_EQ(rec.chat_seqs(), (std::vector<u64>{1, 3, 5, 1}));
}

TEST_F(BroadcastEngineTest, IgnoresOwnAndMalformedDatagrams) {
    Recorder rec;
    auto e = make_engine(0x1, rec);

    auto own = chat_bytes(0x1, 1, "mine");
    e->on_receive(own.data(), own.size(), "127.0.0.1");

    std::vector<u8> junk = {0x4C, 0x4E, 0x4B, 0x31, 0x01, 0x02, 0x00};
    EXPECT_NO_THROW(e->on_receive(junk.data(), junk.size(), "10.0.0.9"));

    auto transfer = codec::encode(TransferCancelFrame{5});
    e->on_receive(transfer.data(), transfer.size(), "10.0.0.9");

    EXPECT_EQ(rec.chat_count(), 0u);
    EXPECT_TRUE(rec.channel_frames.empty());
}

TEST_F(BroadcastEngineTest, ForwardsChannelFrames) {
    Recorder rec;
    auto e = make_engine(0x1, rec);

    ChannelHandshakeFrame h;
    h.kind = HandshakeKind::HK_JOIN_REQUEST;
    h.sender_id = 0x2;
    auto hb = codec::encode(h);
    e->on_receive(hb.data(), hb.size(), "10.0.0.2");

    ChannelPayloadFrame p;
    p.sender_id = 0x2;
    p.sealed = std::vector<u8>(30, 1);
    auto pb = codec::encode(p);
    e->on_receive(pb.data(), pb.size(), "10.0.0.2");

    h.sender_id = 0x1;  // own request comes back through loopback
    hb = codec::encode(h);
    e->on_receive(hb.data(), hb.size(), "127.0.0.1");

    std::lock_guard<std::mutex> lk(rec.mutex);
    ASSERT_EQ(rec.channel_frames.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ChannelHandshakeFrame>(rec.channel_frames[0]));
    EXPECT_TRUE(std::holds_alternative<ChannelPayloadFrame>(rec.channel_frames[1]));
}

TEST_F(BroadcastEngineTest, OversizedChatKeepsSequence) {
    Recorder rec;
    auto e = make_engine(0x1, rec);
    e->check_interface();

    EXPECT_THROW(e->send(std::string(LANLINK_MAX_DATAGRAM, 'x')), std::invalid_argument);
    EXPECT_EQ(e->send("fits"), 1u);
}

TEST_F(BroadcastEngineTest, InterfaceChangeRebindsAndNotifiesOnce) {
    Recorder rec;
    auto e = make_engine(0x1, rec);

    // First interface is plain startup
    EXPECT_FALSE(e->check_interface());
    EXPECT_TRUE(e->has_interface());
    EXPECT_TRUE(rec.changes.empty());

    InterfaceInfo moved = loopback_iface();
    moved.address = "127.0.0.2";
    iface_->set(moved);
    EXPECT_TRUE(e->check_interface());
    EXPECT_FALSE(e->check_interface());
    EXPECT_EQ(e->current_interface().address, "127.0.0.2");

    iface_->set_down();
    EXPECT_TRUE(e->check_interface());
    EXPECT_FALSE(e->has_interface());
    EXPECT_FALSE(e->broadcast_frame(TransferCancelFrame{1}));

    iface_->set(moved);
    EXPECT_TRUE(e->check_interface());
    EXPECT_TRUE(e->has_interface());

    std::lock_guard<std::mutex> lk(rec.mutex);
    EXPECT_EQ(rec.changes, (std::vector<bool>{true, false, true}));
}

TEST_F(BroadcastEngineTest, ChatWithoutInterfaceIsNotSent) {
    iface_->set_down();
    Recorder ra, rb;
    auto a = make_engine(0xA, ra);
    auto b = make_engine(0xB, rb);
    a->start();
    b->start();

    EXPECT_EQ(a->send("lost"), 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(rb.chat_count(), 0u);

    a->stop();
    b->stop();
}
