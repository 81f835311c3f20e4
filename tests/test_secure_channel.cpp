// ============================================================
// test_secure_channel.cpp -- PIN join, encryption, re-keying
// ============================================================

#include "../channel/secure_channel.hpp"
#include "../common/event_queue.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <map>

using namespace testing_support;

namespace {

// Carries every frame an engine sends to all other attached engines,
// on its own thread, and keeps a copy of everything seen on the wire.
class ChannelBus {
public:
    ChannelBus() : worker_([this] { run(); }) {}

    ~ChannelBus() {
        queue_.close();
        worker_.join();
    }

    void attach(SecureChannelEngine& engine) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            engines_.push_back(&engine);
        }
        ChannelCallbacks cb;
        cb.send_frame = [this, &engine](const Frame& f) {
            return queue_.push(std::make_pair(&engine, f));
        };
        cb.on_message = [this, &engine](const SecureMessage& m) {
            std::lock_guard<std::mutex> lk(mutex_);
            inbox_[&engine].push_back(m);
        };
        engine.set_callbacks(std::move(cb));
    }

    std::vector<SecureMessage> inbox(SecureChannelEngine& engine) {
        std::lock_guard<std::mutex> lk(mutex_);
        return inbox_[&engine];
    }

    std::vector<Frame> wire() {
        std::lock_guard<std::mutex> lk(mutex_);
        return wire_;
    }

    // Wait until the bus has been idle for a moment
    void settle() {
        wait_until([this] { return queue_.size() == 0; }, 2000);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

private:
    void run() {
        std::pair<SecureChannelEngine*, Frame> item;
        while (true) {
            if (!queue_.pop_for(item, 50)) {
                if (queue_.closed()) break;
                continue;
            }
            std::vector<SecureChannelEngine*> targets;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                wire_.push_back(item.second);
                targets = engines_;
            }
            for (SecureChannelEngine* e : targets) {
                if (e != item.first) e->on_frame(item.second);
            }
        }
    }

    std::mutex mutex_;
    std::vector<SecureChannelEngine*> engines_;
    std::map<SecureChannelEngine*, std::vector<SecureMessage>> inbox_;
    std::vector<Frame> wire_;

    EventQueue<std::pair<SecureChannelEngine*, Frame>> queue_;
    std::thread worker_;
};

class SecureChannelTest : public ::testing::Test {
protected:
    SecureChannelTest()
        : cfg_(test_config(dir_, "chan"))
        , quick_cfg_(quick(cfg_))
        , owner_(cfg_, 0xA1)
        , joiner_(cfg_, 0xB2)
        , outsider_(quick_cfg_, 0xC3)
        , guesser_(quick_cfg_, 0xD4)
    {
        bus_.attach(owner_);
        bus_.attach(joiner_);
        bus_.attach(outsider_);
        bus_.attach(guesser_);
    }

    // Expected-to-fail joins give up sooner
    static LanConfig quick(LanConfig c) {
        c.join_timeout_ms = 500;
        return c;
    }

    TempDir   dir_;
    LanConfig cfg_;
    LanConfig quick_cfg_;
    SecureChannelEngine owner_;
    SecureChannelEngine joiner_;
    SecureChannelEngine outsider_;
    SecureChannelEngine guesser_;
    ChannelBus bus_;  // declared last: stops delivering before the engines go
};

bool has_text(const std::vector<SecureMessage>& inbox, const std::string& text) {
    for (auto& m : inbox) {
        if (m.text == text) return true;
    }
    return false;
}

} // namespace

TEST_F(SecureChannelTest, JoinWithPinThenExchangeSecret) {
    auto created = owner_.create_channel("482913");
    EXPECT_EQ(created.second, "482913");

    JoinResult r = joiner_.join_channel("482913");
    ASSERT_TRUE(r.ok()) << join_error_name(r.error);
    EXPECT_EQ(r.channel_id, created.first);

    ChannelInfo info;
    ASSERT_TRUE(owner_.channel_info(created.first, info));
    EXPECT_EQ(info.state, ChannelState::ACTIVE);
    EXPECT_EQ(info.members.size(), 2u);

    owner_.send(created.first, "secret");
    ASSERT_TRUE(wait_until([&] { return has_text(bus_.inbox(joiner_), "secret"); }));

    bus_.settle();
    EXPECT_TRUE(bus_.inbox(outsider_).empty());

    // What the outsider saw on the wire never carries the plaintext
    const std::string plain = "secret";
    for (const Frame& f : bus_.wire()) {
        if (auto* p = std::get_if<ChannelPayloadFrame>(&f)) {
            auto it = std::search(p->sealed.begin(), p->sealed.end(), plain.begin(), plain.end());
            EXPECT_EQ(it, p->sealed.end());
        }
    }

    joiner_.send(r.channel_id, "reply");
    EXPECT_TRUE(wait_until([&] { return has_text(bus_.inbox(owner_), "reply"); }));
}

TEST_F(SecureChannelTest, WrongPinFindsNoChannelAndLocksOut) {
    owner_.create_channel("482913");

    EXPECT_EQ(guesser_.join_channel("000000").error, JoinError::NO_MATCH);
    EXPECT_EQ(guesser_.join_channel("111111").error, JoinError::NO_MATCH);
    EXPECT_EQ(guesser_.join_channel("222222").error, JoinError::NO_MATCH);

    // Even the right PIN is refused while locked
    EXPECT_EQ(guesser_.join_channel("482913").error, JoinError::LOCKED_OUT);

    std::this_thread::sleep_for(std::chrono::milliseconds(quick_cfg_.join_lockout_ms + 100));
    EXPECT_TRUE(guesser_.join_channel("482913").ok());
}

TEST_F(SecureChannelTest, MessagesDoNotCrossChannels) {
    auto first  = owner_.create_channel("1111");
    auto second = owner_.create_channel("2222");

    ASSERT_TRUE(joiner_.join_channel("1111").ok());

    owner_.send(second.first, "for-second-only");
    owner_.send(first.first, "for-first");
    ASSERT_TRUE(wait_until([&] { return has_text(bus_.inbox(joiner_), "for-first"); }));
    bus_.settle();
    EXPECT_FALSE(has_text(bus_.inbox(joiner_), "for-second-only"));

    // A payload labelled with the joined channel but sealed under another key
    ChannelPayloadFrame forged;
    for (const Frame& f : bus_.wire()) {
        if (auto* p = std::get_if<ChannelPayloadFrame>(&f)) {
            if (p->channel_id == second.first) forged = *p;
        }
    }
    ASSERT_EQ(forged.channel_id, second.first);
    forged.channel_id = first.first;
    forged.seq = 100;
    size_t before = bus_.inbox(joiner_).size();
    joiner_.on_frame(forged);
    EXPECT_EQ(bus_.inbox(joiner_).size(), before);
}

TEST_F(SecureChannelTest, RegeneratePinKeepsIdentityAndDropsOldKey) {
    auto created = owner_.create_channel("482913");
    ASSERT_TRUE(joiner_.join_channel("482913").ok());

    ChannelInfo before;
    ASSERT_TRUE(owner_.channel_info(created.first, before));

    std::string fresh = owner_.regenerate_pin(created.first);
    EXPECT_NE(fresh, "482913");

    ChannelInfo after;
    ASSERT_TRUE(owner_.channel_info(created.first, after));
    EXPECT_EQ(after.channel_id, before.channel_id);
    EXPECT_EQ(after.members, before.members);
    EXPECT_EQ(after.masked_pin, mask_pin(fresh));

    // The joiner still holds the old key: neither direction gets through
    joiner_.send(created.first, "old-key");
    owner_.send(created.first, "new-key");
    bus_.settle();
    EXPECT_FALSE(has_text(bus_.inbox(owner_), "old-key"));
    EXPECT_FALSE(has_text(bus_.inbox(joiner_), "new-key"));

    // The old PIN no longer opens the channel; the new one re-keys in place
    EXPECT_EQ(outsider_.join_channel("482913").error, JoinError::NO_MATCH);

    JoinResult again = joiner_.join_channel(fresh);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.channel_id, created.first);

    owner_.send(created.first, "after-rekey");
    EXPECT_TRUE(wait_until([&] { return has_text(bus_.inbox(joiner_), "after-rekey"); }));
}

TEST_F(SecureChannelTest, OwnerCloseReachesMembers) {
    auto created = owner_.create_channel("7777");
    ASSERT_TRUE(joiner_.join_channel("7777").ok());

    owner_.close_channel(created.first);
    ASSERT_TRUE(wait_until([&] {
        ChannelInfo info;
        return joiner_.channel_info(created.first, info) && info.state == ChannelState::CLOSED;
    }));

    EXPECT_THROW(owner_.send(created.first, "late"), std::runtime_error);
    EXPECT_NO_THROW(owner_.close_channel(created.first));

    EXPECT_EQ(outsider_.join_channel("7777").error, JoinError::NO_MATCH);
}

TEST_F(SecureChannelTest, MemberLeaveIsLocal) {
    auto created = owner_.create_channel("8888");
    ASSERT_TRUE(joiner_.join_channel("8888").ok());

    joiner_.close_channel(created.first);
    bus_.settle();

    ChannelInfo info;
    ASSERT_TRUE(owner_.channel_info(created.first, info));
    EXPECT_EQ(info.state, ChannelState::ACTIVE);
}

TEST_F(SecureChannelTest, RejoinedMemberIsHeardAgain) {
    auto created = owner_.create_channel("8888");
    ASSERT_TRUE(joiner_.join_channel("8888").ok());

    joiner_.send(created.first, "one");
    u64 before_leave = joiner_.send(created.first, "two");
    ASSERT_TRUE(wait_until([&] { return has_text(bus_.inbox(owner_), "two"); }));

    joiner_.close_channel(created.first);
    ASSERT_TRUE(joiner_.join_channel("8888").ok());

    EXPECT_GT(joiner_.send(created.first, "after rejoin"), before_leave);
    EXPECT_TRUE(wait_until([&] { return has_text(bus_.inbox(owner_), "after rejoin"); }));
}

TEST_F(SecureChannelTest, RejoinAfterShutdownContinuesSequence) {
    auto created = owner_.create_channel("8889");
    ASSERT_TRUE(joiner_.join_channel("8889").ok());
    u64 before = joiner_.send(created.first, "first life");
    ASSERT_TRUE(wait_until([&] { return has_text(bus_.inbox(owner_), "first life"); }));

    joiner_.shutdown();
    EXPECT_TRUE(joiner_.channels().empty());
    ASSERT_TRUE(joiner_.join_channel("8889").ok());

    EXPECT_GT(joiner_.send(created.first, "second life"), before);
    EXPECT_TRUE(wait_until([&] { return has_text(bus_.inbox(owner_), "second life"); }));
}

TEST_F(SecureChannelTest, ReplayedPayloadIsDeliveredOnce) {
    auto created = owner_.create_channel("4444");
    ASSERT_TRUE(joiner_.join_channel("4444").ok());

    owner_.send(created.first, "once");
    ASSERT_TRUE(wait_until([&] { return has_text(bus_.inbox(joiner_), "once"); }));
    bus_.settle();

    for (const Frame& f : bus_.wire()) {
        if (std::holds_alternative<ChannelPayloadFrame>(f)) joiner_.on_frame(f);
    }
    EXPECT_EQ(bus_.inbox(joiner_).size(), 1u);
}

TEST_F(SecureChannelTest, RejectsBadRequests) {
    EXPECT_THROW(owner_.create_channel("12"), std::invalid_argument);
    EXPECT_THROW(owner_.create_channel("12 34"), std::invalid_argument);
    EXPECT_THROW(owner_.send(12345, "x"), std::runtime_error);
    EXPECT_THROW(owner_.close_channel(12345), std::runtime_error);

    auto created = owner_.create_channel("5555");
    ASSERT_TRUE(joiner_.join_channel("5555").ok());
    EXPECT_THROW(joiner_.regenerate_pin(created.first), std::runtime_error);
    EXPECT_THROW(owner_.send(created.first, std::string(2000, 'x')), std::invalid_argument);
}

TEST_F(SecureChannelTest, RandomPinChannelAndMasking) {
    auto created = owner_.create_channel();
    EXPECT_EQ(created.second.size(), (size_t)cfg_.pin_digits);
    EXPECT_EQ(owner_.masked_pin(created.first), mask_pin(created.second));
    EXPECT_EQ(mask_pin("48291357"), "****1357");

    ChannelInfo info;
    ASSERT_TRUE(owner_.channel_info(created.first, info));
    EXPECT_EQ(info.state, ChannelState::CREATED);
    EXPECT_TRUE(info.owner);
}
