#include <gtest/gtest.h>

#include "fake_link.hpp"
#include "logger.hpp"
#include "room_registry.hpp"

#include <atomic>
#include <random>
#include <thread>

using relaycp::JoinResult;
using relaycp::Member;
using relaycp::RegistryLimits;
using relaycp::RoomRegistry;

namespace {

Member member(const std::string& id, const std::shared_ptr<RecordingLink>& link) {
    return Member{id, id + "-label", link};
}

} // namespace

class RoomRegistryTest : public ::testing::Test {
protected:
    Logger logger_;
};

TEST_F(RoomRegistryTest, JoinDeliversJoinedThenPeersToEveryone) {
    RoomRegistry reg(RegistryLimits{}, logger_);
    auto a = std::make_shared<RecordingLink>();
    auto b = std::make_shared<RecordingLink>();

    auto room = reg.get_or_create_room("abc1");
    ASSERT_TRUE(room);
    ASSERT_EQ(reg.join(room, member("a", a)), JoinResult::JOINED);
    ASSERT_EQ(reg.join(room, member("b", b)), JoinResult::JOINED);

    auto am = a->messages();
    ASSERT_EQ(am.size(), 3u);
    EXPECT_EQ(am[0].kind, proto::Kind::JOINED);
    EXPECT_EQ(am[0].self_id, "a");
    EXPECT_EQ(am[0].mnemonic, "a-label");
    EXPECT_EQ(am[1].count, 1);
    EXPECT_EQ(am[2].count, 2);

    auto bm = b->messages();
    ASSERT_EQ(bm.size(), 2u);
    EXPECT_EQ(bm[0].kind, proto::Kind::JOINED);
    EXPECT_EQ(bm[1].kind, proto::Kind::PEERS);
    EXPECT_EQ(bm[1].count, 2);
    EXPECT_EQ(bm[1].peers, (std::vector<std::string>{"a", "b"}));
}

TEST_F(RoomRegistryTest, RoomExistsExactlyWhileItHasMembers) {
    RoomRegistry reg(RegistryLimits{}, logger_);
    auto a = std::make_shared<RecordingLink>();
    auto b = std::make_shared<RecordingLink>();

    auto room = reg.get_or_create_room("x");
    reg.join(room, member("a", a));
    reg.join(room, member("b", b));
    EXPECT_EQ(reg.member_count("x"), 2u);

    EXPECT_TRUE(reg.leave(room, "a", a.get()));
    EXPECT_EQ(reg.member_count("x"), 1u);
    EXPECT_EQ(reg.room_count(), 1u);

    auto notices = b->of_kind(proto::Kind::PEER_DISCONNECTED);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].peer_id, "a");
    EXPECT_EQ(notices[0].mnemonic, "a-label");
    auto peers = b->of_kind(proto::Kind::PEERS);
    ASSERT_FALSE(peers.empty());
    EXPECT_EQ(peers.back().count, 1);

    EXPECT_TRUE(reg.leave(room, "b", b.get()));
    EXPECT_FALSE(reg.member_count("x"));
    EXPECT_EQ(reg.room_count(), 0u);
}

TEST_F(RoomRegistryTest, RetiredRoomRejectsJoinAndIsReplaced) {
    RoomRegistry reg(RegistryLimits{}, logger_);
    auto a = std::make_shared<RecordingLink>();
    auto room = reg.get_or_create_room("r");
    reg.join(room, member("a", a));
    reg.leave(room, "a", a.get());

    EXPECT_EQ(reg.join(room, member("b", a)), JoinResult::ROOM_GONE);
    auto fresh = reg.get_or_create_room("r");
    EXPECT_NE(fresh, room);
    EXPECT_EQ(reg.join(fresh, member("b", a)), JoinResult::JOINED);
}

TEST_F(RoomRegistryTest, PeerCapRejectsNewIdsOnly) {
    RegistryLimits limits;
    limits.max_peers_per_room = 2;
    RoomRegistry reg(limits, logger_);
    auto a = std::make_shared<RecordingLink>();
    auto b = std::make_shared<RecordingLink>();
    auto c = std::make_shared<RecordingLink>();

    auto room = reg.get_or_create_room("r");
    reg.join(room, member("a", a));
    reg.join(room, member("b", b));
    EXPECT_EQ(reg.join(room, member("c", c)), JoinResult::ROOM_FULL);
    EXPECT_TRUE(c->messages().empty());

    // Same id reconnecting replaces the old membership.
    auto a2 = std::make_shared<RecordingLink>();
    EXPECT_EQ(reg.join(room, member("a", a2)), JoinResult::JOINED);
    EXPECT_EQ(room->size(), 2u);

    // The stale connection can neither leave nor forward for the new one.
    EXPECT_FALSE(reg.leave(room, "a", a.get()));
    auto msg = std::make_shared<const proto::Message>(proto::make_error("x"));
    EXPECT_FALSE(reg.forward(room, "a", a.get(), msg));
    EXPECT_TRUE(reg.forward(room, "a", a2.get(), msg));
    EXPECT_EQ(room->size(), 2u);
}

TEST_F(RoomRegistryTest, ForwardSkipsTheSender) {
    RoomRegistry reg(RegistryLimits{}, logger_);
    auto a = std::make_shared<RecordingLink>();
    auto b = std::make_shared<RecordingLink>();
    auto room = reg.get_or_create_room("r");
    reg.join(room, member("a", a));
    reg.join(room, member("b", b));
    a->clear();
    b->clear();

    proto::Message m;
    m.kind = proto::Kind::PUBKEY;
    m.pub = "key";
    ASSERT_TRUE(reg.forward(room, "a", a.get(), std::make_shared<const proto::Message>(m)));
    EXPECT_TRUE(a->messages().empty());
    ASSERT_EQ(b->messages().size(), 1u);
    EXPECT_EQ(b->messages()[0].pub, "key");
}

TEST_F(RoomRegistryTest, GlobalRoomCap) {
    RegistryLimits limits;
    limits.max_rooms = 2;
    RoomRegistry reg(limits, logger_);
    EXPECT_TRUE(reg.get_or_create_room("one"));
    EXPECT_TRUE(reg.get_or_create_room("two"));
    EXPECT_FALSE(reg.get_or_create_room("three"));
    EXPECT_TRUE(reg.get_or_create_room("one"));
}

TEST_F(RoomRegistryTest, SourceSlotsCountDistinctRooms) {
    RegistryLimits limits;
    limits.max_rooms_per_source = 2;
    RoomRegistry reg(limits, logger_);

    EXPECT_TRUE(reg.reserve_slot("10.0.0.1", "r1"));
    EXPECT_TRUE(reg.reserve_slot("10.0.0.1", "r2"));
    EXPECT_FALSE(reg.reserve_slot("10.0.0.1", "r3"));
    EXPECT_TRUE(reg.reserve_slot("10.0.0.1", "r1"));
    EXPECT_TRUE(reg.reserve_slot("10.0.0.2", "r3"));
    EXPECT_EQ(reg.source_room_count("10.0.0.1"), 2u);

    reg.release_slot("10.0.0.1", "r1");
    EXPECT_FALSE(reg.reserve_slot("10.0.0.1", "r3"));
    reg.release_slot("10.0.0.1", "r1");
    EXPECT_TRUE(reg.reserve_slot("10.0.0.1", "r3"));
}

TEST_F(RoomRegistryTest, ZeroLimitsMeanUnlimited) {
    RegistryLimits limits;
    limits.max_rooms = 0;
    limits.max_rooms_per_source = 0;
    limits.max_peers_per_room = 0;
    RoomRegistry reg(limits, logger_);
    auto link = std::make_shared<RecordingLink>();
    auto room = reg.get_or_create_room("big");
    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(reg.reserve_slot("src", "room" + std::to_string(i)));
        EXPECT_TRUE(reg.get_or_create_room("room" + std::to_string(i)));
        EXPECT_EQ(reg.join(room, member("p" + std::to_string(i), link)), JoinResult::JOINED);
    }
    EXPECT_EQ(room->size(), 50u);
}

TEST_F(RoomRegistryTest, ConcurrentChurnKeepsCountsConsistent) {
    RegistryLimits limits;
    limits.max_rooms = 0;
    limits.max_peers_per_room = 0;
    RoomRegistry reg(limits, logger_);

    constexpr int kThreads = 8;
    constexpr int kRounds = 300;
    std::vector<std::shared_ptr<RecordingLink>> links;
    for (int t = 0; t < kThreads; ++t) links.push_back(std::make_shared<RecordingLink>());

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t));
            const std::string id = "peer" + std::to_string(t);
            for (int i = 0; i < kRounds; ++i) {
                const std::string rid = "room" + std::to_string(rng() % 3);
                for (;;) {
                    auto room = reg.get_or_create_room(rid);
                    JoinResult r = reg.join(room, member(id, links[t]));
                    if (r == JoinResult::JOINED) {
                        reg.leave(room, id, links[t].get());
                        break;
                    }
                    ASSERT_EQ(r, JoinResult::ROOM_GONE);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(reg.room_count(), 0u);

    // Every peers broadcast reported the membership at that instant.
    for (const auto& link : links) {
        for (const auto& m : link->of_kind(proto::Kind::PEERS)) {
            EXPECT_EQ(static_cast<size_t>(m.count), m.peers.size());
            EXPECT_GE(m.count, 1);
            EXPECT_LE(m.count, kThreads);
        }
    }
}
