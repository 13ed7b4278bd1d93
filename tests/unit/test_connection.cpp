#include <gtest/gtest.h>
#include "../../src/delivery/connection.h"
#include "../../src/delivery/connection_registry.h"
#include "../../src/errors.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace agentrun;
using namespace std::chrono_literals;

namespace {

OutboundEvent relay_event(Channel channel, uint64_t id, const std::string& type = "agent_output") {
    OutboundEvent event;
    event.type = type;
    event.channel = channel;
    event.message_id = id;
    event.data["n"] = static_cast<Json::UInt64>(id);
    return event;
}

} // namespace

// ============================================================================
// Cursor Format
// ============================================================================

TEST(ChannelCursorTest, FormatsInFixedChannelOrder) {
    ChannelCursor cursor{{Channel::STATUS, 1}, {Channel::OUTPUT, 12}, {Channel::LOG, 3}};
    EXPECT_EQ(format_cursor(cursor), "output:12|log:3|status:1");
    EXPECT_EQ(format_cursor({{Channel::LOG, 9}}), "log:9");
    EXPECT_EQ(format_cursor({}), "");
}

TEST(ChannelCursorTest, ParsesAndSkipsGarbage) {
    // Given: A cursor with a bad part, an unknown channel and whitespace
    ChannelCursor cursor = parse_cursor("output:12| log : 3|control:4|status:x|status:2|junk");

    // Then: Only well-formed known channels survive
    EXPECT_EQ(cursor.size(), 3u);
    EXPECT_EQ(cursor[Channel::OUTPUT], 12u);
    EXPECT_EQ(cursor[Channel::LOG], 3u);
    EXPECT_EQ(cursor[Channel::STATUS], 2u);
    EXPECT_TRUE(parse_cursor("").empty());
    EXPECT_TRUE(parse_cursor("output:-1").empty());
}

// ============================================================================
// Connection Queue
// ============================================================================

TEST(ConnectionTest, QueuesInOrderAndTracksCursors) {
    // Given: A connection resuming after output id 2
    Connection conn("run_1", Transport::SSE, 10, {{Channel::OUTPUT, 2}});
    EXPECT_EQ(conn.id().rfind("conn_", 0), 0u);

    // When: Offering output 3 and status 1
    EXPECT_TRUE(conn.offer(relay_event(Channel::OUTPUT, 3)));
    EXPECT_TRUE(conn.offer(relay_event(Channel::STATUS, 1, "status_update")));

    // Then: Queued cursor advanced; delivered waits for the writer
    EXPECT_EQ(conn.queued_cursor()[Channel::OUTPUT], 3u);
    EXPECT_EQ(conn.last_delivered(Channel::OUTPUT), 2u);

    OutboundEvent event;
    ASSERT_TRUE(conn.take(event, 10ms));
    EXPECT_EQ(event.message_id, 3u);
    conn.mark_delivered(event);
    EXPECT_EQ(conn.last_delivered(Channel::OUTPUT), 3u);

    ASSERT_TRUE(conn.take(event, 10ms));
    EXPECT_EQ(event.type, "status_update");
    EXPECT_FALSE(conn.take(event, 10ms));
}

TEST(ConnectionTest, SkipsDuplicatesAndReplays) {
    Connection conn("run_1", Transport::WEBSOCKET, 10, {{Channel::OUTPUT, 5}});

    // Given: Events at or before the resume point, then one repeated
    conn.offer(relay_event(Channel::OUTPUT, 4));
    conn.offer(relay_event(Channel::OUTPUT, 5));
    conn.offer(relay_event(Channel::OUTPUT, 6));
    conn.offer(relay_event(Channel::OUTPUT, 6));

    // Then: Only id 6 is queued, once
    EXPECT_EQ(conn.queued(), 1u);
}

TEST(ConnectionTest, NoticesAreNeverDeduplicated) {
    Connection conn("run_1", Transport::SSE, 10);
    conn.offer(OutboundEvent::notice("heartbeat", Json::Value()));
    conn.offer(OutboundEvent::notice("heartbeat", Json::Value()));
    EXPECT_EQ(conn.queued(), 2u);

    OutboundEvent event;
    ASSERT_TRUE(conn.take(event, 10ms));
    EXPECT_FALSE(event.resumable());
}

TEST(ConnectionTest, FullQueueOverrunsAndCloses) {
    // Given: A connection with room for two events
    Connection conn("run_1", Transport::SSE, 2);
    conn.offer(relay_event(Channel::OUTPUT, 1));
    conn.offer(relay_event(Channel::OUTPUT, 2));

    // When: A third arrives before the writer drains
    EXPECT_THROW(conn.offer(relay_event(Channel::OUTPUT, 3)), ConnectionOverrun);

    // Then: The connection is closed and flagged, further offers refused
    EXPECT_TRUE(conn.overrun());
    EXPECT_TRUE(conn.closed());
    EXPECT_FALSE(conn.offer(relay_event(Channel::OUTPUT, 4)));
    OutboundEvent event;
    EXPECT_FALSE(conn.take(event, 10ms));
}

TEST(ConnectionTest, CloseWakesBlockedTake) {
    Connection conn("run_1", Transport::SSE, 10);
    std::thread closer([&conn]() {
        std::this_thread::sleep_for(30ms);
        conn.close();
    });

    auto start = std::chrono::steady_clock::now();
    OutboundEvent event;
    EXPECT_FALSE(conn.take(event, 5000ms));
    closer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(ConnectionTest, CloseAfterLetsQueueDrainFirst) {
    // Given: Queued events and a scheduled close
    Connection conn("run_1", Transport::SSE, 10);
    conn.offer(relay_event(Channel::STATUS, 1, "run_complete"));
    conn.close_after(100ms);

    // Then: Events are still taken during the grace period
    OutboundEvent event;
    EXPECT_TRUE(conn.take(event, 10ms));
    EXPECT_FALSE(conn.closed());

    // And: Once it expires the connection reports closed
    std::this_thread::sleep_for(150ms);
    EXPECT_TRUE(conn.closed());
    EXPECT_FALSE(conn.take(event, 10ms));
}

// ============================================================================
// Registry
// ============================================================================

TEST(ConnectionRegistryTest, CloseRunReachesOnlyTheRun) {
    ConnectionRegistry registry;
    auto a1 = std::make_shared<Connection>("run_a", Transport::SSE, 10);
    auto a2 = std::make_shared<Connection>("run_a", Transport::WEBSOCKET, 10);
    auto b1 = std::make_shared<Connection>("run_b", Transport::SSE, 10);
    registry.add(a1);
    registry.add(a2);
    registry.add(b1);
    EXPECT_EQ(registry.count("run_a"), 2u);
    EXPECT_EQ(registry.total(), 3u);

    EXPECT_EQ(registry.close_run("run_a", 0ms), 2u);
    EXPECT_TRUE(a1->closed());
    EXPECT_TRUE(a2->closed());
    EXPECT_FALSE(b1->closed());
}

TEST(ConnectionRegistryTest, RemoveAndCloseRun) {
    ConnectionRegistry registry;
    auto a1 = std::make_shared<Connection>("run_a", Transport::SSE, 10);
    auto a2 = std::make_shared<Connection>("run_a", Transport::SSE, 10);
    registry.add(a1);
    registry.add(a2);

    registry.remove(a1);
    registry.remove(a1);
    EXPECT_EQ(registry.count("run_a"), 1u);

    EXPECT_EQ(registry.close_run("run_a", 0ms), 1u);
    EXPECT_TRUE(a2->closed());
    EXPECT_EQ(registry.close_run("run_none", 0ms), 0u);

    registry.remove(a2);
    EXPECT_EQ(registry.total(), 0u);
}

TEST(ConnectionRegistryTest, CloseAllClosesEverything) {
    ConnectionRegistry registry;
    std::vector<std::shared_ptr<Connection>> conns;
    for (int i = 0; i < 20; i++) {
        conns.push_back(std::make_shared<Connection>("run_" + std::to_string(i), Transport::SSE, 10));
        registry.add(conns.back());
    }

    registry.close_all();

    for (const auto& conn : conns) {
        EXPECT_TRUE(conn->closed());
    }
}

TEST(ConnectionRegistryTest, ConcurrentAddRemoveAndClose) {
    ConnectionRegistry registry;
    std::atomic<bool> stop{false};

    std::thread closer([&]() {
        while (!stop) {
            registry.close_run("run_a", 0ms);
            registry.count("run_a");
        }
    });

    for (int i = 0; i < 200; i++) {
        auto conn = std::make_shared<Connection>("run_a", Transport::SSE, 10);
        registry.add(conn);
        registry.remove(conn);
    }
    stop = true;
    closer.join();

    EXPECT_EQ(registry.count("run_a"), 0u);
}
