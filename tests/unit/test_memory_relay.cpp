#include <gtest/gtest.h>
#include "../../src/relay/memory_relay.h"
#include "../../src/relay/relay_protocol.h"
#include "../../src/util.h"

#include <chrono>
#include <thread>

using namespace agentrun;
using namespace std::chrono_literals;

class MemoryRelayTest : public ::testing::Test {
protected:
    MemoryRelay relay{4};

    Json::Value fields(const std::string& content) {
        Json::Value f;
        f["type"] = "agent_output";
        f["data"]["content"] = content;
        return f;
    }
};

// ============================================================================
// Durable Channels
// ============================================================================

TEST_F(MemoryRelayTest, AppendAssignsIncreasingIdsPerChannel) {
    // Given: Appends on two channels
    uint64_t a1 = relay.append("run:r:output", fields("a"), 100);
    uint64_t a2 = relay.append("run:r:output", fields("b"), 100);
    uint64_t s1 = relay.append("run:r:status", fields("s"), 100);

    // Then: Ids count per channel from 1
    EXPECT_EQ(a1, 1u);
    EXPECT_EQ(a2, 2u);
    EXPECT_EQ(s1, 1u);
}

TEST_F(MemoryRelayTest, ReadReturnsEntriesAfterCursor) {
    for (int i = 0; i < 5; i++) relay.append("run:r:output", fields(std::to_string(i)), 100);

    // When: Reading after id 2
    RelayBatch batch = relay.read({{"run:r:output", 2}}, 0ms, 100);

    // Then: Entries 3..5 in order
    ASSERT_EQ(batch["run:r:output"].size(), 3u);
    EXPECT_EQ(batch["run:r:output"][0].id, 3u);
    EXPECT_EQ(batch["run:r:output"][0].fields["data"]["content"].asString(), "2");
    EXPECT_EQ(batch["run:r:output"][2].id, 5u);
}

TEST_F(MemoryRelayTest, ReadHonorsMaxCountAndSkipsUnknownChannels) {
    for (int i = 0; i < 5; i++) relay.append("run:r:output", fields("x"), 100);

    RelayBatch batch = relay.read({{"run:r:output", 0}, {"run:missing:output", 0}}, 0ms, 2);

    EXPECT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch["run:r:output"].size(), 2u);
}

TEST_F(MemoryRelayTest, RetentionKeepsNewestEntries) {
    // Given: A channel capped at 3 entries
    for (int i = 0; i < 10; i++) relay.append("run:r:log", fields(std::to_string(i)), 3);

    // Then: Only the newest three remain, ids unchanged
    EXPECT_EQ(relay.channel_length("run:r:log"), 3u);
    RelayBatch batch = relay.read({{"run:r:log", 0}}, 0ms, 100);
    ASSERT_EQ(batch["run:r:log"].size(), 3u);
    EXPECT_EQ(batch["run:r:log"][0].id, 8u);
}

TEST_F(MemoryRelayTest, TrimAndRemove) {
    for (int i = 0; i < 6; i++) relay.append("run:r:output", fields("x"), 100);

    relay.trim("run:r:output", 2);
    EXPECT_EQ(relay.channel_length("run:r:output"), 2u);

    relay.remove({"run:r:output", "run:r:never"});
    EXPECT_EQ(relay.channel_length("run:r:output"), 0u);
}

TEST_F(MemoryRelayTest, IdsKeepIncreasingAfterRemove) {
    // Given: A channel that was removed after three appends
    for (int i = 0; i < 3; i++) relay.append("run:r:status", fields("x"), 100);
    relay.remove({"run:r:status"});

    // When: A late writer appends again
    uint64_t late = relay.append("run:r:status", fields("late"), 100);

    // Then: The id continues past everything handed out before
    EXPECT_EQ(late, 4u);
    RelayBatch batch = relay.read({{"run:r:status", 3}}, 0ms, 100);
    ASSERT_EQ(batch["run:r:status"].size(), 1u);
    EXPECT_EQ(batch["run:r:status"][0].fields["data"]["content"].asString(), "late");
}

TEST_F(MemoryRelayTest, BlockingReadWakesOnAppend) {
    // Given: A reader blocked on an empty channel
    std::thread writer([this]() {
        std::this_thread::sleep_for(50ms);
        relay.append("run:r:status", fields("late"), 100);
    });

    // When: Reading with a long block
    auto start = std::chrono::steady_clock::now();
    RelayBatch batch = relay.read({{"run:r:status", 0}}, 5000ms, 10);
    writer.join();

    // Then: It returns as soon as the entry lands
    ASSERT_EQ(batch["run:r:status"].size(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(MemoryRelayTest, BlockingReadTimesOutEmpty) {
    RelayBatch batch = relay.read({{"run:r:status", 0}}, 50ms, 10);
    EXPECT_TRUE(batch.empty());
}

TEST_F(MemoryRelayTest, ShutdownReleasesBlockedReaders) {
    std::thread stopper([this]() {
        std::this_thread::sleep_for(50ms);
        relay.shutdown();
    });

    auto start = std::chrono::steady_clock::now();
    relay.read({{"run:r:status", 0}}, 10000ms, 10);
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

// ============================================================================
// Fan-out
// ============================================================================

TEST_F(MemoryRelayTest, PublishReachesEverySubscriber) {
    // Given: Two subscribers
    auto first = relay.subscribe("run:r:control");
    auto second = relay.subscribe("run:r:control");

    // When: Publishing
    size_t reached = relay.publish("run:r:control", "{\"control\":\"cancel\"}");

    // Then: Both receive it
    EXPECT_EQ(reached, 2u);
    std::string message;
    ASSERT_TRUE(first->next(message, 100ms));
    EXPECT_EQ(message, "{\"control\":\"cancel\"}");
    ASSERT_TRUE(second->next(message, 100ms));
}

TEST_F(MemoryRelayTest, PublishWithoutSubscribersIsDropped) {
    EXPECT_EQ(relay.publish("run:r:control", "lost"), 0u);

    auto late = relay.subscribe("run:r:control");
    std::string message;
    EXPECT_FALSE(late->next(message, 20ms));
}

TEST_F(MemoryRelayTest, FullSubscriberLosesOldestMessage) {
    // Given: A subscriber with capacity 4 that never reads
    auto sub = relay.subscribe("run:r:control");
    for (int i = 0; i < 6; i++) relay.publish("run:r:control", std::to_string(i));

    // Then: The newest four remain
    std::string message;
    ASSERT_TRUE(sub->next(message, 10ms));
    EXPECT_EQ(message, "2");
}

TEST_F(MemoryRelayTest, ClosedSubscriptionsAreForgotten) {
    {
        auto sub = relay.subscribe("run:r:control");
        EXPECT_EQ(relay.subscriber_count("run:r:control"), 1u);
    }
    EXPECT_EQ(relay.subscriber_count("run:r:control"), 0u);
    EXPECT_EQ(relay.publish("run:r:control", "x"), 0u);
}

// ============================================================================
// Wire Protocol
// ============================================================================

TEST(RelayProtocolTest, CursorAcceptsNumbersAndDigitStrings) {
    Json::Value json;
    ASSERT_TRUE(parse_json(R"({"run:1:output": 12, "run:1:log": "3"})", json));

    RelayCursor cursor = relay_protocol::cursor_from_json(json);

    EXPECT_EQ(cursor["run:1:output"], 12u);
    EXPECT_EQ(cursor["run:1:log"], 3u);
}

TEST(RelayProtocolTest, MalformedCursorsAreRejected) {
    Json::Value negative;
    ASSERT_TRUE(parse_json(R"({"run:1:output": -1})", negative));
    EXPECT_THROW(relay_protocol::cursor_from_json(negative), std::invalid_argument);

    Json::Value text;
    ASSERT_TRUE(parse_json(R"({"run:1:output": "12a"})", text));
    EXPECT_THROW(relay_protocol::cursor_from_json(text), std::invalid_argument);

    EXPECT_THROW(relay_protocol::cursor_from_json(Json::Value(Json::arrayValue)),
                 std::invalid_argument);
}

TEST(RelayProtocolTest, BatchKeepsIdsAndFields) {
    RelayBatch batch;
    Json::Value f;
    f["type"] = "agent_log";
    batch["run:1:log"].push_back(RelayEntry{41, f});

    RelayBatch back = relay_protocol::batch_from_json(relay_protocol::batch_to_json(batch));

    ASSERT_EQ(back["run:1:log"].size(), 1u);
    EXPECT_EQ(back["run:1:log"][0].id, 41u);
    EXPECT_EQ(back["run:1:log"][0].fields["type"].asString(), "agent_log");
}
