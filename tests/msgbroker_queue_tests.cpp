#include <gtest/gtest.h>

#include <msgbroker/channel.hpp>
#include <msgbroker/ingest_buffer.hpp>
#include <msgbroker/message_queue.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

using msgbroker::testing::make_message;

TEST(msgbroker_queue_tests, push_pop_fast_path) {
    msgbroker::MessageQueue<> q;

    q.push(make_message(42));
    EXPECT_EQ(q.size(), 1U);

    auto popped = q.pop();
    ASSERT_TRUE(popped);
    EXPECT_EQ((*popped)->id()[0], 42);

    EXPECT_FALSE(q.pop()); // queue now empty
    EXPECT_EQ(q.size(), 0U);
}

namespace {
struct tiny_cfg {
    static constexpr size_t fast_queue_size = 4; // <= 4 → overflow easier
};
} // anonymous namespace

TEST(msgbroker_queue_tests, push_pop_overflow) {
    msgbroker::MessageQueue<tiny_cfg> q;

    constexpr int N = 20; // 16 will overflow the 4-slot ring
    for (int i = 0; i < N; ++i) {
        q.push(make_message(static_cast<std::uint8_t>(i)));
    }
    EXPECT_EQ(q.size(), static_cast<size_t>(N));

    int cnt = 0;
    while (auto m = q.pop()) {
        EXPECT_EQ((*m)->id()[0], cnt++); // FIFO across fast+slow path
    }
    EXPECT_EQ(cnt, N);
}

TEST(msgbroker_queue_tests, interleaved_overflow_keeps_order) {
    msgbroker::MessageQueue<tiny_cfg> q;

    std::uint8_t next_in = 0;
    std::uint8_t next_out = 0;
    for (int round = 0; round < 10; ++round) {
        for (int i = 0; i < 7; ++i) {
            q.push(make_message(next_in++));
        }
        for (int i = 0; i < 3; ++i) {
            auto m = q.pop();
            ASSERT_TRUE(m);
            EXPECT_EQ((*m)->id()[0], next_out++);
        }
    }
    while (auto m = q.pop()) {
        EXPECT_EQ((*m)->id()[0], next_out++);
    }
    EXPECT_EQ(next_out, next_in);
}

TEST(msgbroker_queue_tests, destructor_frees_leftovers) {
    auto q = std::make_unique<msgbroker::MessageQueue<tiny_cfg>>();
    for (int i = 0; i < 10; ++i) {
        q->push(make_message(static_cast<std::uint8_t>(i)));
    }
    q.reset(); // must not leak (checked by sanitizers)
    SUCCEED();
}

TEST(msgbroker_queue_tests, multiple_producers_keep_per_producer_order) {
    msgbroker::MessageQueue<tiny_cfg> q;
    constexpr int producers = 4;
    constexpr int per_producer = 200;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&q, p] {
            for (int i = 0; i < per_producer; ++i) {
                msgbroker::MessageId id{};
                id[0] = static_cast<std::uint8_t>(p);
                id[1] = static_cast<std::uint8_t>(i >> 8);
                id[2] = static_cast<std::uint8_t>(i & 0xFF);
                q.push(std::make_unique<msgbroker::Message>(
                    id, msgbroker::Bytes{}));
            }
        });
    }

    std::vector<int> last(producers, -1);
    int received = 0;
    while (received < producers * per_producer) {
        auto m = q.pop();
        if (!m) {
            std::this_thread::yield();
            continue;
        }
        const auto& id = (*m)->id();
        const int seq = (id[1] << 8) | id[2];
        EXPECT_GT(seq, last[id[0]]);
        last[id[0]] = seq;
        ++received;
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_FALSE(q.pop());
}

TEST(msgbroker_channel_tests, queue_channel_delivers_in_order) {
    msgbroker::QueueChannel<> channel("orders", "c1");
    EXPECT_EQ(channel.name(), "c1");
    EXPECT_EQ(channel.topic_name(), "orders");

    channel.put_message(make_message(1));
    channel.put_message(make_message(2));
    EXPECT_EQ(channel.depth(), 2U);

    auto first = channel.pop();
    auto second = channel.pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ((*first)->id()[0], 1);
    EXPECT_EQ((*second)->id()[0], 2);
    EXPECT_FALSE(channel.pop());
}

TEST(msgbroker_channel_tests, queue_channel_close) {
    msgbroker::QueueChannel<> channel("orders", "c1");
    EXPECT_FALSE(channel.closed());

    channel.close();
    EXPECT_TRUE(channel.closed());
    EXPECT_THROW(channel.close(), msgbroker::channel_error);

    channel.put_message(make_message(1)); // dropped
    EXPECT_FALSE(channel.pop());
}

TEST(msgbroker_channel_tests, factory_creates_queue_channels) {
    auto factory = msgbroker::queue_channel_factory();
    auto channel = factory("orders", "audit");
    ASSERT_TRUE(channel);
    EXPECT_EQ(channel->name(), "audit");
    EXPECT_NE(dynamic_cast<msgbroker::QueueChannel<>*>(channel.get()), nullptr);
}

TEST(msgbroker_ingest_buffer_tests, bounded_fifo) {
    msgbroker::IngestBuffer buffer(2);
    std::stop_source stop;
    EXPECT_EQ(buffer.capacity(), 2U);

    EXPECT_TRUE(buffer.push(make_message(1), stop.get_token()));
    EXPECT_TRUE(buffer.push(make_message(2), stop.get_token()));
    EXPECT_EQ(buffer.size(), 2U);

    auto first = buffer.pop(stop.get_token());
    ASSERT_TRUE(first);
    EXPECT_EQ((*first)->id()[0], 1);
    EXPECT_EQ(buffer.size(), 1U);

    auto second = buffer.pop(stop.get_token());
    ASSERT_TRUE(second);
    EXPECT_EQ((*second)->id()[0], 2);
    EXPECT_EQ(buffer.size(), 0U);
}

TEST(msgbroker_ingest_buffer_tests, stop_releases_blocked_producer) {
    msgbroker::IngestBuffer buffer(1);
    std::stop_source stop;
    ASSERT_TRUE(buffer.push(make_message(1), stop.get_token()));

    std::atomic<bool> pushed{true};
    std::thread producer([&] {
        pushed = buffer.push(make_message(2), stop.get_token());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    producer.join();

    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(buffer.size(), 1U);
    EXPECT_FALSE(buffer.push(make_message(3), stop.get_token()));
}

TEST(msgbroker_ingest_buffer_tests, stop_releases_waiting_consumer) {
    msgbroker::IngestBuffer buffer(1);
    std::stop_source stop;

    std::atomic<bool> got{true};
    std::thread consumer(
        [&] { got = buffer.pop(stop.get_token()).has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    consumer.join();

    EXPECT_FALSE(got.load());
}
