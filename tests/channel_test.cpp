#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "utils/channel.hpp"
#include "test_utils.hpp"

using namespace blobdvm::utils;

class ChannelTest : public ::testing::Test {
protected:
    Channel<int> channel;

    static void SetUpTestSuite() {
        init_logging();
    }
};

// Basic functionality tests
TEST_F(ChannelTest, InitialState) {
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_FALSE(channel.closed());
}

TEST_F(ChannelTest, SingleProduceConsume) {
    EXPECT_TRUE(channel.produce(42));
    EXPECT_FALSE(channel.empty());
    EXPECT_EQ(channel.size(), 1u);

    int value = 0;
    EXPECT_TRUE(channel.consume(value));
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(channel.empty());
}

TEST_F(ChannelTest, ConsumeFromEmptyChannel) {
    int value = 7;
    EXPECT_FALSE(channel.consume(value));
    EXPECT_EQ(value, 7);
}

// Items come out in the order they went in
TEST_F(ChannelTest, FifoOrder) {
    for (int i = 0; i < 10; ++i) {
        channel.produce(i);
    }
    for (int i = 0; i < 10; ++i) {
        int value = -1;
        ASSERT_TRUE(channel.consume(value));
        EXPECT_EQ(value, i);
    }
}

TEST_F(ChannelTest, ConsumeForTimesOutWhenEmpty) {
    int value = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.consume_for(value, std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
}

TEST_F(ChannelTest, ConsumeForWakesOnProduce) {
    std::thread producer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.produce(5);
    });

    int value = 0;
    EXPECT_TRUE(channel.consume_for(value, std::chrono::seconds(5)));
    EXPECT_EQ(value, 5);
    producer.join();
}

// Closing wakes blocked consumers but keeps queued items drainable
TEST_F(ChannelTest, CloseWakesConsumerAndRejectsProduce) {
    channel.produce(1);
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.produce(2));

    int value = 0;
    EXPECT_TRUE(channel.consume_for(value, std::chrono::seconds(5)));
    EXPECT_EQ(value, 1);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.consume_for(value, std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(ChannelTest, CloseUnblocksWaitingConsumer) {
    std::atomic<bool> returned{false};
    std::thread consumer([this, &returned] {
        int value = 0;
        channel.consume_for(value, std::chrono::seconds(10));
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST_F(ChannelTest, MoveOnlyItems) {
    Channel<std::unique_ptr<std::string>> owned;
    owned.produce(std::make_unique<std::string>("payload"));

    std::unique_ptr<std::string> item;
    ASSERT_TRUE(owned.consume(item));
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(*item, "payload");
}

// Multi-threaded tests
TEST_F(ChannelTest, ConcurrentProducersSingleConsumer) {
    const int producers = 4;
    const int per_producer = 500;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([this, p] {
            for (int i = 0; i < per_producer; ++i) {
                channel.produce(p * per_producer + i);
            }
        });
    }

    std::vector<bool> seen(producers * per_producer, false);
    int received = 0;
    while (received < producers * per_producer) {
        int value = 0;
        if (channel.consume_for(value, std::chrono::seconds(5))) {
            ASSERT_FALSE(seen[value]);
            seen[value] = true;
            ++received;
        } else {
            FAIL() << "Timed out after " << received << " items";
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_TRUE(channel.empty());
}
