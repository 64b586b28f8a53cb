#include <gtest/gtest.h>
#include <codegraph/concurrency/bounded_channel.h>

#include <thread>
#include <vector>

using codegraph::concurrency::BoundedChannel;

TEST(BoundedChannelTest, TryPushFailsWhenFull) {
    BoundedChannel<int> ch(2);
    EXPECT_EQ(ch.capacity(), 2u);
    EXPECT_TRUE(ch.try_push(1));
    EXPECT_TRUE(ch.try_push(2));
    EXPECT_FALSE(ch.try_push(3));

    int v = 0;
    ASSERT_TRUE(ch.try_pop(v));
    EXPECT_EQ(v, 1);
    EXPECT_TRUE(ch.try_push(3));
}

TEST(BoundedChannelTest, PopDrainsAfterClose) {
    BoundedChannel<int> ch(4);
    ASSERT_TRUE(ch.push(7));
    ch.close();
    EXPECT_FALSE(ch.push(8));

    auto first = ch.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 7);
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(BoundedChannelTest, ProducersBlockUntilConsumerCatchesUp) {
    BoundedChannel<int> ch(1);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 50;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&ch, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                ch.push(p * kPerProducer + i);
            }
        });
    }

    long sum = 0;
    for (int i = 0; i < kProducers * kPerProducer; ++i) {
        auto v = ch.pop();
        ASSERT_TRUE(v.has_value());
        sum += *v;
    }
    for (auto& t : producers)
        t.join();

    const long n = kProducers * kPerProducer;
    EXPECT_EQ(sum, n * (n - 1) / 2);
    EXPECT_TRUE(ch.empty());
}
