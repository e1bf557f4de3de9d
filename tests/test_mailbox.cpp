#include <gtest/gtest.h>
#include "mailbox.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace peerwire;

TEST(MailboxTest, FifoOrder) {
    Mailbox<int> box;
    box.push(1);
    box.push(2);
    box.push(3);

    EXPECT_EQ(box.size(), 3u);
    EXPECT_EQ(box.try_pop(), 1);
    EXPECT_EQ(box.pop(), 2);
    EXPECT_EQ(box.pop_for(std::chrono::milliseconds(10)), 3);
    EXPECT_FALSE(box.try_pop().has_value());
}

TEST(MailboxTest, PopForTimesOut) {
    Mailbox<int> box;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(box.pop_for(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(MailboxTest, CloseRefusesPushButDrains) {
    Mailbox<std::string> box;
    box.push("a");
    box.close();

    EXPECT_TRUE(box.is_closed());
    EXPECT_FALSE(box.push("b"));
    EXPECT_EQ(box.pop(), std::string("a"));
    EXPECT_FALSE(box.pop().has_value());
}

TEST(MailboxTest, CloseWakesBlockedConsumer) {
    Mailbox<int> box;
    std::atomic<bool> woke(false);

    std::thread consumer([&] {
        auto item = box.pop();
        EXPECT_FALSE(item.has_value());
        woke = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    box.close();
    consumer.join();
    EXPECT_TRUE(woke.load());
}

TEST(MailboxTest, MoveOnlyItems) {
    Mailbox<std::unique_ptr<int>> box;
    box.push(std::make_unique<int>(7));

    auto items = box.drain();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(*items[0], 7);
    EXPECT_EQ(box.size(), 0u);
}

TEST(MailboxTest, ManyProducers) {
    Mailbox<int> box;
    const int producers = 4;
    const int per_producer = 1000;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&box, p] {
            for (int i = 0; i < per_producer; ++i) {
                box.push(p * per_producer + i);
            }
        });
    }

    long long sum = 0;
    for (int received = 0; received < producers * per_producer; ++received) {
        auto item = box.pop();
        ASSERT_TRUE(item.has_value());
        sum += *item;
    }

    for (auto& t : threads) {
        t.join();
    }

    long long n = producers * per_producer;
    EXPECT_EQ(sum, n * (n - 1) / 2);
}
