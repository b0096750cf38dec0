#include <thread>
#include "gtest/gtest.h"
#include "server/broadcast.hpp"
#include "server/event_dispatcher.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server;
using namespace nlohmann;

TEST(BroadcastTest, DeliversToEverySubscriber) {
    subscriber_hub hub;
    auto a = hub.subscribe();
    auto b = hub.subscribe();
    EXPECT_EQ(hub.subscriber_count(), 2u);

    EXPECT_EQ(hub.broadcast({{"message", "hello"}}), 2u);
    EXPECT_EQ(a->pop(), (json{{"message", "hello"}}));
    EXPECT_EQ(b->pop(), (json{{"message", "hello"}}));
}

TEST(BroadcastTest, NoSubscribers) {
    subscriber_hub hub;
    EXPECT_EQ(hub.broadcast({{"message", "nobody"}}), 0u);
}

TEST(BroadcastTest, ClosedSubscriptionIsRemoved) {
    subscriber_hub hub;
    auto a = hub.subscribe();
    auto b = hub.subscribe();
    a->close();

    EXPECT_EQ(hub.broadcast({{"n", 1}}), 1u);
    EXPECT_EQ(hub.subscriber_count(), 1u);
    EXPECT_FALSE(a->pop());
    EXPECT_EQ(b->pop(), (json{{"n", 1}}));
}

TEST(BroadcastTest, LateSubscriberMissesEarlierMessages) {
    subscriber_hub hub;
    hub.broadcast({{"n", 1}});
    auto late = hub.subscribe();
    hub.broadcast({{"n", 2}});
    EXPECT_EQ(late->size(), 1u);
    EXPECT_EQ(late->pop(), (json{{"n", 2}}));
}

TEST(BroadcastTest, SerializesEventsFromDispatcher) {
    event_dispatcher dispatcher;
    subscriber_hub hub;
    auto sub = hub.subscribe();
    dispatcher.add_handler([&](const server_event &event) { hub(event); });
    dispatcher.start();

    dispatcher.publish(announcement{"judges", "Five minutes left", event_time()});
    dispatcher.publish(paused{"judges", event_time()});
    dispatcher.stop();

    auto first = sub->pop();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->at("kind"), "announcement");
    EXPECT_EQ(first->at("message"), "Five minutes left");
    auto second = sub->pop();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->at("kind"), "paused");
    EXPECT_EQ(second->at("paused_by"), "judges");
}

TEST(BroadcastTest, ConcurrentBroadcasts) {
    subscriber_hub hub;
    auto sub = hub.subscribe();
    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            for (int j = 0; j < 100; ++j) hub.broadcast({{"n", j}});
        });
    for (auto &t : threads) t.join();
    EXPECT_EQ(sub->size(), 800u);
}
