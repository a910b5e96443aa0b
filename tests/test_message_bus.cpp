#include <gtest/gtest.h>

#include <thread>

#include "bus/message_bus.hpp"

using namespace compass::bus;

TEST(MessageBus, DrainPreservesPublishOrder) {
    MessageBus bus;
    bus.Publish(OutputPartial{1, "a"});
    bus.Publish(OutputPartial{1, "b"});
    bus.Publish(Finished{1, compass::models::StepStatus::Success, "/", {}});

    const auto messages = bus.Drain();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(std::get<OutputPartial>(messages[0]).text, "a");
    EXPECT_EQ(std::get<OutputPartial>(messages[1]).text, "b");
    EXPECT_TRUE(std::holds_alternative<Finished>(messages[2]));
    EXPECT_EQ(MessageIndex(messages[2]), 1u);
    EXPECT_TRUE(bus.Drain().empty());
}

TEST(MessageBus, TryConsumeTimesOutWhenEmpty) {
    MessageBus bus;
    ExecutionMessage msg;
    EXPECT_FALSE(bus.TryConsume(msg, std::chrono::milliseconds(20)));
}

TEST(MessageBus, TryConsumeWakesOnPublish) {
    MessageBus bus;
    std::thread producer([&bus] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bus.Publish(OutputPartial{7, "late"});
    });
    ExecutionMessage msg;
    EXPECT_TRUE(bus.TryConsume(msg, std::chrono::seconds(5)));
    producer.join();
    EXPECT_EQ(MessageIndex(msg), 7u);
}
