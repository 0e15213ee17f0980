#include <gtest/gtest.h>
#include <ThreadSafeQueue.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

namespace {

class RecordingCommand : public ICommand {
public:
    RecordingCommand(int id, std::vector<int>& log) : id_(id), log_(log) {}

    void execute() override { log_.push_back(id_); }
    std::string name() const override { return "record " + std::to_string(id_); }

private:
    int id_;
    std::vector<int>& log_;
};

} // namespace

TEST(ThreadSafeQueueTest, FifoOrder) {
    ThreadSafeQueue queue;
    std::vector<int> log;

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(queue.push(std::make_shared<RecordingCommand>(i, log)));
    }
    EXPECT_EQ(queue.size(), 5u);

    for (int i = 0; i < 5; ++i) {
        queue.pop()->execute();
    }
    EXPECT_EQ(log, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(queue.isEmpty());
}

TEST(ThreadSafeQueueTest, NullCommandRejected) {
    ThreadSafeQueue queue;
    EXPECT_FALSE(queue.push(nullptr));
    EXPECT_TRUE(queue.isEmpty());
}

TEST(ThreadSafeQueueTest, FullQueueRejectsUntilPopped) {
    ThreadSafeQueue queue(2);
    std::vector<int> log;

    EXPECT_EQ(queue.capacity(), 2u);
    EXPECT_TRUE(queue.push(std::make_shared<RecordingCommand>(1, log)));
    EXPECT_TRUE(queue.push(std::make_shared<RecordingCommand>(2, log)));
    EXPECT_FALSE(queue.push(std::make_shared<RecordingCommand>(3, log)));
    EXPECT_EQ(queue.size(), 2u);

    queue.pop()->execute();
    EXPECT_TRUE(queue.push(std::make_shared<RecordingCommand>(4, log)));

    queue.pop()->execute();
    queue.pop()->execute();
    EXPECT_EQ(log, (std::vector<int>{1, 2, 4}));
}

TEST(ThreadSafeQueueTest, ZeroCapacityIsUnbounded) {
    ThreadSafeQueue queue;
    std::vector<int> log;
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(queue.push(std::make_shared<RecordingCommand>(i, log)));
    }
    EXPECT_EQ(queue.size(), 1000u);
}

TEST(ThreadSafeQueueTest, ShutdownDrainsRemainingThenReturnsNull) {
    ThreadSafeQueue queue;
    std::vector<int> log;
    queue.push(std::make_shared<RecordingCommand>(1, log));
    queue.push(std::make_shared<RecordingCommand>(2, log));

    queue.shutdown();

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.push(std::make_shared<RecordingCommand>(3, log)));

    ASSERT_NE(queue.pop(), nullptr);
    ASSERT_NE(queue.pop(), nullptr);
    EXPECT_EQ(queue.pop(), nullptr);
}

TEST(ThreadSafeQueueTest, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        auto command = queue.pop();
        EXPECT_EQ(command, nullptr);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned);

    queue.shutdown();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST(ThreadSafeQueueTest, ProducersAndSingleConsumer) {
    ThreadSafeQueue queue;
    std::vector<int> log;
    const int PRODUCERS = 4;
    const int PER_PRODUCER = 250;

    std::thread consumer([&]() {
        while (auto command = queue.pop()) {
            command->execute();
        }
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&, p]() {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                queue.push(std::make_shared<RecordingCommand>(p * PER_PRODUCER + i, log));
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    queue.shutdown();
    consumer.join();

    EXPECT_EQ(log.size(), static_cast<size_t>(PRODUCERS * PER_PRODUCER));
}
