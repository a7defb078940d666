#include "minerscan/core/Channel.hpp"
#include "support/TestSupport.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace minerscan;
using namespace std::chrono_literals;

static void testCloseDrainsBeforeEnd() {
    core::Channel<int> channel;
    channel.push(1);
    channel.push(2);
    channel.close();

    ASSERT_TRUE(!channel.push(3), "push after close refused");
    ASSERT_TRUE(channel.isClosed(), "closed");
    ASSERT_TRUE(!channel.isFinished(), "values still queued");
    ASSERT_EQ(channel.pop().value_or(-1), 1, "first");
    ASSERT_EQ(channel.pop().value_or(-1), 2, "second");
    ASSERT_TRUE(!channel.pop().has_value(), "end of stream");
    ASSERT_TRUE(channel.isFinished(), "finished");
}

static void testCapacityEvictsOldest() {
    core::Channel<int> channel(3);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(channel.push(i), "push never blocks");
    }
    ASSERT_EQ(channel.size(), std::size_t{3}, "bounded");
    ASSERT_EQ(channel.tryPop().value_or(-1), 7, "oldest kept value");
    ASSERT_EQ(channel.tryPop().value_or(-1), 8, "next");
    ASSERT_EQ(channel.tryPop().value_or(-1), 9, "latest");
    ASSERT_TRUE(!channel.tryPop().has_value(), "empty");
}

static void testPopForTimesOut() {
    core::Channel<int> channel;
    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(!channel.popFor(50ms).has_value(), "nothing arrived");
    ASSERT_TRUE(std::chrono::steady_clock::now() - started >= 45ms, "waited for the timeout");
    ASSERT_TRUE(!channel.isClosed(), "timeout does not close");
}

static void testCloseWakesBlockedReader() {
    core::Channel<int> channel;
    std::atomic<bool> returned{false};
    std::thread reader([&] {
        auto value = channel.pop();
        returned = !value.has_value();
    });
    std::this_thread::sleep_for(20ms);
    channel.close();
    reader.join();
    ASSERT_TRUE(returned.load(), "blocked pop returns end of stream on close");
}

static void testManyProducersOneConsumer() {
    constexpr int producers = 4;
    constexpr int perProducer = 500;
    core::Channel<int> channel;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&channel, p] {
            for (int i = 0; i < perProducer; ++i) {
                channel.push(p * perProducer + i);
            }
        });
    }

    long long sum = 0;
    int count = 0;
    std::thread consumer([&] {
        while (auto value = channel.pop()) {
            sum += *value;
            ++count;
        }
    });

    for (auto& t : threads) t.join();
    channel.close();
    consumer.join();

    const int total = producers * perProducer;
    ASSERT_EQ(count, total, "every value delivered once");
    ASSERT_EQ(sum, static_cast<long long>(total) * (total - 1) / 2, "no value lost or duplicated");
}

int main() {
    testCloseDrainsBeforeEnd();
    testCapacityEvictsOldest();
    testPopForTimesOut();
    testCloseWakesBlockedReader();
    testManyProducersOneConsumer();
    return testing::finishTests("Channel");
}
