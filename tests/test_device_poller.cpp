#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/core/ScanSession.hpp"
#include "support/FakeDevices.hpp"
#include "support/TestSupport.hpp"

#include <memory>
#include <mutex>
#include <vector>

using namespace minerscan;
using namespace minerscan::poll;
using namespace minerscan::testing;
using namespace std::chrono_literals;

namespace {

class CountingRecorder : public Recorder {
public:
    explicit CountingRecorder(bool fail = false) : fail_(fail) {}

    expected<void> record(const device::DeviceRecord& snapshot) override {
        std::lock_guard lock(mutex_);
        records_.push_back(snapshot);
        if (fail_) {
            return unexpected(std::make_error_code(std::errc::io_error));
        }
        return {};
    }

    std::size_t count() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

private:
    const bool fail_;
    mutable std::mutex mutex_;
    std::vector<device::DeviceRecord> records_;
};

const char* kMac = "aa:bb:cc:00:00:42";

struct Fixture {
    std::shared_ptr<FakeIdentifier> identifier = std::make_shared<FakeIdentifier>();
    std::shared_ptr<registry::LiveDeviceRegistry> registry = std::make_shared<registry::LiveDeviceRegistry>();

    Fixture() {
        identifier->script(ip("10.0.70.42"), {{}, true, std::string(kMac)});
        auto first = identifier->identify(ip("10.0.70.42"), 100ms);
        ASSERT_TRUE(first.has_value(), "seed identification");
        if (first) registry->merge(*first);
    }

    PollerOptions options(std::chrono::milliseconds interval = kMinPollInterval) const {
        PollerOptions o;
        o.interval = interval;
        o.timeout = 100ms;
        return o;
    }
};

} // namespace

static void testScenarioFailuresKeepLastGoodRecord() {
    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options());

    ASSERT_TRUE(poller.pollOnce(), "first poll succeeds");
    const auto good = f.registry->get(kMac);
    ASSERT_TRUE(good.has_value(), "record present");

    f.identifier->setAnswers(ip("10.0.70.42"), false);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(!poller.pollOnce(), "failing poll");
    }
    ASSERT_EQ(poller.consecutiveFailures(), std::size_t{3}, "three consecutive failures");
    const auto after = f.registry->get(kMac);
    ASSERT_TRUE(good && after && *after == *good, "last successful record unmodified");
    ASSERT_EQ(f.registry->size(), std::size_t{1}, "device not removed");

    f.identifier->setAnswers(ip("10.0.70.42"), true);
    ASSERT_TRUE(poller.pollOnce(), "device back");
    ASSERT_EQ(poller.consecutiveFailures(), std::size_t{0}, "counter reset on success");
    ASSERT_EQ(poller.pollCount(), std::size_t{5}, "every poll counted");
    ASSERT_EQ(poller.successCount(), std::size_t{2}, "two successes");
    ASSERT_EQ(f.registry->historyOf(kMac).size(), std::size_t{3}, "seed plus two polls in history");
}

static void testLoopPollsImmediatelyAndStopsPromptly() {
    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options(60s));
    poller.start();
    poller.start(); // second start is a no-op
    ASSERT_TRUE(poller.isRunning(), "running");
    ASSERT_TRUE(waitUntil([&] { return poller.pollCount() >= 1; }), "first poll without waiting an interval");

    const auto before = std::chrono::steady_clock::now();
    poller.stop();
    const auto took = std::chrono::steady_clock::now() - before;
    ASSERT_TRUE(took < 2s, "stop wakes the sleeping loop");
    ASSERT_TRUE(!poller.isRunning(), "stopped");
    ASSERT_EQ(poller.pollCount(), std::size_t{1}, "one poll in a 60 s interval");

    poller.stop();
    ASSERT_TRUE(!poller.isRunning(), "stop is idempotent");

    poller.start();
    ASSERT_TRUE(waitUntil([&] { return poller.pollCount() >= 2; }), "restart polls again");
    poller.stop();
}

static void testRecorderSeesEverySuccess() {
    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options());
    auto recorder = std::make_shared<CountingRecorder>();
    poller.attachRecorder(recorder);

    poller.pollOnce();
    poller.pollOnce();
    f.identifier->setAnswers(ip("10.0.70.42"), false);
    poller.pollOnce();
    ASSERT_EQ(recorder->count(), std::size_t{2}, "failed polls are not recorded");

    f.identifier->setAnswers(ip("10.0.70.42"), true);
    poller.detachRecorder();
    poller.pollOnce();
    ASSERT_EQ(recorder->count(), std::size_t{2}, "detached recorder sees nothing");

    auto failing = std::make_shared<CountingRecorder>(true);
    poller.attachRecorder(failing);
    ASSERT_TRUE(poller.pollOnce(), "recorder errors do not fail the poll");
    ASSERT_EQ(poller.consecutiveFailures(), std::size_t{0}, "no failure counted");
}

static void testAddressTakenOverByAnotherDevice() {
    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options());
    f.identifier->script(ip("10.0.70.42"), {{}, true, std::string("aa:bb:cc:99:99:99")});
    ASSERT_TRUE(!poller.pollOnce(), "different device at the address");
    ASSERT_EQ(poller.consecutiveFailures(), std::size_t{1}, "counted as failure");
    ASSERT_TRUE(!f.registry->get("aa:bb:cc:99:99:99").has_value(), "stranger not merged");
}

static void testUnknownIdentityFails() {
    Fixture f;
    DevicePoller poller("aa:aa:aa:aa:aa:aa", f.identifier, f.registry, f.options());
    ASSERT_TRUE(!poller.pollOnce(), "unknown identity");
    ASSERT_EQ(poller.consecutiveFailures(), std::size_t{1}, "failure counted");
}

static void testIntervalIsClamped() {
    ASSERT_TRUE(clampPollInterval(1s) == kMinPollInterval, "raised to 5 s");
    ASSERT_TRUE(clampPollInterval(10min) == kMaxPollInterval, "lowered to 60 s");
    ASSERT_TRUE(clampPollInterval(10s) == 10s, "kept");

    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options(100ms));
    ASSERT_TRUE(poller.interval() == kMinPollInterval, "constructor clamps");
    poller.setInterval(30s);
    ASSERT_TRUE(poller.interval() == 30s, "setInterval");
}

static void testShorterIntervalReschedulesRunningLoop() {
    Fixture f;
    DevicePoller poller(kMac, f.identifier, f.registry, f.options(60s));
    poller.start();
    ASSERT_TRUE(waitUntil([&] { return poller.pollCount() >= 1; }), "first poll");

    std::this_thread::sleep_for(300ms);
    poller.setInterval(5s);
    ASSERT_TRUE(poller.interval() == 5s, "new interval stored");
    ASSERT_TRUE(waitUntil([&] { return poller.pollCount() >= 2; }, 7000ms),
                "second poll about 5 s after the first, not 60 s");
    poller.stop();
    ASSERT_EQ(poller.pollCount(), std::size_t{2}, "exactly one more poll");
}

static void testSessionManagesPollersAndCommands() {
    Fixture f;
    core::ScanSession session(f.identifier, nullptr, f.registry);

    auto missing = session.attachPoller("aa:aa:aa:aa:aa:aa");
    ASSERT_TRUE(!missing, "unknown identity cannot be polled");

    auto poller = session.attachPoller(kMac, 5s);
    ASSERT_TRUE(poller.has_value(), "poller attached");
    auto again = session.attachPoller(kMac, 20s);
    ASSERT_TRUE(again && poller && *again == *poller, "one poller per identity");
    ASSERT_TRUE(again && (*again)->interval() == 20s, "interval updated");
    ASSERT_EQ(session.polledIdentities().size(), std::size_t{1}, "one identity polled");
    if (poller) {
        ASSERT_TRUE(waitUntil([&] { return (*poller)->pollCount() >= 1; }), "session poller runs");
    }

    auto sent = session.sendCommand(kMac, device::Command::ToggleFaultLight);
    ASSERT_TRUE(sent.has_value(), "command forwarded");
    const auto commands = f.identifier->commands();
    ASSERT_EQ(commands.size(), std::size_t{1}, "sent once, never retried");
    if (!commands.empty()) {
        ASSERT_EQ(commands[0].first, ip("10.0.70.42"), "address resolved from registry");
    }
    auto unknown = session.sendCommand("10.9.9.9", device::Command::Stop);
    ASSERT_TRUE(!unknown && unknown.error() == CommandError::Unreachable, "unknown device unreachable");

    ASSERT_TRUE(session.openWebInterface(kMac), "web interface opened");
    ASSERT_EQ(f.identifier->opened().size(), std::size_t{1}, "through the identifier");

    ASSERT_TRUE(session.detachPoller(kMac), "detached");
    ASSERT_TRUE(!session.detachPoller(kMac), "already detached");
    ASSERT_TRUE(poller && !(*poller)->isRunning(), "detached poller stopped");
}

int main() {
    silenceInfoLogs();
    testScenarioFailuresKeepLastGoodRecord();
    testLoopPollsImmediatelyAndStopsPromptly();
    testRecorderSeesEverySuccess();
    testAddressTakenOverByAnotherDevice();
    testUnknownIdentityFails();
    testIntervalIsClamped();
    testShorterIntervalReschedulesRunningLoop();
    testSessionManagesPollersAndCommands();
    return finishTests("DevicePoller");
}
