#include <gtest/gtest.h>
#include <assetsync/core/event_channel.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace assetsync;

TEST(EventChannelTest, DeliversInPublishOrder) {
    std::vector<std::size_t> seen;
    std::mutex m;
    {
        EventChannel channel([&](const ProgressEvent& ev) {
            std::lock_guard lock(m);
            seen.push_back(ev.completed);
        });
        for (std::size_t i = 0; i < 100; ++i) {
            ProgressEvent ev;
            ev.kind = EventKind::OverallProgress;
            ev.completed = i;
            channel.publish(ev);
        }
        channel.flush();
        EXPECT_EQ(channel.delivered(), 100u);
    }
    ASSERT_EQ(seen.size(), 100u);
    for (std::size_t i = 0; i < seen.size(); ++i)
        EXPECT_EQ(seen[i], i);
}

TEST(EventChannelTest, DeliversOnItsOwnThread) {
    std::thread::id listenerThread;
    EventChannel channel([&](const ProgressEvent&) { listenerThread = std::this_thread::get_id(); });
    channel.log("hello");
    channel.flush();
    EXPECT_NE(listenerThread, std::this_thread::get_id());
}

TEST(EventChannelTest, ConcurrentPublishersLoseNothing) {
    std::atomic<std::size_t> count{0};
    EventChannel channel([&](const ProgressEvent&) { ++count; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i)
                channel.log("x");
        });
    }
    for (auto& t : threads)
        t.join();
    channel.flush();
    EXPECT_EQ(count.load(), 2000u);
}

TEST(EventChannelTest, ListenerExceptionDoesNotStopDispatch) {
    std::atomic<int> delivered{0};
    EventChannel channel([&](const ProgressEvent& ev) {
        ++delivered;
        if (ev.message == "boom")
            throw std::runtime_error("listener failure");
    });
    channel.log("boom");
    channel.log("after");
    channel.flush();
    EXPECT_EQ(delivered.load(), 2);
}

TEST(EventChannelTest, PublishAfterCloseIsDropped) {
    std::atomic<int> delivered{0};
    EventChannel channel([&](const ProgressEvent&) { ++delivered; });
    channel.log("one");
    channel.close();
    channel.log("two");
    channel.flush();
    EXPECT_EQ(delivered.load(), 1);
}

TEST(EventChannelTest, KindTags) {
    EXPECT_EQ(toTag(EventKind::FileCompleted), "file_completed");
    EXPECT_EQ(toTag(EventKind::VerifyResult), "verify_result");
    EXPECT_EQ(toTag(EventKind::Finished), "finished");
}
