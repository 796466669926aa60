#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include "recognition_queue.h"

static RecognitionQueue::Task delayed(const std::string &text, int ms) {
    return [text, ms]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return DecodedSpan{text, 1.f};
    };
}

TEST(RecognitionQueue, ResultsFollowSubmissionOrder) {
    RecognitionQueue queue(4);
    std::vector<RecognitionQueue::Task> tasks;
    // 先提交的更慢
    for (int i = 0; i < 8; ++i)
        tasks.push_back(delayed(std::to_string(i), (8 - i) * 5));
    auto results = queue.run_batch(std::move(tasks));
    ASSERT_EQ(results.size(), 8u);
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(results[i].text, std::to_string(i));
}

TEST(RecognitionQueue, FailedTaskBecomesEmptySpan) {
    RecognitionQueue queue(2);
    std::vector<RecognitionQueue::Task> tasks;
    tasks.push_back(delayed("A", 0));
    tasks.push_back([]() -> DecodedSpan { throw std::runtime_error("bad crop"); });
    tasks.push_back(delayed("C", 0));
    auto results = queue.run_batch(std::move(tasks));
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].text, "A");
    EXPECT_TRUE(results[1].text.empty());
    EXPECT_FLOAT_EQ(results[1].confidence, 0.f);
    EXPECT_EQ(results[2].text, "C");
}

TEST(RecognitionQueue, ReportsProgressPerTask) {
    RecognitionQueue queue(3);
    std::mutex m;
    std::vector<size_t> seen;
    size_t reported_total = 0;
    std::vector<RecognitionQueue::Task> tasks;
    for (int i = 0; i < 5; ++i)
        tasks.push_back(delayed("x", 1));
    queue.run_batch(std::move(tasks), [&](size_t done, size_t total) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back(done);
        reported_total = total;
    });
    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(seen.size(), 5u);
    std::sort(seen.begin(), seen.end());
    for (size_t i = 0; i < seen.size(); ++i)
        EXPECT_EQ(seen[i], i + 1);
    EXPECT_EQ(reported_total, 5u);
}

TEST(RecognitionQueue, CancelDropsPendingTasks) {
    RecognitionQueue queue(1);
    std::promise<void> started, release;
    std::shared_future<void> release_f = release.get_future().share();

    std::vector<RecognitionQueue::Task> tasks;
    tasks.push_back([&started, release_f]() {
        started.set_value();
        release_f.wait();
        return DecodedSpan{"first", 1.f};
    });
    tasks.push_back(delayed("second", 0));
    tasks.push_back(delayed("third", 0));

    auto futures = queue.submit(std::move(tasks));
    started.get_future().wait();
    EXPECT_EQ(queue.pending(), 2u);
    queue.cancel();
    EXPECT_EQ(queue.pending(), 0u);
    release.set_value();

    EXPECT_EQ(futures[0].get().text, "first");
    EXPECT_THROW(futures[1].get(), OcrCancelled);
    EXPECT_THROW(futures[2].get(), OcrCancelled);
}

TEST(RecognitionQueue, RunBatchPropagatesCancellation) {
    RecognitionQueue queue(1);
    std::promise<void> started, release;
    std::shared_future<void> release_f = release.get_future().share();

    std::vector<RecognitionQueue::Task> blocker;
    blocker.push_back([&started, release_f]() {
        started.set_value();
        release_f.wait();
        return DecodedSpan{"busy", 1.f};
    });
    auto busy = queue.submit(std::move(blocker));
    started.get_future().wait();

    std::vector<RecognitionQueue::Task> tasks;
    tasks.push_back(delayed("a", 0));
    auto pending = queue.submit(std::move(tasks));
    queue.cancel();
    release.set_value();

    EXPECT_EQ(busy[0].get().text, "busy");
    EXPECT_THROW(pending[0].get(), OcrCancelled);
}

TEST(RecognitionQueue, ZeroWorkersMeansOne) {
    RecognitionQueue queue(0);
    EXPECT_EQ(queue.worker_count(), 1u);
    std::vector<RecognitionQueue::Task> tasks;
    tasks.push_back(delayed("only", 0));
    EXPECT_EQ(queue.run_batch(std::move(tasks))[0].text, "only");
}
