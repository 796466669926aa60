#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include "sequence_decoder.h"

// 被 cancel() 丢弃的任务，其 future 收到此异常
class OcrCancelled : public std::runtime_error {
public:
    OcrCancelled() : std::runtime_error("recognition cancelled") {}
};

// 逐框识别的线程池：每个任务一个 future，顺序与提交顺序一致
class RecognitionQueue {
public:
    using Task = std::function<DecodedSpan()>;
    using ProgressCallback = std::function<void(size_t done, size_t total)>;

    explicit RecognitionQueue(size_t workers);
    ~RecognitionQueue();

    RecognitionQueue(const RecognitionQueue &) = delete;
    RecognitionQueue &operator=(const RecognitionQueue &) = delete;

    // progress 在工作线程中调用，每完成一个任务一次
    std::vector<std::future<DecodedSpan>> submit(std::vector<Task> tasks, ProgressCallback progress = nullptr);

    // 按提交顺序等待；被取消时抛 OcrCancelled
    std::vector<DecodedSpan> run_batch(std::vector<Task> tasks, ProgressCallback progress = nullptr);

    // 丢弃所有排队中的任务；正在执行的任务照常完成
    void cancel();

    size_t worker_count() const { return workers_.size(); }
    size_t pending() const;

private:
    struct Batch {
        std::atomic<size_t> done{0};
        size_t total{0};
        ProgressCallback progress;
    };
    struct Job {
        Task task;
        std::promise<DecodedSpan> promise;
        std::shared_ptr<Batch> batch;
    };

    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<Job> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool stop_{false};
};
