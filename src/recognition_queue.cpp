#include "recognition_queue.h"
#include <iostream>

RecognitionQueue::RecognitionQueue(size_t workers) {
    if (workers == 0)
        workers = 1;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        workers_.emplace_back([this] { worker_loop(); });
}

RecognitionQueue::~RecognitionQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cond_.notify_all();
    for (auto &t: workers_) {
        if (t.joinable())
            t.join();
    }
}

void RecognitionQueue::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty())
                return;
            job = std::move(jobs_.front());
            jobs_.pop();
        }

        DecodedSpan span;
        try {
            span = job.task();
        } catch (const std::exception &e) {
            // 单个框失败不影响整页：降级为置信度 0 的空结果
            std::cerr << "[WARN] region decode failed: " << e.what() << "\n";
            span = DecodedSpan{};
        }

        const size_t done = ++job.batch->done;
        if (job.batch->progress) {
            try {
                job.batch->progress(done, job.batch->total);
            } catch (const std::exception &e) {
                std::cerr << "[WARN] progress callback threw: " << e.what() << "\n";
            }
        }
        job.promise.set_value(std::move(span));
    }
}

std::vector<std::future<DecodedSpan>> RecognitionQueue::submit(std::vector<Task> tasks, ProgressCallback progress) {
    auto batch = std::make_shared<Batch>();
    batch->total = tasks.size();
    batch->progress = std::move(progress);

    std::vector<std::future<DecodedSpan>> futures;
    futures.reserve(tasks.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_)
            throw std::runtime_error("RecognitionQueue: submit after shutdown");
        for (auto &task: tasks) {
            Job job;
            job.task = std::move(task);
            job.batch = batch;
            futures.push_back(job.promise.get_future());
            jobs_.push(std::move(job));
        }
    }
    cond_.notify_all();

#ifndef NDEBUG
    std::cout << "[REC] submitted=" << futures.size() << " workers=" << workers_.size() << "\n";
#endif
    return futures;
}

std::vector<DecodedSpan> RecognitionQueue::run_batch(std::vector<Task> tasks, ProgressCallback progress) {
    auto futures = submit(std::move(tasks), std::move(progress));
    std::vector<DecodedSpan> results;
    results.reserve(futures.size());
    for (auto &f: futures)
        results.push_back(f.get());
    return results;
}

void RecognitionQueue::cancel() {
    std::queue<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(dropped, jobs_);
    }
#ifndef NDEBUG
    std::cout << "[REC] cancelled=" << dropped.size() << "\n";
#endif
    while (!dropped.empty()) {
        dropped.front().promise.set_exception(std::make_exception_ptr(OcrCancelled()));
        dropped.pop();
    }
}

size_t RecognitionQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}
