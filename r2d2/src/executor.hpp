#pragma once
#include "tasks.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

// Fixed pool of worker threads fed by a FIFO queue. Every accepted request
// resolves its future exactly once, with either a value or a TaskError, and
// carries the id it was submitted under. No ordering between ids.
//
// A caller may drop its future; the task still runs and the result is
// discarded. The destructor finishes queued work, then joins.
class Executor {
public:
    // 0 workers: std::thread::hardware_concurrency(), at least 1.
    explicit Executor(unsigned workers = 0);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Throws std::invalid_argument if `request_id` is still in flight.
    std::future<TaskResult> submit(uint64_t request_id, TaskType type, TaskPayload payload);

    // Allocates an id not currently in flight.
    std::future<TaskResult> submit(TaskType type, TaskPayload payload);

    size_t   in_flight() const;
    unsigned workers() const { return (unsigned)threads_.size(); }

private:
    struct Job {
        uint64_t    id;
        TaskType    type;
        TaskPayload payload;
    };

    std::future<TaskResult> enqueue_locked(uint64_t id, TaskType type, TaskPayload&& payload);
    void worker_main(unsigned index);
    static TaskResult execute(const Job& job);

    std::vector<std::thread>                             threads_;
    std::deque<Job>                                      queue_;
    std::unordered_map<uint64_t, std::promise<TaskResult>> pending_;
    mutable std::mutex                                   mu_;
    std::condition_variable                              cv_;
    bool                                                 stopping_ = false;
    uint64_t                                             next_id_ = 1;
};
